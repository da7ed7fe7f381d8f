/*
    Copyright 2023-2025 Zaden Ruggiero-Bouné

    This file is part of GCJoy.

    GCJoy is free software: you can redistribute it and/or modify it under
   the terms of the GNU General Public License as published by the Free Software
   Foundation, either version 3 of the License, or (at your option) any later
   version.

    GCJoy is distributed in the hope that it will be useful, but WITHOUT ANY
   WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
   A PARTICULAR PURPOSE. See the GNU General Public License for more details.

    You should have received a copy of the GNU General Public License along with
   GCJoy. If not, see http://www.gnu.org/licenses/.
*/

#ifndef PIO_LINK_H_
#define PIO_LINK_H_

#include "hardware/pio.h"
#include "joybus.hpp"
#include "joybus_link.hpp"

/** \file pio_link.hpp
 * \brief Joybus link backed by a PIO state machine and a DMA channel
 */

/** \brief Runs the signal codec on a PIO state machine
 *
 * Received symbols are read straight from the RX FIFO. Responses are fed to
 * the TX FIFO by DMA so the codec never runs dry mid-frame.
 */
class pio_link : public joybus_link {
 public:
  /** \brief Load the codec and start it listening on a pin
   *
   * Claims a free state machine on `pio` and a free DMA channel, panicking if
   * none is left.
   *
   * \param pio PIO block to load the codec into
   * \param pin Joybus data pin
   */
  pio_link(PIO pio, uint pin);

  pio_link(const pio_link &) = delete;
  pio_link &operator=(const pio_link &) = delete;

  /** \brief Service `protocol` from the RX FIFO not empty interrupt
   *
   * \param protocol Protocol to run, must outlive the link
   */
  void listen(joybus_protocol &protocol);

  bool rx_empty() override;
  uint32_t rx_get() override;
  bool rx_overflowed() override;
  void discard_rx() override;
  void transmit(const uint32_t *words, size_t length) override;
  bool transmit_done() override;
  uint64_t now_us() override;

 private:
  PIO pio_;
  uint sm_;
  uint offset_;
  uint dma_;
};

#endif  // PIO_LINK_H_
