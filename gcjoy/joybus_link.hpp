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

#ifndef JOYBUS_LINK_H_
#define JOYBUS_LINK_H_

#include <stddef.h>
#include <stdint.h>

/** \file joybus_link.hpp
 * \brief The FIFO bridge between the signal codec and the protocol
 *
 * The codec and the protocol share nothing but the codec's two FIFOs. This
 * interface is everything the protocol may do with them, so the protocol runs
 * the same against the PIO (`pio_link`) and against a scripted codec in tests.
 */
class joybus_link {
 public:
  virtual ~joybus_link() = default;

  /// \brief `true` if the RX FIFO holds no symbols
  virtual bool rx_empty() = 0;

  /** \brief Pop one word from the RX FIFO
   *
   * \note Only call when `rx_empty()` is `false`
   */
  virtual uint32_t rx_get() = 0;

  /** \brief Check and clear the RX overflow flag
   *
   * \return `true` if the codec stalled on a full RX FIFO since the last call,
   * meaning symbols were lost
   */
  virtual bool rx_overflowed() = 0;

  /// \brief Throw away every symbol waiting in the RX FIFO
  virtual void discard_rx() = 0;

  /** \brief Hand a response to the codec
   *
   * Returns immediately; the words are fed to the TX FIFO in the background.
   *
   * \param words Words formatted by `tx_serialize`, must stay valid until
   * `transmit_done()`
   * \param length Number of words
   */
  virtual void transmit(const uint32_t *words, size_t length) = 0;

  /// \brief `true` once the last `transmit` is on the line and the codec listens again
  virtual bool transmit_done() = 0;

  /// \brief Free running microsecond clock
  virtual uint64_t now_us() = 0;
};

#endif  // JOYBUS_LINK_H_
