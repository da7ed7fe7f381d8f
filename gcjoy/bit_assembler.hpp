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

#ifndef BIT_ASSEMBLER_H_
#define BIT_ASSEMBLER_H_

#include <stddef.h>
#include <stdint.h>

#include "joybus_timing.hpp"

/** \file bit_assembler.hpp
 * \brief Conversion between codec symbols and bytes
 */

/// \brief Outcome of feeding one symbol to the receive assembler
enum class assembler_result {
  pending,        ///< Byte still incomplete
  byte_ready,     ///< Eighth bit received, byte available
  frame_end,      ///< Stop bit on a byte boundary
  framing_error,  ///< Stop bit mid-byte, partial byte discarded
  noise,          ///< Codec reported noise, partial byte discarded
};

/// \brief Collects received bits MSB first into bytes
class rx_assembler {
 public:
  /** \brief Feed the next symbol from the codec
   *
   * \param symbol Symbol popped from the RX FIFO
   * \return What the symbol completed, if anything
   */
  assembler_result push(line_symbol symbol);

  /// \brief Last completed byte
  uint8_t byte() const { return byte_; }

  /// \brief Number of bits collected toward the next byte
  uint8_t bit_count() const { return bit_count_; }

  /// \brief Drop any partial byte
  void reset();

 private:
  uint8_t shift_ = 0;
  uint8_t bit_count_ = 0;
  uint8_t byte_ = 0;
};

/// \brief Bit of a TX word that asks the codec for a stop bit after the byte
constexpr uint32_t TX_LAST_BYTE_FLAG = 1u << 23;

/** \brief Format one byte for the codec's TX FIFO
 *
 * The codec shifts out the top 9 bits: 8 data bits MSB first, then the flag
 * that ends the frame with a stop bit.
 *
 * \param byte Byte to send
 * \param last `true` if this is the final byte of the frame
 * \return Word for the TX FIFO
 */
constexpr uint32_t tx_word(uint8_t byte, bool last) {
  return (static_cast<uint32_t>(byte) << 24) | (last ? TX_LAST_BYTE_FLAG : 0);
}

/** \brief Format a whole response frame for the codec's TX FIFO
 *
 * \param bytes Response bytes
 * \param length Number of bytes, at least 1
 * \param words Output, `length` words
 */
void tx_serialize(const uint8_t *bytes, size_t length, uint32_t *words);

#endif  // BIT_ASSEMBLER_H_
