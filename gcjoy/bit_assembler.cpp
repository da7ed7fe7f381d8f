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

#include "bit_assembler.hpp"

assembler_result rx_assembler::push(line_symbol symbol) {
  switch (symbol) {
    case line_symbol::zero:
    case line_symbol::one:
      shift_ = (shift_ << 1) | (symbol == line_symbol::one);
      if (++bit_count_ < 8) {
        return assembler_result::pending;
      }
      byte_ = shift_;
      reset();
      return assembler_result::byte_ready;
    case line_symbol::stop:
      if (bit_count_ != 0) {
        reset();
        return assembler_result::framing_error;
      }
      return assembler_result::frame_end;
    default:
      reset();
      return assembler_result::noise;
  }
}

void rx_assembler::reset() {
  shift_ = 0;
  bit_count_ = 0;
}

void tx_serialize(const uint8_t *bytes, size_t length, uint32_t *words) {
  for (size_t i = 0; i < length; ++i) {
    words[i] = tx_word(bytes[i], i == length - 1);
  }
}
