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

#include "joybus_timing.hpp"

pulse console_pulse(line_symbol symbol) {
  // 25% low, 50% low for 0 or high for 1, 25% high
  switch (symbol) {
    case line_symbol::zero:
      return {CONSOLE_BIT_NS * 3 / 4, CONSOLE_BIT_NS / 4};
    case line_symbol::one:
      return {CONSOLE_BIT_NS / 4, CONSOLE_BIT_NS * 3 / 4};
    case line_symbol::stop:
      return {CONSOLE_STOP_LOW_NS, LINE_IDLE};
    default:
      return {0, 0};
  }
}

pulse controller_pulse(line_symbol symbol) {
  switch (symbol) {
    case line_symbol::zero:
      return {CONTROLLER_BIT_NS * 3 / 4, CONTROLLER_BIT_NS / 4};
    case line_symbol::one:
      return {CONTROLLER_BIT_NS / 4, CONTROLLER_BIT_NS * 3 / 4};
    case line_symbol::stop:
      return {CONTROLLER_STOP_LOW_NS, LINE_IDLE};
    default:
      return {0, 0};
  }
}

line_symbol classify_pulse(pulse p) {
  if (p.low_ns < ONE_WINDOW_START_NS) {
    return line_symbol::noise;
  }

  bool one = p.low_ns < ONE_WINDOW_END_NS;
  if (!one &&
      (p.low_ns < ZERO_WINDOW_START_NS || p.low_ns >= ZERO_WINDOW_END_NS)) {
    return line_symbol::noise;
  }

  // low_ns is inside a window here, so well short of FRAME_END_NS
  if (p.high_ns == LINE_IDLE || p.high_ns >= FRAME_END_NS - p.low_ns) {
    return one ? line_symbol::stop : line_symbol::noise;
  }

  return one ? line_symbol::one : line_symbol::zero;
}

float joybus_clock_divider(uint32_t sys_clock_hz) {
  return static_cast<float>(sys_clock_hz) / (CODEC_CYCLES_PER_US * 1000000.0f);
}
