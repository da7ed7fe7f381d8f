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

#ifndef JOYBUS_TIMING_H_
#define JOYBUS_TIMING_H_

#include <stdint.h>

/** \file joybus_timing.hpp
 * \brief Joybus line timing and the codec's pulse classification
 *
 * The PIO program in joybus.pio is the codec that runs on the hardware. This
 * header holds the protocol constants it is built from and a reference model
 * of how it classifies a pulse, so the rest of the firmware (and the host
 * tests) can reason about line symbols without the PIO.
 *
 * A pulse is one falling edge followed by a rising edge: the line is held low
 * for `low_ns`, then released high for `high_ns` until the next falling edge.
 * A pulse followed by an idle line has `high_ns == LINE_IDLE`.
 *
 * The codec accepts a console pulse as a 1 if its low phase ends inside
 * [`ONE_WINDOW_START_NS`, `ONE_WINDOW_END_NS`) and as a 0 if it ends inside
 * [`ZERO_WINDOW_START_NS`, `ZERO_WINDOW_END_NS`). Anything else is noise. If no
 * new falling edge comes within `FRAME_END_NS` of the falling edge, the pulse
 * ended the frame: it was the stop bit if it read as a 1, noise if it read as
 * a 0.
 *
 * The windows are the ranges the codec always accepts. The codec sees a
 * falling edge up to `CODEC_EDGE_JITTER_NS` late, so a pulse that far outside
 * a window edge may be accepted too. The model only covers console pulses,
 * the codec never samples its own.
 */

/// \brief PIO cycles per microsecond the codec is clocked at
constexpr uint32_t CODEC_CYCLES_PER_US = 10;

/// \brief Console bit period, 200kHz
constexpr uint32_t CONSOLE_BIT_NS = 5000;

/// \brief Controller bit period, 250kHz
constexpr uint32_t CONTROLLER_BIT_NS = 4000;

/// \brief Console stop bit low phase
constexpr uint32_t CONSOLE_STOP_LOW_NS = 1000;

/// \brief Controller stop bit low phase
constexpr uint32_t CONTROLLER_STOP_LOW_NS = 2000;

/// \brief Shortest low phase read as a 1, anything shorter is a glitch
constexpr uint32_t ONE_WINDOW_START_NS = 800;

/// \brief End of the 1-bit window
constexpr uint32_t ONE_WINDOW_END_NS = 1700;

/// \brief Start of the 0-bit window
constexpr uint32_t ZERO_WINDOW_START_NS = 3300;

/// \brief End of the 0-bit window, a longer low phase is noise
constexpr uint32_t ZERO_WINDOW_END_NS = 4200;

/// \brief Time after a falling edge after which the line is considered idle
constexpr uint32_t FRAME_END_NS = 7000;

/// \brief Worst case delay in seeing a falling edge past the first possible
/// cycle
constexpr uint32_t CODEC_EDGE_JITTER_NS = 400;

/** \brief Allowed deviation of a console pulse's low phase from nominal
 *
 * Ten percent of the controller bit period. A console pulse whose low phase
 * is moved by up to this much, with the bit period unchanged, still classifies
 * to its own value. The windows leave a 50ns guard band on either side. The
 * console stop bit's shorter low phase is accepted down to
 * `ONE_WINDOW_START_NS`.
 */
constexpr uint32_t PULSE_TOLERANCE_NS = CONTROLLER_BIT_NS / 10;

/// \brief `high_ns` of a pulse after which the line stays released
constexpr uint32_t LINE_IDLE = UINT32_MAX;

/** \brief Symbol pushed by the codec into the RX FIFO for each pulse
 *
 * The high bit is the sampled line level, the low bit is 1 when another pulse
 * followed and 0 when the line went idle.
 */
enum class line_symbol : uint8_t {
  noise = 0b00,  ///< Glitch, or a 0 followed by an idle line
  zero = 0b01,   ///< Data bit 0
  stop = 0b10,   ///< Stop bit, end of frame
  one = 0b11,    ///< Data bit 1
};

/// \brief Low and high phase of one pulse
struct pulse {
  /// \brief Time the line is held low
  uint32_t low_ns;
  /// \brief Time the line is released before the next falling edge
  uint32_t high_ns;
};

/** \brief Nominal pulse the console sends for a symbol
 *
 * \param symbol `zero`, `one` or `stop`
 * \return Pulse with console timing, `{0, 0}` for `noise`
 */
pulse console_pulse(line_symbol symbol);

/** \brief Nominal pulse the codec drives for a symbol
 *
 * \param symbol `zero`, `one` or `stop`
 * \return Pulse with controller timing, `{0, 0}` for `noise`
 */
pulse controller_pulse(line_symbol symbol);

/** \brief Classify a pulse the way the codec does
 *
 * \param p Pulse as seen on the line
 * \return Symbol the codec pushes for it
 */
line_symbol classify_pulse(pulse p);

/** \brief Decode a word popped from the codec's RX FIFO
 *
 * \param word Autopushed ISR contents
 * \return Symbol carried by the word
 */
inline line_symbol decode_symbol(uint32_t word) {
  return static_cast<line_symbol>(word & 0b11);
}

/** \brief PIO clock divider that runs the codec at `CODEC_CYCLES_PER_US`
 *
 * \param sys_clock_hz System clock frequency
 * \return Divider to pass to `sm_config_set_clkdiv`
 */
float joybus_clock_divider(uint32_t sys_clock_hz);

#endif  // JOYBUS_TIMING_H_
