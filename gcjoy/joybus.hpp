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

#ifndef JOYBUS_H_
#define JOYBUS_H_

#include <stddef.h>
#include <stdint.h>

#include <array>

#include "bit_assembler.hpp"
#include "event_log.hpp"
#include "joybus_link.hpp"
#include "state.hpp"

/** \file joybus.hpp
 * \brief Joybus protocol implementation, controller side
 *
 * <details>
 * <summary>Joybus protocol description</summary>
 *
 * <h2>Electrical Details</h2>
 *
 * The data line is open collector at 3.3V: pulled up, driven low by either
 * side, never by both at once.
 *
 * * Console transmits 5µs bits, controller transmits 4µs bits
 * * A bit is 25% low, 50% low for 0 or high for 1, 25% high
 * * Console stop bit: 1µs low, then released
 * * Controller stop bit: 2µs low, then released
 *
 * <h2>Protocol</h2>
 *
 * 1. Console sends the command byte and any request bytes
 * 2. Console sends its stop bit
 * 3. Controller sends the response bytes
 * 4. Controller sends its stop bit
 *
 * \note The controller does not answer commands it does not recognize.
 *
 * The console probes with 0x00/0xFF until a controller answers, asks for the
 * origin with 0x41, then polls with 0x40 (or 0x43).
 *
 * | Command     | Byte | # Request Bytes | # Response Bytes |
 * |-------------|------|-----------------|------------------|
 * | Identify    | 0x00 | 0               | 3                |
 * | Reset       | 0xFF | 0               | 3                |
 * | Poll        | 0x40 | 2               | 8                |
 * | Origin      | 0x41 | 0               | 10               |
 * | Recalibrate | 0x42 | 2               | 10               |
 * | Long Poll   | 0x43 | 2               | 10               |
 *
 * Identify and reset are answered with 0x09 0x00 0x03. Poll's first request
 * byte selects the poll mode (anything above 4 means mode 0), its second byte
 * carries the rumble mode in the low 2 bits. Recalibrate and long poll carry
 * the rumble byte in the same place. Origin, recalibrate and long poll answer
 * in mode 5.
 *
 * Every response starts with the two button bytes:
 *
 * | Byte | 7 | 6  | 5      | 4     | 3    | 2      | 1       | 0      |
 * |------|---|----|--------|-------|------|--------|---------|--------|
 * | 0    | 0 | 0  | Origin | Start | Y    | X      | B       | A      |
 * | 1    | 1 | LT | RT     | Z     | D-Up | D-Down | D-Right | D-Left |
 *
 * followed by main stick X and Y, then the analog fields of the poll mode:
 *
 * | Mode | Byte 4        | Byte 5      | Byte 6      | Byte 7      | Byte 8 | Byte 9 |
 * |------|---------------|-------------|-------------|-------------|--------|--------|
 * | 0    | C X           | C Y         | L hi / R hi | A hi / B hi |        |        |
 * | 1    | CX hi / CY hi | L           | R           | A hi / B hi |        |        |
 * | 2    | CX hi / CY hi | L hi / R hi | A           | B           |        |        |
 * | 3    | C X           | C Y         | L           | R           |        |        |
 * | 4    | C X           | C Y         | A           | B           |        |        |
 * | 5    | C X           | C Y         | L           | R           | A      | B      |
 *
 * "hi" fields are the upper 4 bits of each value. This controller has no
 * analog A/B buttons and reports them as 0.
 *
 * The origin bit is set until the console has requested the origin or
 * recalibrated; reset sets it again.
 *
 * <h2>Additional Sources</h2>
 * * [Joybus Protocol](https://sites.google.com/site/consoleprotocols/home/nintendo-joy-bus-documentation)
 * * [Nintendo Gamecube Controller Protocol](http://www.int03.co.uk/crema/hardware/gamecube/gc-control.htm)
 * </details>
 *
 * <details>
 * <summary>GCJoy Joybus implementation</summary>
 *
 * The PIO program (joybus.pio) turns pulses into 2-bit symbols and response
 * words back into pulses. It knows nothing about bytes or commands.
 *
 * `joybus_protocol` runs on the main processor, entered from the PIO's
 * RX-not-empty interrupt. It assembles symbols into bytes and moves through
 *
 *     idle -> receiving_command -> decoding -> building_response
 *          -> transmitting -> idle
 *
 * Every command has a fixed request length, so once the opcode is known the
 * protocol decides as soon as the last request byte arrives instead of waiting
 * for the console's stop bit. That leaves the rest of the last bit and the
 * stop bit (about 6µs) to build the response and hand it to the DMA, which
 * feeds the codec's TX FIFO. The codec starts sending as soon as the console
 * releases the line.
 *
 * Anything unexpected (noise, a stop bit mid-byte, a short frame, an unknown
 * opcode, an overflowed RX FIFO, a silent line mid-frame) drops the exchange
 * without a response and returns to idle.
 * </details>
 */

/// \brief Longest gap between two symbols of one frame before giving up
constexpr uint64_t SYMBOL_TIMEOUT_US = 48;

/// \brief Time from the end of a request to handing over its response
constexpr uint64_t RESPONSE_DEADLINE_US = 6;

/// \brief Time since the last response after which the console is considered
/// gone, several video frames
constexpr uint64_t CONNECTION_TIMEOUT_US = 100000;

/// \brief Request bytes kept per frame, including the opcode
constexpr size_t MAX_REQUEST_LENGTH = 8;

/// \brief Longest response, mode 5
constexpr size_t MAX_RESPONSE_LENGTH = 10;

/// \brief Gamecube command bytes
enum command : uint8_t {
  cmd_identify = 0x00,
  cmd_poll = 0x40,
  cmd_origin = 0x41,
  cmd_recalibrate = 0x42,
  cmd_long_poll = 0x43,
  cmd_reset = 0xFF,
};

/// \brief Fixed frame lengths of a command
struct command_info {
  /// \brief Command byte
  uint8_t opcode;
  /// \brief Request length including the command byte
  uint8_t request_length;
  /// \brief Response length
  uint8_t response_length;
};

/** \brief Look up a command
 *
 * \param opcode First byte of the request
 * \return Command description, `nullptr` if the opcode is not recognized
 */
const command_info *find_command(uint8_t opcode);

/** \brief Pack controller state in a poll mode's layout
 *
 * \param mode Poll mode, 0-5
 * \param state State to pack, buttons already including the protocol bits
 * \param out Output buffer of at least `MAX_RESPONSE_LENGTH` bytes
 * \return Number of bytes written
 */
size_t pack_controller_state(uint8_t mode, const controller_state &state,
                             uint8_t *out);

/// \brief Protocol states, see the description above
enum class protocol_state {
  idle,
  receiving_command,
  decoding,
  building_response,
  transmitting,
};

/// \brief Counters kept by the protocol
struct exchange_stats {
  /// \brief Responses handed to the codec
  uint32_t responses = 0;
  /// \brief Exchanges dropped because of line noise
  uint32_t dropped_noise = 0;
  /// \brief Exchanges dropped because of a stop bit mid-byte
  uint32_t dropped_framing = 0;
  /// \brief Exchanges dropped because of an unknown opcode
  uint32_t dropped_unknown_command = 0;
  /// \brief Exchanges dropped because the request had the wrong length
  uint32_t dropped_length_mismatch = 0;
  /// \brief Exchanges dropped because the RX FIFO overflowed
  uint32_t dropped_overflow = 0;
  /// \brief Exchanges dropped because the line went quiet mid-frame
  uint32_t dropped_timeout = 0;
  /// \brief Responses handed over later than `RESPONSE_DEADLINE_US`
  uint32_t deadline_misses = 0;
  /// \brief Time from end of request to response hand-over, last exchange
  uint32_t last_turnaround_us = 0;
  /// \brief Largest `last_turnaround_us` seen
  uint32_t max_turnaround_us = 0;
};

/** \brief Controller side Joybus state machine
 *
 * Owns the protocol's own state (origin, rumble, the request in progress);
 * reads controller state from a `state_store` it is given, which must outlive
 * it. Handles one exchange at a time.
 */
class joybus_protocol {
 public:
  /** \brief Create the protocol
   *
   * \param link FIFO bridge to the codec
   * \param store Controller state to report
   * \param log Optional event log
   */
  joybus_protocol(joybus_link &link, state_store &store,
                  event_log *log = nullptr);

  joybus_protocol(const joybus_protocol &) = delete;
  joybus_protocol &operator=(const joybus_protocol &) = delete;

  /** \brief Process whatever the codec has delivered
   *
   * Returns once the protocol is idle with no frame in progress, or is
   * waiting for a transmission to drain. While a frame is in progress it waits
   * for the next symbol, at most `SYMBOL_TIMEOUT_US`.
   */
  void service();

  /// \brief Current state
  protocol_state current_state() const { return state_; }

  /// \brief Counters
  const exchange_stats &stats() const { return stats_; }

  /// \brief `true` until the console has requested the origin
  bool origin_pending() const { return origin_pending_; }

  /// \brief Analog values reported in response to origin
  const controller_state &origin() const { return origin_; }

  /** \brief Whether a console is talking to the controller
   *
   * \return `true` if a response was handed to the codec within the last
   * `CONNECTION_TIMEOUT_US`
   */
  bool connected() const;

 private:
  bool receive();
  void on_symbol(line_symbol symbol);
  void on_byte(uint8_t byte);
  void decode();
  void build_response();
  bool finish_transmit();

  void transition(protocol_state next);
  void abandon(log_event reason, uint32_t &counter, uint8_t detail);
  void record(log_event event, uint8_t detail);
  void apply_rumble(uint8_t rumble_byte);
  uint16_t wire_buttons(uint16_t buttons) const;

  joybus_link &link_;
  state_store &store_;
  event_log *log_;

  protocol_state state_ = protocol_state::idle;
  rx_assembler assembler_;

  std::array<uint8_t, MAX_REQUEST_LENGTH> request_ = {};
  size_t request_length_ = 0;
  const command_info *command_ = nullptr;

  std::array<uint8_t, MAX_RESPONSE_LENGTH> response_ = {};
  std::array<uint32_t, MAX_RESPONSE_LENGTH> tx_words_ = {};

  /// \brief Discarding the rest of a frame after losing track of it
  bool resync_ = false;
  uint64_t last_symbol_us_ = 0;
  uint64_t request_end_us_ = 0;
  /// \brief Low 32 bits of the clock at the last response, read outside the
  /// IRQ
  uint32_t last_response_us_ = 0;

  bool origin_pending_ = true;
  controller_state origin_;
  rumble_mode rumble_ = rumble_stop;

  exchange_stats stats_;
};

#endif  // JOYBUS_H_
