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

#ifndef EVENT_LOG_H_
#define EVENT_LOG_H_

#include <stddef.h>
#include <stdint.h>

#include <array>
#include <atomic>

/** \file event_log.hpp
 * \brief Log of protocol events, safe to fill from the Joybus interrupt
 *
 * Formatting text inside the interrupt would blow the response deadline, so
 * the protocol only records small fixed-size entries here. The main loop
 * drains them and prints them over stdio.
 */

/// \brief Kinds of events the protocol records
enum class log_event : uint8_t {
  identify,                  ///< Answered identify
  reset,                     ///< Answered reset
  origin,                    ///< Answered origin
  recalibrate,               ///< Answered recalibrate, origin replaced
  rumble_changed,            ///< Console changed rumble, detail = mode
  dropped_noise,             ///< Exchange dropped, codec reported noise
  dropped_framing,           ///< Exchange dropped, stop bit mid-byte
  dropped_unknown_command,   ///< Exchange dropped, detail = opcode
  dropped_length_mismatch,   ///< Exchange dropped, detail = bytes received
  dropped_overflow,          ///< Exchange dropped, RX FIFO overflowed
  dropped_timeout,           ///< Exchange dropped, line went quiet mid-frame
  deadline_missed,           ///< Response started late, detail = µs taken
};

/// \brief One recorded event
struct log_record {
  /// \brief Time of the event in microseconds, truncated
  uint32_t timestamp_us;
  /// \brief What happened
  log_event event;
  /// \brief Event specific value
  uint8_t detail;
};

/** \brief Name of an event for printing
 *
 * \param event Event kind
 * \return Static string
 */
const char *describe(log_event event);

/** \brief Single producer, single consumer ring of log records
 *
 * One slot is kept free to tell a full ring from an empty one. When the ring
 * is full new records are dropped and counted.
 */
class event_log {
 public:
  /// \brief Number of slots in the ring
  static constexpr size_t CAPACITY = 32;

  /** \brief Record an event, producer side
   *
   * \param record Event to record
   * \return `false` if the ring was full and the record was dropped
   */
  bool push(const log_record &record);

  /** \brief Take the oldest record, consumer side
   *
   * \param record Output
   * \return `false` if the ring was empty
   */
  bool pop(log_record &record);

  /// \brief Number of records dropped because the ring was full
  uint32_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

  /** \brief Pass every pending record to a sink, consumer side
   *
   * \param sink Callable taking `const log_record &`
   * \return Number of records drained
   */
  template <typename Sink>
  size_t drain(Sink sink) {
    size_t count = 0;
    log_record record;
    while (pop(record)) {
      sink(record);
      ++count;
    }
    return count;
  }

 private:
  std::array<log_record, CAPACITY> records_;
  std::atomic<uint32_t> head_{0};
  std::atomic<uint32_t> tail_{0};
  std::atomic<uint32_t> dropped_{0};
};

#endif  // EVENT_LOG_H_
