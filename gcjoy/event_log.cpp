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

#include "event_log.hpp"

const char *describe(log_event event) {
  switch (event) {
    case log_event::identify:
      return "identify";
    case log_event::reset:
      return "reset";
    case log_event::origin:
      return "origin";
    case log_event::recalibrate:
      return "recalibrate";
    case log_event::rumble_changed:
      return "rumble changed";
    case log_event::dropped_noise:
      return "dropped: line noise";
    case log_event::dropped_framing:
      return "dropped: stop bit mid-byte";
    case log_event::dropped_unknown_command:
      return "dropped: unknown command";
    case log_event::dropped_length_mismatch:
      return "dropped: wrong request length";
    case log_event::dropped_overflow:
      return "dropped: RX FIFO overflow";
    case log_event::dropped_timeout:
      return "dropped: timed out mid-frame";
    case log_event::deadline_missed:
      return "response deadline missed";
  }
  return "unknown";
}

bool event_log::push(const log_record &record) {
  uint32_t head = head_.load(std::memory_order_relaxed);
  uint32_t next = (head + 1) % CAPACITY;

  if (next == tail_.load(std::memory_order_acquire)) {
    dropped_.store(dropped_.load(std::memory_order_relaxed) + 1,
                   std::memory_order_relaxed);
    return false;
  }

  records_[head] = record;
  head_.store(next, std::memory_order_release);
  return true;
}

bool event_log::pop(log_record &record) {
  uint32_t tail = tail_.load(std::memory_order_relaxed);

  if (tail == head_.load(std::memory_order_acquire)) {
    return false;
  }

  record = records_[tail];
  tail_.store((tail + 1) % CAPACITY, std::memory_order_release);
  return true;
}
