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

#include "state.hpp"

// Word layouts:
// digital: buttons [15:0], main stick x [23:16], main stick y [31:24]
// analog: C-stick x [7:0], C-stick y [15:8], left trigger [23:16],
//         right trigger [31:24]

bool operator==(const controller_state &lhs, const controller_state &rhs) {
  return lhs.buttons == rhs.buttons &&
         lhs.analog_sticks.l_stick.x == rhs.analog_sticks.l_stick.x &&
         lhs.analog_sticks.l_stick.y == rhs.analog_sticks.l_stick.y &&
         lhs.analog_sticks.r_stick.x == rhs.analog_sticks.r_stick.x &&
         lhs.analog_sticks.r_stick.y == rhs.analog_sticks.r_stick.y &&
         lhs.analog_triggers.l_trigger == rhs.analog_triggers.l_trigger &&
         lhs.analog_triggers.r_trigger == rhs.analog_triggers.r_trigger;
}

bool operator!=(const controller_state &lhs, const controller_state &rhs) {
  return !(lhs == rhs);
}

state_store::state_store(const controller_state &initial) {
  publish(initial);
}

void state_store::publish(const controller_state &new_state) {
  shadow_ = new_state;
  shadow_.buttons &= PLAYER_BUTTONS_MASK;
  store_words();
}

void state_store::update_buttons(uint16_t buttons) {
  shadow_.buttons = buttons & PLAYER_BUTTONS_MASK;
  store_words();
}

void state_store::update_sticks(const sticks &new_sticks) {
  shadow_.analog_sticks = new_sticks;
  store_words();
}

void state_store::update_triggers(const triggers &new_triggers) {
  shadow_.analog_triggers = new_triggers;
  store_words();
}

void state_store::store_words() {
  uint32_t digital = shadow_.buttons |
                     (shadow_.analog_sticks.l_stick.x << 16) |
                     (static_cast<uint32_t>(shadow_.analog_sticks.l_stick.y) << 24);
  uint32_t analog =
      shadow_.analog_sticks.r_stick.x | (shadow_.analog_sticks.r_stick.y << 8) |
      (shadow_.analog_triggers.l_trigger << 16) |
      (static_cast<uint32_t>(shadow_.analog_triggers.r_trigger) << 24);

  uint32_t sequence = sequence_.load(std::memory_order_relaxed);
  sequence_.store(sequence + 1, std::memory_order_relaxed);
  std::atomic_thread_fence(std::memory_order_release);

  digital_word_.store(digital, std::memory_order_relaxed);
  analog_word_.store(analog, std::memory_order_relaxed);

  sequence_.store(sequence + 2, std::memory_order_release);
}

controller_state state_store::snapshot() const {
  uint32_t digital;
  uint32_t analog;

  while (true) {
    uint32_t before = sequence_.load(std::memory_order_acquire);
    if (before & 1) {
      continue;
    }

    digital = digital_word_.load(std::memory_order_relaxed);
    analog = analog_word_.load(std::memory_order_relaxed);

    std::atomic_thread_fence(std::memory_order_acquire);
    if (sequence_.load(std::memory_order_relaxed) == before) {
      break;
    }
  }

  controller_state out;
  out.buttons = digital & 0xFFFF;
  out.analog_sticks.l_stick.x = (digital >> 16) & 0xFF;
  out.analog_sticks.l_stick.y = digital >> 24;
  out.analog_sticks.r_stick.x = analog & 0xFF;
  out.analog_sticks.r_stick.y = (analog >> 8) & 0xFF;
  out.analog_triggers.l_trigger = (analog >> 16) & 0xFF;
  out.analog_triggers.r_trigger = analog >> 24;
  return out;
}
