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

#ifndef STATE_H_
#define STATE_H_

#include <stdint.h>

#include <atomic>

/** \file state.hpp
 * \brief Controller state and the store shared with the protocol
 *
 * The application writes the logical controller state into a `state_store`;
 * the Joybus protocol reads one consistent snapshot of it per response.
 */

/// \brief D-pad left bit in controller state
constexpr uint8_t DPAD_LEFT = 0;

/// \brief D-pad right bit in controller state
constexpr uint8_t DPAD_RIGHT = 1;

/// \brief D-pad down bit in controller state
constexpr uint8_t DPAD_DOWN = 2;

/// \brief D-pad up bit in controller state
constexpr uint8_t DPAD_UP = 3;

/// \brief Z button bit in controller state
constexpr uint8_t Z = 4;

/// \brief Right trigger button bit in controller state
constexpr uint8_t RT_DIGITAL = 5;

/// \brief Left trigger button bit in controller state
constexpr uint8_t LT_DIGITAL = 6;

/// \brief Always high bit, set by the protocol
constexpr uint8_t ALWAYS_HIGH = 7;

/// \brief A button bit in controller state
constexpr uint8_t A = 8;

/// \brief B button bit in controller state
constexpr uint8_t B = 9;

/// \brief X button bit in controller state
constexpr uint8_t X = 10;

/// \brief Y button bit in controller state
constexpr uint8_t Y = 11;

/// \brief Start button bit in controller state
constexpr uint8_t START = 12;

/// \brief Origin bit, set by the protocol until the console requests origin
constexpr uint8_t ORIGIN = 13;

/// \brief Buttons the application controls; the other bits belong to the
/// protocol
constexpr uint16_t PLAYER_BUTTONS_MASK =
    (1 << DPAD_LEFT) | (1 << DPAD_RIGHT) | (1 << DPAD_DOWN) | (1 << DPAD_UP) |
    (1 << Z) | (1 << RT_DIGITAL) | (1 << LT_DIGITAL) | (1 << A) | (1 << B) |
    (1 << X) | (1 << Y) | (1 << START);

/// \brief Center point of an analog stick axis
constexpr uint8_t CENTER = 0x80;

/// \brief Grouping of axes for a single analog stick
struct stick {
  /// \brief X-axis
  uint8_t x = CENTER;
  /// \brief Y-axis
  uint8_t y = CENTER;
};

/// \brief Grouping of analog sticks
struct sticks {
  /// \brief Main stick
  stick l_stick;
  /// \brief C-stick
  stick r_stick;
};

/// \brief Grouping of analog triggers
struct triggers {
  /// \brief State of left trigger
  uint8_t l_trigger = 0;
  /// \brief State of right trigger
  uint8_t r_trigger = 0;
};

/// \brief Logical controller state
struct controller_state {
  /// \brief State of digital inputs, bit positions as sent to the console
  uint16_t buttons = 0;
  /// \brief State of sticks
  sticks analog_sticks;
  /// \brief State of triggers (analog)
  triggers analog_triggers;
};

bool operator==(const controller_state &lhs, const controller_state &rhs);
bool operator!=(const controller_state &lhs, const controller_state &rhs);

/// \brief Rumble requests from the console, low 2 bits of the rumble byte
enum rumble_mode : uint8_t {
  rumble_stop = 0x00,      ///< Stop rumble
  rumble_start = 0x01,     ///< Start rumble
  rumble_brake = 0x02,     ///< Apply rumble brake
  rumble_continue = 0x03,  ///< Continue rumble
};

/** \brief Controller state shared between the application and the protocol
 *
 * Writes come from a single context (the application loop); reads come from
 * the protocol's interrupt handler. A read always returns the state as left by
 * exactly one `publish` (or partial update), never a mix of two.
 *
 * The state is packed into two words guarded by a sequence counter that is
 * odd while a write is in progress. Readers retry while the counter is odd or
 * changed under them; writers never wait. Only plain atomic loads and stores
 * are used, which the Cortex-M0+ performs without locks.
 *
 * The rumble mode travels the other way: the protocol sets it, the
 * application reads it.
 */
class state_store {
 public:
  /** \brief Create a store holding an initial state
   *
   * \param initial State reported until the application publishes
   */
  explicit state_store(const controller_state &initial = controller_state());

  state_store(const state_store &) = delete;
  state_store &operator=(const state_store &) = delete;

  /** \brief Replace the whole state
   *
   * \param new_state State to publish
   */
  void publish(const controller_state &new_state);

  /** \brief Replace the digital inputs, keeping the analog inputs
   *
   * \param buttons Button bits, only `PLAYER_BUTTONS_MASK` is kept
   */
  void update_buttons(uint16_t buttons);

  /** \brief Replace both sticks, keeping the rest
   *
   * \param new_sticks Stick values
   */
  void update_sticks(const sticks &new_sticks);

  /** \brief Replace both analog triggers, keeping the rest
   *
   * \param new_triggers Trigger values
   */
  void update_triggers(const triggers &new_triggers);

  /** \brief Read a consistent copy of the state
   *
   * \return The most recently published state
   */
  controller_state snapshot() const;

  /// \brief Rumble mode last requested by the console
  rumble_mode rumble() const {
    return static_cast<rumble_mode>(rumble_.load(std::memory_order_relaxed));
  }

  /// \brief Record the console's rumble request
  void set_rumble(rumble_mode mode) {
    rumble_.store(mode, std::memory_order_relaxed);
  }

 private:
  void store_words();

  /// \brief Writer's copy, merged into by partial updates
  controller_state shadow_;

  std::atomic<uint32_t> sequence_{0};
  std::atomic<uint32_t> digital_word_{0};
  std::atomic<uint32_t> analog_word_{0};
  std::atomic<uint8_t> rumble_{rumble_stop};
};

#endif  // STATE_H_
