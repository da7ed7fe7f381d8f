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

/** \file controller.hpp
 * \brief Controller pinout constants
 *
 * Raspberry Pi Pico with twelve buttons, four C-stick buttons, an analog
 * thumbstick for the main stick and a rumble motor driver.
 */

#ifndef PICOSTICK_H_
#define PICOSTICK_H_

#include "pico/types.h"

/// \brief Joybus data pin
constexpr uint JOYBUS_PIN = 22;

/// \brief D-pad left pin
constexpr uint DPAD_LEFT_PIN = 0;

/// \brief D-pad right pin
constexpr uint DPAD_RIGHT_PIN = 1;

/// \brief D-pad down pin
constexpr uint DPAD_DOWN_PIN = 2;

/// \brief D-pad up pin
constexpr uint DPAD_UP_PIN = 3;

/// \brief Z button pin
constexpr uint Z_PIN = 4;

/// \brief Right trigger button pin
constexpr uint RT_DIGITAL_PIN = 5;

/// \brief Left trigger button pin
constexpr uint LT_DIGITAL_PIN = 6;

/// \brief A button pin
constexpr uint A_PIN = 8;

/// \brief B button pin
constexpr uint B_PIN = 9;

/// \brief X button pin
constexpr uint X_PIN = 10;

/// \brief Y button pin
constexpr uint Y_PIN = 11;

/// \brief Start button pin
constexpr uint START_PIN = 12;

/// \brief C-stick left pin
constexpr uint C_LEFT_PIN = 13;

/// \brief C-stick right pin
constexpr uint C_RIGHT_PIN = 14;

/// \brief C-stick down pin
constexpr uint C_DOWN_PIN = 15;

/// \brief C-stick up pin
constexpr uint C_UP_PIN = 16;

/// \brief Rumble motor driver pin
constexpr uint RUMBLE_PIN = 17;

/// \brief Main stick x-axis pin
constexpr uint LX_PIN = 26;

/// \brief Main stick y-axis pin
constexpr uint LY_PIN = 27;

/// \brief Main stick x-axis ADC channel
constexpr uint LX_ADC_INPUT = LX_PIN - 26;

/// \brief Main stick y-axis ADC channel
constexpr uint LY_ADC_INPUT = LY_PIN - 26;

/// \brief C-stick displacement from center when a C button is held
constexpr uint8_t C_STICK_DEFLECTION = 80;

/// \brief Analog value reported for a trigger whose button is held
constexpr uint8_t TRIGGER_PRESSED_VALUE = 0xFF;

#endif  // PICOSTICK_H_
