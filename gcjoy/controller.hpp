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

#ifndef CONTROLLER_H_
#define CONTROLLER_H_

#include <stdint.h>

#include "state.hpp"

/** \file controller.hpp
 * \brief Functionality that varies in implementation between controllers
 */

/// \brief Initialize button reading functionality
void init_buttons();

/** \brief Get physical button states in the order they are sent to the console
 * 
 * \return Bitset of button states
 */
uint16_t get_buttons();

/// \brief Initialize stick reading functionality
void init_sticks();

/** \brief Get the value of both sticks
 *
 * \param physical_buttons Physical button states, for sticks driven by buttons
 *
 * \return Stick values centered on `CENTER`
 */
sticks get_sticks(uint16_t physical_buttons);

/// \brief Initialize trigger reading functionality
void init_triggers();

/** \brief Get the value of the triggers
 *
 * \param physical_buttons Physical button states, for triggers driven by the
 * digital buttons
 *
 * \return Trigger values
 */
triggers get_triggers(uint16_t physical_buttons);

/// \brief Initialize the rumble motor
void init_rumble();

/** \brief Drive the rumble motor
 *
 * \param mode Last rumble request from the console
 */
void set_rumble(rumble_mode mode);

#endif  // CONTROLLER_H_
