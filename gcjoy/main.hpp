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

#ifndef MAIN_H_
#define MAIN_H_

#include <stdint.h>

#include "event_log.hpp"
#include "state.hpp"

/** \file main.hpp
 * \brief Reference application
 *
 * Core 0 owns the Joybus interrupt and prints the event log. Core 1 reads the
 * controller inputs and publishes them to the state store.
 */

/// \brief Controller state reported to the console
extern state_store store;

/// \brief Events recorded by the protocol
extern event_log events;

/// \brief Read every input once and publish it
void read_inputs();

/// \brief Main input loop, run on second core
void input_main();

/** \brief Print pending events over stdio
 *
 * \param reported_drops Number of dropped records already reported, updated
 */
void report_events(uint32_t &reported_drops);

#endif  // MAIN_H_
