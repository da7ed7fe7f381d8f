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

#include "main.hpp"

#include CONFIG_H

#include <stdio.h>

#include "controller.hpp"
#include "hardware/clocks.h"
#include "joybus.hpp"
#include "pico/multicore.h"
#include "pico/stdlib.h"
#include "pio_link.hpp"

state_store store;
event_log events;

int main() {
  // Configure system PLL to 128 MHZ
  set_sys_clock_pll(1536 * MHZ, 6, 2);

  stdio_init_all();

  // Setup buttons, sticks, triggers, and rumble
  init_buttons();
  init_sticks();
  init_triggers();
  init_rumble();

  // Read inputs once before starting communication
  read_inputs();

  // Start console communication
  static pio_link link(pio0, JOYBUS_PIN);
  static joybus_protocol protocol(link, store, &events);
  link.listen(protocol);

  // Launch input reading on core 1
  multicore_launch_core1(input_main);

  printf("gcjoy: listening on GPIO %u\n", JOYBUS_PIN);

  uint32_t reported_drops = 0;
  bool was_connected = false;
  while (true) {
    report_events(reported_drops);

    bool is_connected = protocol.connected();
    if (is_connected != was_connected) {
      printf(is_connected ? "console connected\n" : "console disconnected\n");
      was_connected = is_connected;
    }

    sleep_ms(1);
  }

  return 0;
}

void read_inputs() {
  uint16_t physical_buttons = get_buttons();

  controller_state next;
  next.buttons = physical_buttons;
  next.analog_sticks = get_sticks(physical_buttons);
  next.analog_triggers = get_triggers(physical_buttons);
  store.publish(next);
}

void input_main() {
  rumble_mode rumble = rumble_stop;

  while (true) {
    read_inputs();

    rumble_mode requested = store.rumble();
    if (requested != rumble) {
      rumble = requested;
      set_rumble(rumble);
    }
  }
}

void report_events(uint32_t &reported_drops) {
  events.drain([](const log_record &record) {
    printf("[%10lu us] %s (%u)\n",
           static_cast<unsigned long>(record.timestamp_us),
           describe(record.event), static_cast<unsigned>(record.detail));
  });

  uint32_t dropped = events.dropped();
  if (dropped != reported_drops) {
    printf("event log full, %lu events lost\n",
           static_cast<unsigned long>(dropped - reported_drops));
    reported_drops = dropped;
  }
}
