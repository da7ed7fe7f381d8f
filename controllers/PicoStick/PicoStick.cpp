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

#include "controller.hpp"

#include "gcjoy/controller.hpp"
#include "hardware/adc.h"
#include "hardware/gpio.h"
#include "pico/time.h"

// Physical button inputs are active low
bool pressed(uint pin) { return !gpio_get(pin); }

void init_input(uint pin) {
  gpio_init(pin);
  gpio_set_dir(pin, GPIO_IN);
  gpio_pull_up(pin);
}

void init_buttons() {
  // Set buttons as pull-up inputs
  init_input(DPAD_LEFT_PIN);
  init_input(DPAD_RIGHT_PIN);
  init_input(DPAD_DOWN_PIN);
  init_input(DPAD_UP_PIN);
  init_input(Z_PIN);
  init_input(RT_DIGITAL_PIN);
  init_input(LT_DIGITAL_PIN);
  init_input(A_PIN);
  init_input(B_PIN);
  init_input(X_PIN);
  init_input(Y_PIN);
  init_input(START_PIN);

  // Wait for pull-ups to stabilize
  busy_wait_us(100);
}

uint16_t get_buttons() {
  return (pressed(DPAD_LEFT_PIN) << DPAD_LEFT) |
         (pressed(DPAD_RIGHT_PIN) << DPAD_RIGHT) |
         (pressed(DPAD_DOWN_PIN) << DPAD_DOWN) |
         (pressed(DPAD_UP_PIN) << DPAD_UP) | (pressed(Z_PIN) << Z) |
         (pressed(RT_DIGITAL_PIN) << RT_DIGITAL) |
         (pressed(LT_DIGITAL_PIN) << LT_DIGITAL) | (pressed(A_PIN) << A) |
         (pressed(B_PIN) << B) | (pressed(X_PIN) << X) |
         (pressed(Y_PIN) << Y) | (pressed(START_PIN) << START);
}

void init_sticks() {
  // Main stick on the ADC
  adc_init();
  adc_gpio_init(LX_PIN);
  adc_gpio_init(LY_PIN);

  // C-stick buttons
  init_input(C_LEFT_PIN);
  init_input(C_RIGHT_PIN);
  init_input(C_DOWN_PIN);
  init_input(C_UP_PIN);
}

// Read one axis, 12 bit conversion scaled to 8 bits
uint8_t read_axis(uint adc_input) {
  adc_select_input(adc_input);
  return adc_read() >> 4;
}

// Opposite directions cancel out
uint8_t c_axis(bool low, bool high) {
  if (low == high) {
    return CENTER;
  }
  return low ? CENTER - C_STICK_DEFLECTION : CENTER + C_STICK_DEFLECTION;
}

sticks get_sticks(uint16_t physical_buttons) {
  sticks out;
  out.l_stick.x = read_axis(LX_ADC_INPUT);
  out.l_stick.y = read_axis(LY_ADC_INPUT);
  out.r_stick.x = c_axis(pressed(C_LEFT_PIN), pressed(C_RIGHT_PIN));
  out.r_stick.y = c_axis(pressed(C_DOWN_PIN), pressed(C_UP_PIN));
  return out;
}

void init_triggers() {}

triggers get_triggers(uint16_t physical_buttons) {
  triggers out;
  if (physical_buttons & (1 << LT_DIGITAL)) {
    out.l_trigger = TRIGGER_PRESSED_VALUE;
  }
  if (physical_buttons & (1 << RT_DIGITAL)) {
    out.r_trigger = TRIGGER_PRESSED_VALUE;
  }
  return out;
}

void init_rumble() {
  gpio_init(RUMBLE_PIN);
  gpio_set_dir(RUMBLE_PIN, GPIO_OUT);
  gpio_put(RUMBLE_PIN, 0);
}

void set_rumble(rumble_mode mode) {
  switch (mode) {
    case rumble_start:
    case rumble_continue:
      gpio_put(RUMBLE_PIN, 1);
      break;
    case rumble_stop:
    case rumble_brake:
      gpio_put(RUMBLE_PIN, 0);
      break;
  }
}
