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

#include "joybus.hpp"

#include <algorithm>

namespace {

constexpr std::array<command_info, 6> commands = {{
    {cmd_identify, 1, 3},
    {cmd_poll, 3, 8},
    {cmd_origin, 1, 10},
    {cmd_recalibrate, 3, 10},
    {cmd_long_poll, 3, 10},
    {cmd_reset, 1, 3},
}};

// Device identifier of a standard controller
constexpr std::array<uint8_t, 3> identity = {0x09, 0x00, 0x03};

}  // namespace

const command_info *find_command(uint8_t opcode) {
  for (const command_info &info : commands) {
    if (info.opcode == opcode) {
      return &info;
    }
  }
  return nullptr;
}

size_t pack_controller_state(uint8_t mode, const controller_state &state,
                             uint8_t *out) {
  const sticks &s = state.analog_sticks;
  const triggers &t = state.analog_triggers;

  out[0] = state.buttons >> 8;
  out[1] = state.buttons & 0x00FF;
  out[2] = s.l_stick.x;
  out[3] = s.l_stick.y;

  switch (mode) {
    case 0x00:
      out[4] = s.r_stick.x;
      out[5] = s.r_stick.y;
      out[6] = (t.l_trigger & 0xF0) | (t.r_trigger >> 4);
      out[7] = 0x00;
      return 8;
    case 0x01:
      out[4] = (s.r_stick.x & 0xF0) | (s.r_stick.y >> 4);
      out[5] = t.l_trigger;
      out[6] = t.r_trigger;
      out[7] = 0x00;
      return 8;
    case 0x02:
      out[4] = (s.r_stick.x & 0xF0) | (s.r_stick.y >> 4);
      out[5] = (t.l_trigger & 0xF0) | (t.r_trigger >> 4);
      out[6] = 0x00;
      out[7] = 0x00;
      return 8;
    case 0x03:
      out[4] = s.r_stick.x;
      out[5] = s.r_stick.y;
      out[6] = t.l_trigger;
      out[7] = t.r_trigger;
      return 8;
    case 0x04:
      out[4] = s.r_stick.x;
      out[5] = s.r_stick.y;
      out[6] = 0x00;
      out[7] = 0x00;
      return 8;
    default:
      out[4] = s.r_stick.x;
      out[5] = s.r_stick.y;
      out[6] = t.l_trigger;
      out[7] = t.r_trigger;
      out[8] = 0x00;
      out[9] = 0x00;
      return 10;
  }
}

joybus_protocol::joybus_protocol(joybus_link &link, state_store &store,
                                 event_log *log)
    : link_(link), store_(store), log_(log) {}

void joybus_protocol::service() {
  while (true) {
    switch (state_) {
      case protocol_state::idle:
      case protocol_state::receiving_command:
        if (!receive()) {
          return;
        }
        break;
      case protocol_state::decoding:
        decode();
        break;
      case protocol_state::building_response:
        build_response();
        break;
      case protocol_state::transmitting:
        if (!finish_transmit()) {
          return;
        }
        break;
    }
  }
}

bool joybus_protocol::receive() {
  if (link_.rx_overflowed()) {
    // Symbols were lost, so whatever is left of this frame is meaningless
    link_.discard_rx();
    abandon(log_event::dropped_overflow, stats_.dropped_overflow, 0);
    resync_ = true;
    last_symbol_us_ = link_.now_us();
    return true;
  }

  uint64_t now = link_.now_us();

  if (link_.rx_empty()) {
    bool in_frame = state_ == protocol_state::receiving_command ||
                    assembler_.bit_count() != 0;
    if (!in_frame && !resync_) {
      return false;
    }

    // Wait for the rest of the frame
    if (now - last_symbol_us_ <= SYMBOL_TIMEOUT_US) {
      return true;
    }

    if (in_frame) {
      abandon(log_event::dropped_timeout, stats_.dropped_timeout,
              static_cast<uint8_t>(request_length_));
    }
    resync_ = false;
    return false;
  }

  // A quiet line since the last symbol means this one starts a new frame
  if (resync_ && now - last_symbol_us_ > SYMBOL_TIMEOUT_US) {
    resync_ = false;
  }
  last_symbol_us_ = now;

  line_symbol symbol = decode_symbol(link_.rx_get());

  // Only a stop bit or a quiet line marks the end of the lost frame. The codec
  // goes on decoding pulses after noise, so the frame's tail can look like a
  // new command.
  if (resync_) {
    if (symbol == line_symbol::stop) {
      resync_ = false;
    }
    return true;
  }

  on_symbol(symbol);
  return true;
}

void joybus_protocol::on_symbol(line_symbol symbol) {
  bool in_frame = state_ == protocol_state::receiving_command ||
                  assembler_.bit_count() != 0;

  switch (assembler_.push(symbol)) {
    case assembler_result::pending:
      break;
    case assembler_result::byte_ready:
      on_byte(assembler_.byte());
      break;
    case assembler_result::frame_end:
      // A stop bit outside a frame is the tail of an exchange that was already
      // answered or dropped
      if (state_ == protocol_state::receiving_command) {
        request_end_us_ = link_.now_us();
        transition(protocol_state::decoding);
      }
      break;
    case assembler_result::framing_error:
      abandon(log_event::dropped_framing, stats_.dropped_framing,
              static_cast<uint8_t>(request_length_));
      break;
    case assembler_result::noise:
      if (in_frame) {
        abandon(log_event::dropped_noise, stats_.dropped_noise,
                static_cast<uint8_t>(request_length_));
        resync_ = true;
      }
      break;
  }
}

void joybus_protocol::on_byte(uint8_t byte) {
  if (state_ == protocol_state::idle) {
    transition(protocol_state::receiving_command);
    command_ = find_command(byte);
  }

  if (request_length_ < request_.size()) {
    request_[request_length_] = byte;
  }
  ++request_length_;

  // The request length is fixed by the opcode, no need to wait for the stop
  // bit
  if (command_ != nullptr && request_length_ == command_->request_length) {
    request_end_us_ = link_.now_us();
    transition(protocol_state::decoding);
  }
}

void joybus_protocol::decode() {
  if (command_ == nullptr) {
    abandon(log_event::dropped_unknown_command, stats_.dropped_unknown_command,
            request_[0]);
    return;
  }

  if (request_length_ != command_->request_length) {
    abandon(log_event::dropped_length_mismatch, stats_.dropped_length_mismatch,
            static_cast<uint8_t>(request_length_));
    return;
  }

  transition(protocol_state::building_response);
}

void joybus_protocol::build_response() {
  // One snapshot per response, taken before anything is packed
  controller_state current = store_.snapshot();
  size_t length = 0;

  switch (command_->opcode) {
    case cmd_reset:
      origin_pending_ = true;
      apply_rumble(rumble_stop);
      record(log_event::reset, 0);
      std::copy(identity.begin(), identity.end(), response_.begin());
      length = identity.size();
      break;
    case cmd_identify:
      record(log_event::identify, 0);
      std::copy(identity.begin(), identity.end(), response_.begin());
      length = identity.size();
      break;
    case cmd_poll: {
      uint8_t mode = request_[1] > 0x04 ? 0x00 : request_[1];
      apply_rumble(request_[2]);
      current.buttons = wire_buttons(current.buttons);
      length = pack_controller_state(mode, current, response_.data());
      break;
    }
    case cmd_origin: {
      origin_pending_ = false;
      record(log_event::origin, 0);
      controller_state reported = origin_;
      reported.buttons = wire_buttons(current.buttons);
      length = pack_controller_state(0x05, reported, response_.data());
      break;
    }
    case cmd_recalibrate:
      apply_rumble(request_[2]);
      origin_pending_ = false;
      origin_.analog_sticks = current.analog_sticks;
      origin_.analog_triggers = current.analog_triggers;
      record(log_event::recalibrate, 0);
      current.buttons = wire_buttons(current.buttons);
      length = pack_controller_state(0x05, current, response_.data());
      break;
    case cmd_long_poll:
      apply_rumble(request_[2]);
      current.buttons = wire_buttons(current.buttons);
      length = pack_controller_state(0x05, current, response_.data());
      break;
  }

  tx_serialize(response_.data(), length, tx_words_.data());
  link_.transmit(tx_words_.data(), length);

  uint64_t turnaround = link_.now_us() - request_end_us_;
  stats_.last_turnaround_us = static_cast<uint32_t>(turnaround);
  if (stats_.last_turnaround_us > stats_.max_turnaround_us) {
    stats_.max_turnaround_us = stats_.last_turnaround_us;
  }
  if (turnaround > RESPONSE_DEADLINE_US) {
    ++stats_.deadline_misses;
    record(log_event::deadline_missed,
           turnaround > 0xFF ? 0xFF : static_cast<uint8_t>(turnaround));
  }
  last_response_us_ = static_cast<uint32_t>(link_.now_us());
  ++stats_.responses;

  transition(protocol_state::transmitting);
}

bool joybus_protocol::connected() const {
  if (stats_.responses == 0) {
    return false;
  }
  // Modulo 2^32, right for any gap shorter than about an hour
  uint32_t since = static_cast<uint32_t>(link_.now_us()) - last_response_us_;
  return since <= CONNECTION_TIMEOUT_US;
}

bool joybus_protocol::finish_transmit() {
  if (!link_.transmit_done()) {
    // The codec does not sample while sending, anything here is the stop bit
    // of the request if the response was slow to start
    link_.discard_rx();
    return false;
  }

  transition(protocol_state::idle);
  return true;
}

void joybus_protocol::transition(protocol_state next) {
  switch (next) {
    case protocol_state::idle:
      assembler_.reset();
      command_ = nullptr;
      request_length_ = 0;
      break;
    case protocol_state::receiving_command:
      command_ = nullptr;
      request_length_ = 0;
      break;
    default:
      break;
  }
  state_ = next;
}

void joybus_protocol::abandon(log_event reason, uint32_t &counter,
                              uint8_t detail) {
  ++counter;
  record(reason, detail);
  transition(protocol_state::idle);
}

void joybus_protocol::record(log_event event, uint8_t detail) {
  if (log_ == nullptr) {
    return;
  }

  // A full log counts the lost record itself
  log_->push({static_cast<uint32_t>(link_.now_us()), event, detail});
}

void joybus_protocol::apply_rumble(uint8_t rumble_byte) {
  rumble_mode mode = static_cast<rumble_mode>(rumble_byte & 0x03);
  if (mode == rumble_) {
    return;
  }
  rumble_ = mode;
  store_.set_rumble(mode);
  record(log_event::rumble_changed, mode);
}

uint16_t joybus_protocol::wire_buttons(uint16_t buttons) const {
  return (buttons & PLAYER_BUTTONS_MASK) | (1 << ALWAYS_HIGH) |
         (origin_pending_ << ORIGIN);
}
