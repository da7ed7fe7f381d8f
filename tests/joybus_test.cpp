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

#include "gcjoy/joybus.hpp"

#include <gtest/gtest.h>

#include <vector>

#include "fake_link.hpp"

namespace {

class JoybusTest : public ::testing::Test {
 protected:
  JoybusTest() : protocol(link, store, &events) {}

  /// \brief Send a frame and service the protocol until the wire is quiet
  std::vector<uint8_t> exchange(std::initializer_list<uint8_t> request) {
    size_t sent = link.responses().size();
    link.send_frame(request);
    run(link, protocol);
    if (link.responses().size() == sent) {
      return {};
    }
    return link.last_response();
  }

  std::vector<log_event> logged() {
    std::vector<log_event> out;
    events.drain([&](const log_record &record) { out.push_back(record.event); });
    return out;
  }

  fake_link link;
  state_store store;
  event_log events;
  joybus_protocol protocol;
};

const std::vector<uint8_t> IDENTITY = {0x09, 0x00, 0x03};

}  // namespace

TEST_F(JoybusTest, ProbeReturnsIdentity) {
  EXPECT_EQ(exchange({cmd_identify}), IDENTITY);
  EXPECT_EQ(protocol.current_state(), protocol_state::idle);
  EXPECT_EQ(protocol.stats().responses, 1u);
}

TEST_F(JoybusTest, ResponseWordsEndWithStopFlag) {
  exchange({cmd_identify});
  ASSERT_EQ(link.responses().size(), 1u);
  const std::vector<uint32_t> &words = link.responses().back();
  ASSERT_EQ(words.size(), 3u);
  EXPECT_EQ(words[0], tx_word(0x09, false));
  EXPECT_EQ(words[1], tx_word(0x00, false));
  EXPECT_EQ(words[2], tx_word(0x03, true));
}

TEST_F(JoybusTest, PollWithoutRumbleReportsButtonsAndCenteredSticks) {
  exchange({cmd_origin});

  controller_state state;
  state.buttons = 1 << A;
  store.publish(state);

  std::vector<uint8_t> response = exchange({cmd_poll, 0x03, 0x00});
  ASSERT_EQ(response.size(), 8u);
  // A in the first byte, always high bit in the second
  EXPECT_EQ(response[0], 0x01);
  EXPECT_EQ(response[1], 0x80);
  EXPECT_EQ(response[2], CENTER);
  EXPECT_EQ(response[3], CENTER);
  EXPECT_EQ(response[4], CENTER);
  EXPECT_EQ(response[5], CENTER);
  EXPECT_EQ(response[6], 0x00);
  EXPECT_EQ(response[7], 0x00);
  EXPECT_EQ(store.rumble(), rumble_stop);
}

TEST_F(JoybusTest, EveryCommandGetsItsResponseLength) {
  EXPECT_EQ(exchange({cmd_identify}).size(), 3u);
  EXPECT_EQ(exchange({cmd_reset}).size(), 3u);
  EXPECT_EQ(exchange({cmd_origin}).size(), 10u);
  EXPECT_EQ(exchange({cmd_poll, 0x03, 0x00}).size(), 8u);
  EXPECT_EQ(exchange({cmd_recalibrate, 0x00, 0x00}).size(), 10u);
  EXPECT_EQ(exchange({cmd_long_poll, 0x00, 0x00}).size(), 10u);
  EXPECT_EQ(protocol.stats().responses, 6u);
}

TEST_F(JoybusTest, MalformedPollIsDropped) {
  EXPECT_TRUE(exchange({cmd_poll, 0x03}).empty());
  EXPECT_EQ(protocol.current_state(), protocol_state::idle);
  EXPECT_EQ(protocol.stats().dropped_length_mismatch, 1u);
  EXPECT_EQ(logged(), std::vector<log_event>{log_event::dropped_length_mismatch});

  // Next exchange is unaffected
  EXPECT_EQ(exchange({cmd_identify}), IDENTITY);
}

TEST_F(JoybusTest, UnknownCommandIsDropped) {
  EXPECT_TRUE(exchange({0x54}).empty());
  EXPECT_TRUE(exchange({0x4D, 0x01, 0x02, 0x03}).empty());
  EXPECT_EQ(protocol.stats().dropped_unknown_command, 2u);
  EXPECT_EQ(protocol.current_state(), protocol_state::idle);
}

TEST_F(JoybusTest, OverflowUnderSlowServicingDropsFrame) {
  link.send_frame({cmd_poll, 0x03, 0x00});
  // Main loop stalled for the whole frame
  link.advance(1000);
  protocol.service();

  EXPECT_TRUE(link.responses().empty());
  EXPECT_EQ(protocol.stats().dropped_overflow, 1u);
  EXPECT_EQ(protocol.current_state(), protocol_state::idle);

  EXPECT_EQ(exchange({cmd_identify}), IDENTITY);
}

TEST_F(JoybusTest, OverflowMidFrameResyncsOnStopBit) {
  link.send_frame({cmd_poll, 0x03, 0x00});
  // Service the first symbols, then stall long enough to lose some
  link.deliver_next();
  link.advance(40);
  protocol.service();

  EXPECT_TRUE(link.responses().empty());
  EXPECT_EQ(protocol.stats().dropped_overflow, 1u);
  EXPECT_EQ(protocol.stats().responses, 0u);
  EXPECT_EQ(exchange({cmd_identify}), IDENTITY);
}

TEST_F(JoybusTest, TimeoutMidFrameDropsRequest) {
  link.send_frame({cmd_poll}, false);
  run(link, protocol);

  EXPECT_TRUE(link.responses().empty());
  EXPECT_EQ(protocol.stats().dropped_timeout, 1u);
  EXPECT_EQ(protocol.current_state(), protocol_state::idle);
  EXPECT_EQ(exchange({cmd_identify}), IDENTITY);
}

TEST_F(JoybusTest, NoiseMidFrameDropsRequest) {
  link.send_frame({cmd_poll}, false);
  link.send_symbol(line_symbol::noise);
  link.send_byte(0x03);
  link.send_byte(0x00);
  link.send_symbol(line_symbol::stop);
  run(link, protocol);

  EXPECT_TRUE(link.responses().empty());
  EXPECT_EQ(protocol.stats().dropped_noise, 1u);
  EXPECT_EQ(protocol.stats().dropped_framing, 0u);
  EXPECT_EQ(exchange({cmd_identify}), IDENTITY);
}

TEST_F(JoybusTest, RepeatedNoiseKeepsDiscardingUntilStopBit) {
  link.send_frame({cmd_poll}, false);
  link.send_symbol(line_symbol::noise);
  link.send_symbol(line_symbol::noise);
  // Would read as an identify request if the second noise ended the resync
  link.send_byte(cmd_identify);
  link.send_symbol(line_symbol::stop);
  run(link, protocol);

  EXPECT_TRUE(link.responses().empty());
  EXPECT_EQ(protocol.stats().dropped_noise, 1u);
  EXPECT_EQ(protocol.stats().dropped_unknown_command, 0u);
  EXPECT_EQ(exchange({cmd_identify}), IDENTITY);
}

TEST_F(JoybusTest, QuietLineEndsResyncAfterNoise) {
  link.send_frame({cmd_poll}, false);
  link.send_symbol(line_symbol::noise);
  run(link, protocol);

  // No stop bit followed the noise, the gap alone ends the resync
  EXPECT_EQ(exchange({cmd_identify}), IDENTITY);
  EXPECT_EQ(protocol.stats().dropped_noise, 1u);
}

TEST_F(JoybusTest, NoiseOnIdleLineIsIgnored) {
  link.send_frame({}, false);
  link.send_symbol(line_symbol::noise);
  run(link, protocol);

  EXPECT_EQ(protocol.stats().dropped_noise, 0u);
  EXPECT_EQ(exchange({cmd_identify}), IDENTITY);
}

TEST_F(JoybusTest, StopMidByteIsFramingError) {
  link.send_frame({cmd_poll}, false);
  link.send_symbol(line_symbol::one);
  link.send_symbol(line_symbol::zero);
  link.send_symbol(line_symbol::stop);
  run(link, protocol);

  EXPECT_TRUE(link.responses().empty());
  EXPECT_EQ(protocol.stats().dropped_framing, 1u);
  EXPECT_EQ(protocol.current_state(), protocol_state::idle);
}

TEST_F(JoybusTest, OriginBitReportedUntilOriginRequested) {
  std::vector<uint8_t> before = exchange({cmd_poll, 0x00, 0x00});
  EXPECT_EQ(before[0] & 0x20, 0x20);
  EXPECT_TRUE(protocol.origin_pending());

  std::vector<uint8_t> origin = exchange({cmd_origin});
  EXPECT_EQ(origin[0] & 0x20, 0x00);
  EXPECT_FALSE(protocol.origin_pending());

  std::vector<uint8_t> after = exchange({cmd_poll, 0x00, 0x00});
  EXPECT_EQ(after[0] & 0x20, 0x00);
  EXPECT_EQ(after[1] & 0x80, 0x80);
}

TEST_F(JoybusTest, OriginReportsCalibrationOriginWithLiveButtons) {
  controller_state state;
  state.buttons = 1 << START;
  state.analog_sticks.l_stick = {0xF0, 0x10};
  state.analog_triggers = {0x40, 0x50};
  store.publish(state);

  std::vector<uint8_t> origin = exchange({cmd_origin});
  ASSERT_EQ(origin.size(), 10u);
  EXPECT_EQ(origin[0], 0x10);
  EXPECT_EQ(origin[1], 0x80);
  EXPECT_EQ(origin[2], CENTER);
  EXPECT_EQ(origin[3], CENTER);
  EXPECT_EQ(origin[6], 0x00);
  EXPECT_EQ(origin[7], 0x00);
}

TEST_F(JoybusTest, RecalibrateReplacesOrigin) {
  controller_state state;
  state.analog_sticks.l_stick = {0x85, 0x7A};
  state.analog_sticks.r_stick = {0x81, 0x7F};
  state.analog_triggers = {0x12, 0x15};
  store.publish(state);

  std::vector<uint8_t> recalibrate = exchange({cmd_recalibrate, 0x00, 0x00});
  ASSERT_EQ(recalibrate.size(), 10u);
  EXPECT_EQ(recalibrate[2], 0x85);
  EXPECT_FALSE(protocol.origin_pending());
  EXPECT_EQ(protocol.origin().analog_sticks.l_stick.x, 0x85);

  // Origin now reports the recalibrated values even after the stick moves
  state.analog_sticks.l_stick = {0x00, 0x00};
  store.publish(state);
  std::vector<uint8_t> origin = exchange({cmd_origin});
  EXPECT_EQ(origin[2], 0x85);
  EXPECT_EQ(origin[3], 0x7A);
  EXPECT_EQ(origin[4], 0x81);
  EXPECT_EQ(origin[5], 0x7F);
  EXPECT_EQ(origin[6], 0x12);
  EXPECT_EQ(origin[7], 0x15);
}

TEST_F(JoybusTest, ResetRestoresOriginBitAndStopsRumble) {
  exchange({cmd_origin});
  exchange({cmd_poll, 0x03, 0x01});
  EXPECT_EQ(store.rumble(), rumble_start);

  EXPECT_EQ(exchange({cmd_reset}), IDENTITY);
  EXPECT_TRUE(protocol.origin_pending());
  EXPECT_EQ(store.rumble(), rumble_stop);

  std::vector<uint8_t> poll = exchange({cmd_poll, 0x03, 0x00});
  EXPECT_EQ(poll[0] & 0x20, 0x20);
}

TEST_F(JoybusTest, RumbleFollowsLowBitsOfRumbleByte) {
  exchange({cmd_poll, 0x03, 0x01});
  EXPECT_EQ(store.rumble(), rumble_start);
  exchange({cmd_long_poll, 0x00, 0x02});
  EXPECT_EQ(store.rumble(), rumble_brake);
  exchange({cmd_poll, 0x03, 0xFC});
  EXPECT_EQ(store.rumble(), rumble_stop);

  EXPECT_EQ(logged(),
            (std::vector<log_event>{log_event::rumble_changed,
                                    log_event::rumble_changed,
                                    log_event::rumble_changed}));

  // Repeating the same mode is not logged
  exchange({cmd_poll, 0x03, 0x00});
  EXPECT_TRUE(logged().empty());
}

TEST_F(JoybusTest, PollModeAboveFourUsesModeZero) {
  controller_state state;
  state.analog_triggers = {0xA0, 0x50};
  store.publish(state);

  std::vector<uint8_t> response = exchange({cmd_poll, 0x07, 0x00});
  ASSERT_EQ(response.size(), 8u);
  EXPECT_EQ(response[6], 0xA5);
  EXPECT_EQ(response[7], 0x00);
}

TEST_F(JoybusTest, PollModeSelectsLayout) {
  controller_state state;
  state.analog_sticks.r_stick = {0xAB, 0xCD};
  state.analog_triggers = {0x9F, 0x6E};
  store.publish(state);

  std::vector<uint8_t> mode3 = exchange({cmd_poll, 0x03, 0x00});
  EXPECT_EQ(mode3[4], 0xAB);
  EXPECT_EQ(mode3[6], 0x9F);
  EXPECT_EQ(mode3[7], 0x6E);

  std::vector<uint8_t> mode1 = exchange({cmd_poll, 0x01, 0x00});
  EXPECT_EQ(mode1[4], 0xAC);
  EXPECT_EQ(mode1[5], 0x9F);
}

TEST_F(JoybusTest, ResponseUsesOneConsistentSnapshot) {
  controller_state state;
  state.buttons = (1 << B) | (1 << DPAD_UP);
  state.analog_sticks.l_stick = {0x01, 0x02};
  state.analog_sticks.r_stick = {0x03, 0x04};
  state.analog_triggers = {0x05, 0x06};
  store.publish(state);
  exchange({cmd_origin});

  std::vector<uint8_t> response = exchange({cmd_long_poll, 0x00, 0x00});
  EXPECT_EQ(response, (std::vector<uint8_t>{0x02, 0x88, 0x01, 0x02, 0x03,
                                            0x04, 0x05, 0x06, 0x00, 0x00}));
}

TEST_F(JoybusTest, TurnaroundWithinDeadline) {
  exchange({cmd_poll, 0x03, 0x00});
  EXPECT_LE(protocol.stats().last_turnaround_us, RESPONSE_DEADLINE_US);
  EXPECT_EQ(protocol.stats().deadline_misses, 0u);
}

TEST_F(JoybusTest, SlowResponseCountsDeadlineMiss) {
  link.transmit_latency_us = RESPONSE_DEADLINE_US + 4;
  exchange({cmd_identify});

  EXPECT_EQ(protocol.stats().deadline_misses, 1u);
  EXPECT_EQ(protocol.stats().last_turnaround_us, RESPONSE_DEADLINE_US + 4);
  EXPECT_EQ(protocol.stats().max_turnaround_us, RESPONSE_DEADLINE_US + 4);
  EXPECT_EQ(logged(), (std::vector<log_event>{log_event::identify,
                                              log_event::deadline_missed}));
}

TEST_F(JoybusTest, WaitsForTransmissionBeforeListening) {
  link.transmit_busy_polls = 3;
  link.send_frame({cmd_identify});
  run(link, protocol);
  EXPECT_EQ(protocol.current_state(), protocol_state::transmitting);
  EXPECT_GE(link.discards, 1);

  while (protocol.current_state() == protocol_state::transmitting) {
    protocol.service();
  }
  EXPECT_EQ(protocol.current_state(), protocol_state::idle);
  EXPECT_EQ(exchange({cmd_identify}), IDENTITY);
}

TEST_F(JoybusTest, BackToBackExchanges) {
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(exchange({cmd_poll, 0x03, 0x00}).size(), 8u);
  }
  EXPECT_EQ(protocol.stats().responses, 20u);
  EXPECT_EQ(protocol.stats().dropped_overflow, 0u);
  EXPECT_EQ(protocol.stats().dropped_timeout, 0u);
}

TEST_F(JoybusTest, ConnectedWhileTheConsoleKeepsGettingResponses) {
  EXPECT_FALSE(protocol.connected());

  EXPECT_EQ(exchange({cmd_identify}), IDENTITY);
  EXPECT_TRUE(protocol.connected());

  link.advance(CONNECTION_TIMEOUT_US / 2);
  EXPECT_TRUE(protocol.connected());
  exchange({cmd_poll, 0x03, 0x00});
  link.advance(CONNECTION_TIMEOUT_US / 2);
  EXPECT_TRUE(protocol.connected());

  link.advance(CONNECTION_TIMEOUT_US);
  EXPECT_FALSE(protocol.connected());
}

TEST_F(JoybusTest, DroppedRequestsDoNotConnect) {
  EXPECT_TRUE(exchange({0x54}).empty());
  EXPECT_TRUE(exchange({cmd_poll, 0x03}).empty());
  EXPECT_FALSE(protocol.connected());
}

TEST_F(JoybusTest, WorksWithoutEventLog) {
  joybus_protocol quiet(link, store);
  link.send_frame({cmd_poll});
  link.send_symbol(line_symbol::stop);
  run(link, quiet);
  EXPECT_EQ(quiet.stats().dropped_length_mismatch, 1u);
}
