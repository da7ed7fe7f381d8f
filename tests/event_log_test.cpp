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

#include "gcjoy/event_log.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(EventLogTest, PopsInOrder) {
  event_log log;
  EXPECT_TRUE(log.push({10, log_event::identify, 0}));
  EXPECT_TRUE(log.push({20, log_event::rumble_changed, 1}));

  log_record record;
  ASSERT_TRUE(log.pop(record));
  EXPECT_EQ(record.timestamp_us, 10u);
  EXPECT_EQ(record.event, log_event::identify);
  ASSERT_TRUE(log.pop(record));
  EXPECT_EQ(record.event, log_event::rumble_changed);
  EXPECT_EQ(record.detail, 1);
  EXPECT_FALSE(log.pop(record));
}

TEST(EventLogTest, FullRingDropsNewestAndCounts) {
  event_log log;
  for (size_t i = 0; i < event_log::CAPACITY - 1; ++i) {
    EXPECT_TRUE(log.push({static_cast<uint32_t>(i), log_event::origin, 0}));
  }
  EXPECT_FALSE(log.push({999, log_event::reset, 0}));
  EXPECT_EQ(log.dropped(), 1u);

  std::vector<uint32_t> timestamps;
  log.drain([&](const log_record &record) {
    timestamps.push_back(record.timestamp_us);
  });
  ASSERT_EQ(timestamps.size(), event_log::CAPACITY - 1);
  EXPECT_EQ(timestamps.front(), 0u);
  EXPECT_EQ(timestamps.back(), event_log::CAPACITY - 2);
}

TEST(EventLogTest, WrapsAround) {
  event_log log;
  log_record record;
  for (uint32_t i = 0; i < 3 * event_log::CAPACITY; ++i) {
    ASSERT_TRUE(log.push({i, log_event::identify, 0}));
    ASSERT_TRUE(log.pop(record));
    EXPECT_EQ(record.timestamp_us, i);
  }
  EXPECT_EQ(log.dropped(), 0u);
}

TEST(EventLogTest, DrainReportsCount) {
  event_log log;
  log.push({1, log_event::dropped_noise, 0});
  log.push({2, log_event::dropped_overflow, 0});
  EXPECT_EQ(log.drain([](const log_record &) {}), 2u);
  EXPECT_EQ(log.drain([](const log_record &) {}), 0u);
}

TEST(EventLogTest, EveryEventHasAName) {
  EXPECT_EQ(std::string(describe(log_event::identify)), "identify");
  EXPECT_EQ(std::string(describe(log_event::dropped_timeout)),
            "dropped: timed out mid-frame");
  EXPECT_EQ(std::string(describe(log_event::deadline_missed)),
            "response deadline missed");
}
