// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <chrono>
#include <stdexcept>
#include <gtest/gtest.h>
#include <sunbrightd/time.hpp>

using namespace sunbrightd;

namespace {
// 2024-06-21 00:00:00 UTC
constexpr std::time_t midsummer = 1718928000;
}

TEST(ParseClock, Valid) {
    const clock_time t = parse_clock("07:05");
    EXPECT_EQ(t.hour, 7);
    EXPECT_EQ(t.minute, 5);

    EXPECT_EQ(parse_clock("00:00").hour, 0);
    EXPECT_EQ(parse_clock("23:59").minute, 59);
}

TEST(ParseClock, Invalid) {
    EXPECT_THROW(parse_clock(""), std::invalid_argument);
    EXPECT_THROW(parse_clock("7:05"), std::invalid_argument);
    EXPECT_THROW(parse_clock("24:00"), std::invalid_argument);
    EXPECT_THROW(parse_clock("12:60"), std::invalid_argument);
    EXPECT_THROW(parse_clock("12-30"), std::invalid_argument);
    EXPECT_THROW(parse_clock("ab:cd"), std::invalid_argument);
    EXPECT_THROW(parse_clock("+1:30"), std::invalid_argument);
}

TEST(Timestamp, Modify) {
    EXPECT_EQ(timestamp_modify(midsummer + 5000, 7, 30, 0), midsummer + 7 * 3600 + 30 * 60);
    EXPECT_EQ(local_midnight(midsummer + 86399), midsummer);
    EXPECT_EQ(add_day(midsummer), midsummer + 86400);
    EXPECT_EQ(clock_fmt(midsummer + 3600 + 120 + 3), "01:02:03");
}

TEST(Timestamp, LocalDate) {
    using namespace std::chrono;
    EXPECT_EQ(local_date(midsummer + 43200), year_month_day(year(2024), June, day(21)));
}

TEST(NextTrigger, AlignsToInterval) {
    // 10:07 -> 10:12
    EXPECT_EQ(next_trigger(midsummer + 10 * 3600 + 7 * 60, 12), midsummer + 10 * 3600 + 12 * 60);
    // exactly on a trigger, the next one
    EXPECT_EQ(next_trigger(midsummer + 10 * 3600 + 12 * 60, 12), midsummer + 10 * 3600 + 24 * 60);
    // 10:50 -> 11:00
    EXPECT_EQ(next_trigger(midsummer + 10 * 3600 + 50 * 60, 20), midsummer + 11 * 3600);
    // 23:45 -> 00:00 the next day
    EXPECT_EQ(next_trigger(midsummer + 23 * 3600 + 45 * 60, 15), midsummer + 86400);
}

TEST(NextTrigger, RejectsIntervals) {
    EXPECT_THROW(next_trigger(midsummer, 0), std::invalid_argument);
    EXPECT_THROW(next_trigger(midsummer, 7), std::invalid_argument);
    EXPECT_THROW(next_trigger(midsummer, 90), std::invalid_argument);
}

TEST(TransitionWindow, Range) {
    const transition_window w(100, 200);
    EXPECT_TRUE(w.in_range(100));
    EXPECT_TRUE(w.in_range(199));
    EXPECT_FALSE(w.in_range(200));
    EXPECT_FALSE(w.in_range(99));
    EXPECT_EQ(w.duration(), 100);
    EXPECT_EQ(w.time_since_start(150), 50);
    EXPECT_EQ(w.time_to_end(150), 50);
}

TEST(TransitionWindow, Empty) {
    const transition_window w(100, 100);
    EXPECT_FALSE(w.in_range(100));
    EXPECT_EQ(w.duration(), 0);
}

TEST(TransitionWindow, RejectsInvertedRange) {
    EXPECT_THROW(transition_window(200, 100), std::logic_error);
}
