// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <chrono>
#include <gtest/gtest.h>
#include <sunbrightd/errors.hpp>
#include <sunbrightd/solar.hpp>

using namespace sunbrightd;
using namespace std::chrono_literals;

namespace {
constexpr std::time_t h = 3600;
constexpr std::time_t m = 60;
}

TEST(SolarWindows, Offset) {
    const solar_instants sun { 5 * h, 6 * h, 20 * h, 21 * h };
    const solar_windows w = build_windows(sun, 60min);
    EXPECT_EQ(w.morning.start(), 5 * h);
    EXPECT_EQ(w.morning.end(), 7 * h);
    EXPECT_EQ(w.evening.start(), 19 * h);
    EXPECT_EQ(w.evening.end(), 21 * h);
}

TEST(SolarWindows, NoOffset) {
    const solar_instants sun { 5 * h, 6 * h, 20 * h, 21 * h };
    const solar_windows w = build_windows(sun, 0min);
    EXPECT_EQ(w.morning.duration(), h);
    EXPECT_EQ(w.evening.duration(), h);
}

TEST(SolarWindows, DawnAfterSunrise) {
    const solar_instants sun { 6 * h + m, 6 * h, 20 * h, 21 * h };
    EXPECT_THROW(build_windows(sun, 30min), invalid_solar_ordering);
}

TEST(SolarWindows, SunsetAfterDusk) {
    const solar_instants sun { 5 * h, 6 * h, 21 * h + m, 21 * h };
    EXPECT_THROW(build_windows(sun, 30min), invalid_solar_ordering);
}

TEST(SolarWindows, OverlapAllowed) {
    // short winter day, long offset
    const solar_instants sun { 8 * h, 9 * h, 10 * h, 11 * h };
    const solar_windows w = build_windows(sun, 120min);
    EXPECT_EQ(w.morning.end(), 11 * h);
    EXPECT_EQ(w.evening.start(), 8 * h);
    EXPECT_GT(w.morning.end(), w.evening.start());
}

TEST(SolarWindows, DegenerateDay) {
    const solar_instants sun { 7 * h, 7 * h, 19 * h, 19 * h };
    const solar_windows w = build_windows(sun, 0min);
    EXPECT_EQ(w.morning.duration(), 0);
    EXPECT_EQ(w.evening.duration(), 0);
}
