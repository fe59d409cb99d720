// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>
#include <sunbrightd/errors.hpp>
#include <sunbrightd/sun.hpp>

using namespace sunbrightd;

namespace {

constexpr std::time_t h = 3600;
constexpr std::time_t m = 60;

// 00:00:00 UTC
constexpr std::time_t jun_21_2024 = 1718928000;
constexpr std::time_t dec_21_2024 = 1734739200;
constexpr std::time_t mar_20_2024 = 1710892800;

// Tolerance for the low precision solar position.
constexpr std::time_t tolerance = 15 * m;

}

TEST(SolarCalculator, BremenMidsummer) {
	const solar_calculator bremen(53.075144, 8.802161);
	const solar_instants sun = bremen.instants(jun_21_2024 + 12 * h);

	EXPECT_NEAR(double(sun.sunrise), double(jun_21_2024 + 3 * h), tolerance);
	EXPECT_NEAR(double(sun.sunset), double(jun_21_2024 + 20 * h), tolerance);

	EXPECT_LT(sun.dawn, sun.sunrise);
	EXPECT_LT(sun.sunrise, sun.sunset);
	EXPECT_LT(sun.sunset, sun.dusk);
}

TEST(SolarCalculator, BremenMidwinter) {
	const solar_calculator bremen(53.075144, 8.802161);
	const solar_instants sun = bremen.instants(dec_21_2024 + 12 * h);

	EXPECT_NEAR(double(sun.sunrise), double(dec_21_2024 + 7 * h + 40 * m), tolerance);
	EXPECT_NEAR(double(sun.sunset), double(dec_21_2024 + 15 * h + 10 * m), tolerance);
}

TEST(SolarCalculator, EquatorEquinox) {
	const solar_calculator equator(0, 0);
	const solar_instants sun = equator.instants(mar_20_2024 + 12 * h);

	EXPECT_NEAR(double(sun.sunrise), double(mar_20_2024 + 6 * h + 5 * m), tolerance);
	EXPECT_NEAR(double(sun.sunset), double(mar_20_2024 + 18 * h + 15 * m), tolerance);
	// civil twilight is short at the equator
	EXPECT_LT(sun.sunrise - sun.dawn, 30 * m);
}

TEST(SolarCalculator, InstantsOnTheSameDay) {
	const solar_calculator bremen(53.075144, 8.802161);
	const solar_instants early = bremen.instants(jun_21_2024);
	const solar_instants late  = bremen.instants(jun_21_2024 + 24 * h - 1);
	EXPECT_EQ(early.sunrise, late.sunrise);
	EXPECT_EQ(early.dusk, late.dusk);
}

TEST(SolarCalculator, AltitudeAtCrossings) {
	const solar_calculator bremen(53.075144, 8.802161);
	const solar_instants sun = bremen.instants(jun_21_2024);
	EXPECT_NEAR(bremen.altitude(sun.sunrise), -0.833, 0.01);
	EXPECT_NEAR(bremen.altitude(sun.dawn), -6.0, 0.01);
}

TEST(SolarCalculator, PolarDayAndNight) {
	const solar_calculator svalbard(80, 15);
	EXPECT_THROW(svalbard.instants(jun_21_2024), no_solar_event);
	EXPECT_THROW(svalbard.instants(dec_21_2024), no_solar_event);
}

TEST(SolarCalculator, WhiteNight) {
	// Trondheim: the sun sets but civil twilight lasts all night
	const solar_calculator trondheim(63.43, 10.39);
	solar_instants sun {};
	ASSERT_NO_THROW(sun = trondheim.instants(jun_21_2024 + 12 * h));

	EXPECT_NEAR(double(sun.sunrise), double(jun_21_2024 + 1 * h + 5 * m), tolerance);
	EXPECT_NEAR(double(sun.sunset), double(jun_21_2024 + 21 * h + 40 * m), tolerance);
	EXPECT_EQ(sun.dawn, sun.sunrise);
	EXPECT_EQ(sun.dusk, sun.sunset);

	// the sun is still up in the evening
	EXPECT_GT(trondheim.altitude(jun_21_2024 + 20 * h), 0);
	EXPECT_LT(jun_21_2024 + 20 * h, sun.sunset - 60 * m);
}

TEST(FixedInstants, Day) {
	const solar_instants sun = fixed_instants(jun_21_2024 + 15 * h, "07:00", "19:30");
	EXPECT_EQ(sun.dawn, jun_21_2024 + 7 * h);
	EXPECT_EQ(sun.sunrise, jun_21_2024 + 7 * h);
	EXPECT_EQ(sun.sunset, jun_21_2024 + 19 * h + 30 * m);
	EXPECT_EQ(sun.dusk, jun_21_2024 + 19 * h + 30 * m);
}
