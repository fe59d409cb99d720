// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>
#include <sunbrightd/errors.hpp>
#include <sunbrightd/profile.hpp>

using namespace sunbrightd;

namespace {

const default_profiles defaults { {100, 60}, {90, 50} };

profile_table make_table() {
	profile_table table;
	table.add({"DELL U2720Q", "ABC123", { brightness_profile{80, 30}, brightness_profile{70, 20} }});
	table.add({"LG 27UL850", "XYZ789", { std::nullopt, brightness_profile{75, 25} }});
	return table;
}

}

TEST(ProfileResolver, UnknownSerialUsesDefault) {
	const profile_table table = make_table();
	const monitor_identity unknown {"DELL U2720Q", "NOPE", 1};

	const brightness_profile summer = resolve_profile(unknown, season::SUMMER, table, defaults);
	EXPECT_EQ(summer.day_brightness, 100);
	EXPECT_EQ(summer.night_brightness, 60);

	const brightness_profile winter = resolve_profile(unknown, season::WINTER, table, defaults);
	EXPECT_EQ(winter.day_brightness, 90);
	EXPECT_EQ(winter.night_brightness, 50);
}

TEST(ProfileResolver, MatchesOnSerialOnly) {
	const profile_table table = make_table();
	const monitor_identity renamed {"some other model", "ABC123", 2};

	const brightness_profile p = resolve_profile(renamed, season::WINTER, table, defaults);
	EXPECT_EQ(p.day_brightness, 70);
	EXPECT_EQ(p.night_brightness, 20);
}

TEST(ProfileResolver, MissingSeason) {
	const profile_table table = make_table();
	const monitor_identity lg {"LG 27UL850", "XYZ789", 1};

	EXPECT_THROW(resolve_profile(lg, season::SUMMER, table, defaults), missing_season_profile);
	EXPECT_EQ(resolve_profile(lg, season::WINTER, table, defaults).day_brightness, 75);
}

TEST(ProfileTable, RejectsDuplicateSerial) {
	profile_table table = make_table();
	EXPECT_THROW(table.add({"another", "ABC123", {}}), config_error);
	EXPECT_EQ(table.size(), 2u);
	EXPECT_EQ(table.find("ABC123")->model, "DELL U2720Q");
}

TEST(ProfileTable, RejectsEmptySerial) {
	profile_table table;
	EXPECT_THROW(table.add({"no serial", "", {}}), config_error);
	EXPECT_EQ(table.size(), 0u);
}

TEST(ProfileTable, Complete) {
	const profile_table table = make_table();
	EXPECT_TRUE(table.find("ABC123")->profiles.complete());
	EXPECT_FALSE(table.find("XYZ789")->profiles.complete());
	EXPECT_EQ(table.find("missing"), nullptr);
}
