// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef PROFILE_HPP
#define PROFILE_HPP

#include <map>
#include <optional>
#include <string>
#include <sunbrightd/monitor.hpp>
#include <sunbrightd/season.hpp>

namespace sunbrightd {

// Percentages. night > day is allowed and produces an inverted ramp.
struct brightness_profile {
	double day_brightness;
	double night_brightness;
};

struct season_profiles {
	std::optional<brightness_profile> summer;
	std::optional<brightness_profile> winter;

	const std::optional<brightness_profile> &get(season s) const;
	bool complete() const;
};

struct default_profiles {
	brightness_profile summer;
	brightness_profile winter;

	brightness_profile get(season s) const;
};

struct monitor_entry {
	std::string model;
	std::string serial;
	season_profiles profiles;
};

// Per-monitor profiles, keyed by serial.
class profile_table {
	std::map<std::string, monitor_entry> entries_;
public:
	// Throws config_error on an empty or duplicate serial.
	void add(monitor_entry entry);
	const monitor_entry *find(const std::string &serial) const;
	const std::map<std::string, monitor_entry> &entries() const;
	size_t size() const;
};

// Matches on the serial only. Unknown monitors get the default profile for the season.
// Throws missing_season_profile if the matching entry has no profile for the season.
brightness_profile resolve_profile(const monitor_identity &monitor,
                                   season s,
                                   const profile_table &table,
                                   const default_profiles &defaults);

}

#endif // PROFILE_HPP
