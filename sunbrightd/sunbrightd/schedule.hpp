// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SCHEDULE_HPP
#define SCHEDULE_HPP

#include <ctime>
#include <optional>
#include <string>
#include <string_view>

#include <sunbrightd/config.hpp>
#include <sunbrightd/coordinator.hpp>
#include <sunbrightd/file.hpp>
#include <sunbrightd/monitor.hpp>
#include <sunbrightd/solar.hpp>

namespace sunbrightd {

struct solar_day {
	solar_instants instants;
	bool fallback; // the sun does not rise or set today, instants come from config.fallback_day
};

solar_day todays_instants(const config &conf, std::time_t now);

// One brightness pass: solar instants for today, the coordinated run,
// and a notification for every monitor whose brightness changed.
// Throws already_running, invalid_solar_ordering.
run_result brightness_pass(const config &conf, monitor_bus &bus, notification_sink *notify, const lockfile &guard, std::time_t now);

// brightness_pass for the daemon's triggers: logs instead of throwing.
// Returns the status text for the pass, std::nullopt if it was skipped
// because another pass held the guard.
std::optional<std::string> triggered_pass(const config &conf, monitor_bus &bus, notification_sink *notify, const lockfile &guard, std::time_t now, std::string_view trigger);

// Human-readable plateau table for today, for the given profile.
std::string describe_schedule(const config &conf, brightness_profile profile, std::time_t now);

}

#endif // SCHEDULE_HPP
