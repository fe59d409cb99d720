// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef COORDINATOR_HPP
#define COORDINATOR_HPP

#include <ctime>
#include <optional>
#include <string>
#include <vector>

#include <sunbrightd/config.hpp>
#include <sunbrightd/file.hpp>
#include <sunbrightd/monitor.hpp>
#include <sunbrightd/season.hpp>
#include <sunbrightd/solar.hpp>

namespace sunbrightd {

struct monitor_outcome {
	monitor_identity monitor;
	std::optional<double> target;
	bool applied;       // the device brightness was changed
	std::string error;  // empty on success

	bool ok() const;
};

// Outcome of one pass, in enumeration order.
struct run_result {
	std::time_t time;
	season current_season;
	std::vector<monitor_outcome> outcomes;

	size_t failures() const;
	std::string summary() const;
};

class run_coordinator {
	const lockfile &guard_;
	monitor_bus &bus_;

	run_result process(const lockfile::token &token, std::time_t now, const solar_instants &sun, const config &conf);
public:
	run_coordinator(const lockfile &guard, monitor_bus &bus);

	// Holds the guard for the whole pass, releasing it on every exit path.
	// Throws already_running if another pass holds it,
	// invalid_solar_ordering before any monitor is touched.
	// Failures of a single monitor are recorded in the result.
	run_result run(std::time_t now, const solar_instants &sun, const config &conf);
};

}

#endif // COORDINATOR_HPP
