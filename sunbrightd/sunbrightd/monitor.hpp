// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MONITOR_HPP
#define MONITOR_HPP

#include <string>
#include <vector>

namespace sunbrightd {

struct monitor_identity {
	std::string model;
	std::string serial;
	int display; // DDC display number, used to address the device only
};

// Device control seam: enumerates the connected monitors and sets their brightness.
class monitor_bus {
public:
	virtual ~monitor_bus() = default;
	virtual std::vector<monitor_identity> monitors() = 0;

	// Rounds and clamps the percentage to what the device accepts.
	// Returns false if the monitor was already at that brightness.
	// Throws device_error.
	virtual bool set_brightness(const monitor_identity &monitor, double percentage) = 0;
};

// Best-effort delivery of human-readable messages.
class notification_sink {
public:
	virtual ~notification_sink() = default;
	virtual void notify(const std::string &message) = 0;
};

}

#endif // MONITOR_HPP
