// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SOLAR_HPP
#define SOLAR_HPP

#include <chrono>
#include <ctime>
#include <sunbrightd/time.hpp>

namespace sunbrightd {

struct solar_instants {
	std::time_t dawn;
	std::time_t sunrise;
	std::time_t sunset;
	std::time_t dusk;
};

struct solar_windows {
	transition_window morning;
	transition_window evening;
};

// morning: [dawn, sunrise + offset], evening: [sunset - offset, dusk].
// Throws invalid_solar_ordering if dawn > sunrise or sunset > dusk.
// The two windows are allowed to overlap.
solar_windows build_windows(const solar_instants &sun, std::chrono::minutes offset);

}

#endif // SOLAR_HPP
