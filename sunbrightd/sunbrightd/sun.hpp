// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SUN_HPP
#define SUN_HPP

#include <ctime>
#include <string>
#include <sunbrightd/solar.hpp>

namespace sunbrightd {

class solar_calculator {
	double latitude_;
	double longitude_;

	std::time_t crossing(std::time_t lo, std::time_t hi, double altitude) const;
public:
	solar_calculator(double latitude, double longitude);

	// Sun altitude in degrees at t.
	double altitude(std::time_t t) const;

	// Civil dawn, sunrise, sunset and civil dusk on the local date of `day`.
	// Without civil twilight, dawn is sunrise and dusk is sunset.
	// Throws no_solar_event if the sun does not rise or set on that date.
	solar_instants instants(std::time_t day) const;
};

// dawn = sunrise = start, sunset = dusk = end, on the local date of `day`.
solar_instants fixed_instants(std::time_t day, const std::string &start, const std::string &end);

}

#endif // SUN_HPP
