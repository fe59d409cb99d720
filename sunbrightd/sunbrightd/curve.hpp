// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CURVE_HPP
#define CURVE_HPP

#include <ctime>
#include <string>
#include <sunbrightd/profile.hpp>
#include <sunbrightd/solar.hpp>
#include <sunbrightd/time.hpp>

namespace sunbrightd {

// What a single adjustment step means inside a transition window.
enum class step_mode {
	PLATEAU, // one intermediate plateau halfway between night and day
	JUMP,    // straight to the day value at dawn, back to night at dusk
};

std::string step_mode_name(step_mode mode);
step_mode step_mode_from_name(const std::string &name);

// Value of plateau k (1-based) out of steps: night + k / (steps + 1) * (day - night).
double plateau_value(brightness_profile profile, int k, int steps);

// Target brightness percentage at `now`.
// Night before the morning window and from the end of the evening window,
// day between the two, and a staircase of `steps` equal-length plateaus inside each window:
// ascending in the morning, descending in the evening.
// If the windows overlap, the morning window takes precedence.
// The result is not rounded and always lies between the night and day values.
double evaluate(std::time_t now,
                const transition_window &morning,
                const transition_window &evening,
                brightness_profile profile,
                int steps,
                step_mode mode = step_mode::PLATEAU);

double evaluate(std::time_t now, const solar_windows &windows, brightness_profile profile, int steps, step_mode mode = step_mode::PLATEAU);

}

#endif // CURVE_HPP
