// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <stdexcept>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sunbrightd/curve.hpp>
#include <sunbrightd/constants.hpp>

namespace sunbrightd {

std::string step_mode_name(step_mode mode) {
    switch (mode) {
    case step_mode::PLATEAU:
        return "plateau";
    case step_mode::JUMP:
        return "jump";
    }
    return "error: unknown step mode";
}

step_mode step_mode_from_name(const std::string &name) {
    if (name == "plateau")
        return step_mode::PLATEAU;
    if (name == "jump")
        return step_mode::JUMP;
    throw std::invalid_argument(fmt::format("unknown step mode '{}'", name));
}

double plateau_value(brightness_profile profile, int k, int steps) {
    const double t = double(k) / (steps + 1);
    return profile.night_brightness + t * (profile.day_brightness - profile.night_brightness);
}

double evaluate(std::time_t now,
                const transition_window &morning,
                const transition_window &evening,
                brightness_profile profile,
                int steps,
                step_mode mode) {

    const int s = std::clamp(steps, constants::adjust_steps_min, constants::adjust_steps_max);

    if (now < morning.start() || now >= evening.end()) {
        return profile.night_brightness;
    }

    if (now >= morning.end() && now < evening.start()) {
        return profile.day_brightness;
    }

    if (s == 1 && mode == step_mode::JUMP) {
        return profile.day_brightness;
    }

    if (morning.in_range(now)) {
        const std::time_t len = morning.duration();
        const int k = int(morning.time_since_start(now) * s / len) + 1;
        SPDLOG_TRACE("[curve] morning plateau {}/{}", k, s);
        return plateau_value(profile, std::clamp(k, 1, s), s);
    }

    // Plateaus are counted from the end of the window, so that the
    // one closest to dusk is the dimmest.
    const std::time_t len = evening.duration();
    const int k = int((evening.time_to_end(now) * s + len - 1) / len);
    SPDLOG_TRACE("[curve] evening plateau {}/{}", k, s);
    return plateau_value(profile, std::clamp(k, 1, s), s);
}

double evaluate(std::time_t now, const solar_windows &windows, brightness_profile profile, int steps, step_mode mode) {
    return evaluate(now, windows.morning, windows.evening, profile, steps, mode);
}

}
