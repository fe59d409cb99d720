// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sunbrightd/solar.hpp>
#include <sunbrightd/errors.hpp>

namespace sunbrightd {

solar_windows build_windows(const solar_instants &sun, std::chrono::minutes offset) {
    if (sun.dawn > sun.sunrise) {
        throw invalid_solar_ordering(fmt::format("dawn ({}) is after sunrise ({})", timestamp_fmt(sun.dawn), timestamp_fmt(sun.sunrise)));
    }
    if (sun.sunset > sun.dusk) {
        throw invalid_solar_ordering(fmt::format("sunset ({}) is after dusk ({})", timestamp_fmt(sun.sunset), timestamp_fmt(sun.dusk)));
    }

    const std::time_t offset_s = std::chrono::duration_cast<std::chrono::seconds>(offset).count();

    solar_windows ret {
        transition_window(sun.dawn, sun.sunrise + offset_s),
        transition_window(sun.sunset - offset_s, sun.dusk),
    };

    if (ret.morning.end() > ret.evening.start()) {
        spdlog::debug("[windows] morning and evening windows overlap by {}s", ret.morning.end() - ret.evening.start());
    }

    return ret;
}

}
