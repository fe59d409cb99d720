// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cmath>
#include <optional>
#include <numbers>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sunbrightd/sun.hpp>
#include <sunbrightd/errors.hpp>
#include <sunbrightd/time.hpp>

namespace {

// Upper limb on the horizon, including refraction.
constexpr double sunrise_altitude  = -0.833;
constexpr double civil_twilight_altitude = -6.0;
constexpr std::time_t scan_step_s = 300;

double normalize_degrees(double angle) {
    angle = std::fmod(angle, 360.0);
    if (angle < 0) angle += 360.0;
    return angle;
}

double rad(double deg) {
    return deg * std::numbers::pi / 180.0;
}

double deg(double rad) {
    return rad * 180.0 / std::numbers::pi;
}

}

namespace sunbrightd {

solar_calculator::solar_calculator(double latitude, double longitude)
    : latitude_(latitude), longitude_(longitude) {
}

double solar_calculator::altitude(std::time_t t) const {
    // Days since J2000.0
    const double n = (double(t) / 86400.0 + 2440587.5) - 2451545.0;

    // Mean longitude and mean anomaly
    const double L = normalize_degrees(280.460 + 0.9856474 * n);
    const double g = rad(normalize_degrees(357.528 + 0.9856003 * n));

    // Ecliptic longitude and obliquity
    const double lambda  = rad(L + 1.915 * std::sin(g) + 0.020 * std::sin(2.0 * g));
    const double epsilon = rad(23.439 - 0.0000004 * n);

    // Right ascension and declination
    const double alpha = std::atan2(std::cos(epsilon) * std::sin(lambda), std::cos(lambda));
    const double delta = std::asin(std::sin(epsilon) * std::sin(lambda));

    // Local mean sidereal time, hour angle
    const double gmst = normalize_degrees(280.46061837 + 360.98564736629 * n);
    const double H    = rad(gmst + longitude_) - alpha;

    const double lat = rad(latitude_);
    return deg(std::asin(std::sin(lat) * std::sin(delta) + std::cos(lat) * std::cos(delta) * std::cos(H)));
}

// Bisects [lo, hi] down to one second. The altitude crosses `altitude` once inside it.
// Returns the first second on the other side of the crossing.
std::time_t solar_calculator::crossing(std::time_t lo, std::time_t hi, double altitude) const {
    const bool rising = this->altitude(lo) < altitude;
    while (hi - lo > 1) {
        const std::time_t mid = lo + (hi - lo) / 2;
        const bool below = this->altitude(mid) < altitude;
        if (below == rising)
            lo = mid;
        else
            hi = mid;
    }
    return hi;
}

solar_instants solar_calculator::instants(std::time_t day) const {
    const std::time_t start = local_midnight(day);
    const std::time_t end   = add_day(start);

    struct crossings {
        std::optional<std::time_t> rise;
        std::optional<std::time_t> set;
    };

    const auto scan = [&] (double altitude) {
        crossings ret;
        double prev = this->altitude(start) - altitude;
        for (std::time_t t = start + scan_step_s; t <= end; t += scan_step_s) {
            const double cur = this->altitude(t) - altitude;
            if (prev < 0 && cur >= 0 && !ret.rise) {
                ret.rise = crossing(t - scan_step_s, t, altitude);
            } else if (prev >= 0 && cur < 0) {
                ret.set = crossing(t - scan_step_s, t, altitude);
            }
            prev = cur;
        }
        return ret;
    };

    const crossings civil   = scan(civil_twilight_altitude);
    const crossings horizon = scan(sunrise_altitude);

    const auto require = [day] (const std::optional<std::time_t> &t, const char *what) {
        if (!t) {
            throw no_solar_event(fmt::format("no {} on {}", what, timestamp_fmt(day)));
        }
        return *t;
    };

    const std::time_t sunrise = require(horizon.rise, "sunrise");
    const std::time_t sunset  = require(horizon.set, "sunset");

    // White nights: the sun sets but never gets 6 degrees below the horizon.
    if (!civil.rise || !civil.set) {
        spdlog::debug("[sun] no civil twilight on {}, the windows start at sunrise and end at sunset", timestamp_fmt(day));
    }

    const solar_instants ret {
        std::min(civil.rise.value_or(sunrise), sunrise),
        sunrise,
        sunset,
        std::max(civil.set.value_or(sunset), sunset),
    };

    spdlog::debug("[sun] dawn: {}, sunrise: {}, sunset: {}, dusk: {}",
                  clock_fmt(ret.dawn), clock_fmt(ret.sunrise), clock_fmt(ret.sunset), clock_fmt(ret.dusk));
    return ret;
}

solar_instants fixed_instants(std::time_t day, const std::string &start, const std::string &end) {
    const clock_time s = parse_clock(start);
    const clock_time e = parse_clock(end);
    const std::time_t day_start = timestamp_modify(day, s.hour, s.minute, 0);
    const std::time_t day_end   = timestamp_modify(day, e.hour, e.minute, 0);
    return { day_start, day_start, day_end, day_end };
}

}
