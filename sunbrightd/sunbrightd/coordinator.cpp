// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <sunbrightd/coordinator.hpp>
#include <sunbrightd/curve.hpp>
#include <sunbrightd/errors.hpp>
#include <sunbrightd/profile.hpp>
#include <sunbrightd/time.hpp>

namespace sunbrightd {

bool monitor_outcome::ok() const {
    return error.empty();
}

size_t run_result::failures() const {
    return std::ranges::count_if(outcomes, [] (const monitor_outcome &o) { return !o.ok(); });
}

std::string run_result::summary() const {
    std::string ret = fmt::format("[{}] season: {}\n", timestamp_fmt(time), season_name(current_season));
    for (const auto &o : outcomes) {
        if (o.ok()) {
            fmt::format_to(std::back_inserter(ret), "[display {}] {} ({}): {:.2f}%{}\n",
                           o.monitor.display, o.monitor.model, o.monitor.serial, *o.target, o.applied ? "" : " (unchanged)");
        } else {
            fmt::format_to(std::back_inserter(ret), "[display {}] {} ({}): error: {}\n",
                           o.monitor.display, o.monitor.model, o.monitor.serial, o.error);
        }
    }
    return ret;
}

run_coordinator::run_coordinator(const lockfile &guard, monitor_bus &bus)
    : guard_(guard), bus_(bus) {
}

run_result run_coordinator::run(std::time_t now, const solar_instants &sun, const config &conf) {
    std::optional<lockfile::token> token = guard_.try_acquire();
    if (!token) {
        throw already_running(fmt::format("another brightness pass is in progress (pid {})", guard_.owner()));
    }
    return process(*token, now, sun, conf);
}

run_result run_coordinator::process(const lockfile::token &token, std::time_t now, const solar_instants &sun, const config &conf) {
    if (!token.held()) {
        throw std::logic_error("brightness pass without the pass lock");
    }

    const solar_windows windows = build_windows(sun, std::chrono::minutes(conf.sunrise_sunset_offset));
    spdlog::debug("[pass] morning: {} - {}, evening: {} - {}",
                  clock_fmt(windows.morning.start()), clock_fmt(windows.morning.end()),
                  clock_fmt(windows.evening.start()), clock_fmt(windows.evening.end()));

    run_result result { now, conf.seasons()(local_date(now)), {} };
    spdlog::debug("[pass] season: {}", season_name(result.current_season));

    const std::vector<monitor_identity> monitors = bus_.monitors();
    result.outcomes.reserve(monitors.size());

    for (const auto &monitor : monitors) {
        monitor_outcome outcome { monitor, std::nullopt, false, "" };
        try {
            const brightness_profile profile = resolve_profile(monitor, result.current_season, conf.monitors, conf.default_profile);
            outcome.target  = evaluate(now, windows, profile, conf.adjust_steps, conf.single_step_mode);
            outcome.applied = bus_.set_brightness(monitor, *outcome.target);
            spdlog::debug("[pass] display {} ({}): {:.2f}% (day: {}, night: {})",
                          monitor.display, monitor.serial, *outcome.target, profile.day_brightness, profile.night_brightness);
        } catch (const missing_season_profile &e) {
            spdlog::error("[pass] display {}: {}", monitor.display, e.what());
            outcome.error = e.what();
        } catch (const device_error &e) {
            spdlog::error("[pass] display {}: {}", monitor.display, e.what());
            outcome.error = e.what();
        }
        result.outcomes.push_back(std::move(outcome));
    }

    return result;
}

}
