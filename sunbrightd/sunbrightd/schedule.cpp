// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <cmath>
#include <iterator>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sunbrightd/schedule.hpp>
#include <sunbrightd/constants.hpp>
#include <sunbrightd/curve.hpp>
#include <sunbrightd/errors.hpp>
#include <sunbrightd/sun.hpp>
#include <sunbrightd/time.hpp>

namespace sunbrightd {

solar_day todays_instants(const config &conf, std::time_t now) {
    const solar_calculator calc(conf.location.latitude, conf.location.longitude);
    try {
        return { calc.instants(now), false };
    } catch (const no_solar_event &e) {
        spdlog::warn("[sun] {}, using the fixed day {} - {}", e.what(), conf.fallback_day.start, conf.fallback_day.end);
        return { fixed_instants(now, conf.fallback_day.start, conf.fallback_day.end), true };
    }
}

run_result brightness_pass(const config &conf, monitor_bus &bus, notification_sink *notify, const lockfile &guard, std::time_t now) {
    const solar_day day = todays_instants(conf, now);

    run_coordinator coordinator(guard, bus);

    const run_result result = [&] {
        if (!day.fallback)
            return coordinator.run(now, day.instants, conf);
        // A fixed day has no twilight to ramp across.
        config fixed = conf;
        fixed.sunrise_sunset_offset = 0;
        return coordinator.run(now, day.instants, fixed);
    }();

    for (const auto &o : result.outcomes) {
        if (!o.ok() || !o.applied)
            continue;
        const int percent = int(std::lround(*o.target));
        spdlog::info("[pass] display {} brightness is set to: {}", o.monitor.display, percent);
        if (notify)
            notify->notify(fmt::format("Display {}: {}%", o.monitor.display, percent));
    }

    if (result.failures() > 0) {
        spdlog::warn("[pass] {} of {} monitor(s) failed", result.failures(), result.outcomes.size());
    }

    return result;
}

std::optional<std::string> triggered_pass(const config &conf, monitor_bus &bus, notification_sink *notify, const lockfile &guard, std::time_t now, std::string_view trigger) {
    try {
        return brightness_pass(conf, bus, notify, guard, now).summary();
    } catch (const already_running &e) {
        spdlog::info("[{}] pass skipped: {}", trigger, e.what());
        return std::nullopt;
    } catch (const sunbrightd::error &e) {
        spdlog::error("[{}] pass failed: {}", trigger, e.what());
        return fmt::format("[{}] last pass failed: {}\n", timestamp_fmt(now), e.what());
    } catch (const std::system_error &e) {
        spdlog::error("[{}] pass failed: {}", trigger, e.what());
        return fmt::format("[{}] last pass failed: {}\n", timestamp_fmt(now), e.what());
    }
}

std::string describe_schedule(const config &conf, brightness_profile profile, std::time_t now) {
    const solar_day day = todays_instants(conf, now);
    const int offset = day.fallback ? 0 : conf.sunrise_sunset_offset;
    const solar_windows w = build_windows(day.instants, std::chrono::minutes(offset));

    std::string ret;
    auto out = std::back_inserter(ret);

    fmt::format_to(out, "{}, {} ({:.4f}, {:.4f}){}\n",
                   conf.location.city, conf.location.country, conf.location.latitude, conf.location.longitude,
                   day.fallback ? " - no sunrise or sunset today, using the fixed day" : "");
    fmt::format_to(out, "dawn {}  sunrise {}  sunset {}  dusk {}\n",
                   clock_fmt(day.instants.dawn), clock_fmt(day.instants.sunrise),
                   clock_fmt(day.instants.sunset), clock_fmt(day.instants.dusk));

    // Plateau boundaries, plus the window ends.
    const auto print_window = [&] (const char *name, const transition_window &tw) {
        const int steps = std::clamp(conf.adjust_steps, constants::adjust_steps_min, constants::adjust_steps_max);
        fmt::format_to(out, "{} {} - {}\n", name, clock_fmt(tw.start()), clock_fmt(tw.end()));
        if (tw.duration() == 0)
            return;
        for (int i = 0; i < steps; ++i) {
            const std::time_t t = tw.start() + tw.duration() * i / steps;
            fmt::format_to(out, "  {}  {:6.2f}%\n", clock_fmt(t), evaluate(t, w, profile, conf.adjust_steps, conf.single_step_mode));
        }
        fmt::format_to(out, "  {}  {:6.2f}%\n", clock_fmt(tw.end()), evaluate(tw.end(), w, profile, conf.adjust_steps, conf.single_step_mode));
    };

    print_window("morning", w.morning);
    print_window("evening", w.evening);

    fmt::format_to(out, "now     {}  {:6.2f}%\n", clock_fmt(now), evaluate(now, w, profile, conf.adjust_steps, conf.single_step_mode));
    return ret;
}

}
