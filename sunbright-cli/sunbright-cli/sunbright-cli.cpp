// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <fmt/core.h>
#include <CLI/App.hpp>
#include <CLI/Formatter.hpp>
#include <CLI/Config.hpp>

#include <sunbrightd/api.hpp>
#include <sunbrightd/config.hpp>
#include <sunbrightd/constants.hpp>
#include <sunbrightd/ddc.hpp>
#include <sunbrightd/errors.hpp>
#include <sunbrightd/file.hpp>
#include <sunbrightd/schedule.hpp>
#include <sunbrightd/sd-dbus.hpp>
#include <sunbrightd/time.hpp>

void stop() {
    if (sunbrightd::daemon_stop()) {
        std::puts("sunbrightd stopped");
    } else {
        std::puts("already stopped");
    }
	std::exit(EXIT_SUCCESS);
}

void status() {
    if (sunbrightd::daemon_is_running()) {
        std::puts("running");
        std::fputs(sunbrightd::daemon_get("status").c_str(), stdout);
    } else {
        std::puts("not running");
    }
	std::exit(EXIT_SUCCESS);
}

sunbrightd::config load_config() {
    try {
        sunbrightd::config conf(sunbrightd::config::default_filepath(), {});
        sunbrightd::set_timezone(conf.location.timezone);
        return conf;
    } catch (const sunbrightd::config_error &e) {
        fmt::print(stderr, "config error: {}\n", e.what());
        std::exit(EXIT_FAILURE);
    }
}

void apply() {
    const sunbrightd::config conf = load_config();
    const sunbrightd::lockfile pass_lock(sunbrightd::xdg_runtime_dir() / sunbrightd::constants::pass_lock_filename);

    try {
        ddc::bus bus;
        sunbrightd::dbus::notifier notify;
        const sunbrightd::run_result result = sunbrightd::brightness_pass(conf, bus, &notify, pass_lock, std::time(nullptr));
        std::fputs(result.summary().c_str(), stdout);
        std::exit(result.failures() > 0 ? EXIT_FAILURE : EXIT_SUCCESS);
    } catch (const sunbrightd::already_running &e) {
        std::puts("a brightness pass is already in progress");
        std::exit(EXIT_SUCCESS);
    } catch (const sunbrightd::error &e) {
        fmt::print(stderr, "{}\n", e.what());
        std::exit(EXIT_FAILURE);
    } catch (const std::system_error &e) {
        fmt::print(stderr, "{}\n", e.what());
        std::exit(EXIT_FAILURE);
    }
}

void schedule(int day, int night) {
    const sunbrightd::config conf = load_config();
    const std::time_t now = std::time(nullptr);
    const sunbrightd::season s = conf.seasons()(sunbrightd::local_date(now));

    sunbrightd::brightness_profile profile = conf.default_profile.get(s);
    if (day >= 0)
        profile.day_brightness = day;
    if (night >= 0)
        profile.night_brightness = night;

    fmt::print("season: {}, day: {}%, night: {}%, steps: {}, offset: {} min\n",
               sunbrightd::season_name(s), profile.day_brightness, profile.night_brightness, conf.adjust_steps, conf.sunrise_sunset_offset);

    try {
        std::fputs(sunbrightd::describe_schedule(conf, profile, now).c_str(), stdout);
    } catch (const sunbrightd::error &e) {
        fmt::print(stderr, "{}\n", e.what());
        std::exit(EXIT_FAILURE);
    }
    std::exit(EXIT_SUCCESS);
}

int interface(int argc, char **argv)
{
    CLI::App app("Sets external monitor brightness following the sun.", "sunbright");

	app.add_flag("-v,--version", [] ([[maybe_unused]] int64_t t) {
		std::puts(SUNBRIGHT_VERSION);
		std::exit(0);
	}, "Print version and exit");

    int steps    = 0;
    int interval = 0;
    int offset   = 0;

    const auto start_cmd = app.add_subcommand("start", "Start the background process.");
    const auto steps_opt = start_cmd->add_option("--steps", steps, "Adjustment steps inside each transition window.")
            ->check(CLI::Range(sunbrightd::constants::adjust_steps_min, sunbrightd::constants::adjust_steps_max));
    const auto interval_opt = start_cmd->add_option("--interval", interval, "Minutes between brightness passes.")
            ->check(CLI::IsMember(std::vector<int>(sunbrightd::constants::cron_intervals.begin(), sunbrightd::constants::cron_intervals.end())));
    const auto offset_opt = start_cmd->add_option("--offset", offset, "Minutes the ramps extend past sunrise and before sunset.")
            ->check(CLI::Range(sunbrightd::constants::offset_minutes_min, sunbrightd::constants::offset_minutes_max));
    start_cmd->callback([&] {
        std::vector<std::string> args;
        if (*steps_opt)
            args.insert(args.end(), {"--steps", std::to_string(steps)});
        if (*interval_opt)
            args.insert(args.end(), {"--interval", std::to_string(interval)});
        if (*offset_opt)
            args.insert(args.end(), {"--offset", std::to_string(offset)});
        if (!sunbrightd::daemon_start(args))
            std::puts("already started");
        std::exit(EXIT_SUCCESS);
    });

	app.add_subcommand("stop", "Stop the background process.")->callback(stop);
	app.add_subcommand("status", "Show the background process status and its last pass.")->callback(status);
	app.add_subcommand("apply", "Adjust the brightness now, without the background process.")->callback(apply);

    int day   = -1;
    int night = -1;
    const CLI::Range brightness_range(sunbrightd::constants::brightness_min, sunbrightd::constants::brightness_max);
    const auto schedule_cmd = app.add_subcommand("schedule", "Print today's brightness schedule.");
    schedule_cmd->add_option("-d,--day", day, "Day brightness percentage (default: this season's default profile).")->check(brightness_range);
    schedule_cmd->add_option("-n,--night", night, "Night brightness percentage (default: this season's default profile).")->check(brightness_range);
    schedule_cmd->callback([&] { schedule(day, night); });

    spdlog::debug("parsing options...");
	try {
		if (argc == 1) {
			app.parse("-h");
		} else {
			app.parse(argc, argv);
		}
	} catch (const CLI::ParseError &e) {
		return app.exit(e);
	}

	return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();
    return interface(argc, argv);
}
