// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <CLI/App.hpp>
#include <CLI/Formatter.hpp>
#include <CLI/Config.hpp>
#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <fmt/chrono.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <sdbus-c++/sdbus-c++.h>

#include <sunbrightd/file.hpp>
#include <sunbrightd/config.hpp>
#include <sunbrightd/constants.hpp>
#include <sunbrightd/ddc.hpp>
#include <sunbrightd/errors.hpp>
#include <sunbrightd/schedule.hpp>
#include <sunbrightd/sd-dbus.hpp>
#include <sunbrightd/time.hpp>

using namespace sunbrightd;

void jthread_wait_until(std::chrono::seconds s, std::stop_token stoken) {
    using namespace std::chrono;
    std::mutex mutex;
    std::unique_lock lock(mutex);
    std::condition_variable_any()
            .wait_until(lock, stoken, system_clock::now() + s, [&] { return stoken.stop_requested(); });
}

int message_loop(const config &conf) {
    const lockfile pass_lock(xdg_runtime_dir() / constants::pass_lock_filename);
    dbus::notifier notify;

    std::mutex status_mutex;
    std::string status = "no brightness pass yet\n";

    const auto pass = [&] (std::string_view trigger) {
        ddc::bus bus;
        const std::optional<std::string> result = triggered_pass(conf, bus, &notify, pass_lock, std::time(nullptr), trigger);
        if (result) {
            std::lock_guard lock(status_mutex);
            status = *result;
        }
    };

    named_pipe pipe(xdg_runtime_dir() / constants::fifo_filename);
    named_pipe reply_pipe(xdg_runtime_dir() / constants::reply_fifo_filename);

    const auto proxy = [&pipe] () -> std::unique_ptr<sdbus::IProxy> {
        try {
            return dbus::on_system_sleep([&pipe] (sdbus::Signal &sig) {
                bool sleep;
                sig >> sleep;
                if (!sleep)
                    file_write(pipe.path(), "apply");
            });
        } catch (const sdbus::Error &e) {
            spdlog::warn("[dbus] no resume notifications: {}", e.what());
            return nullptr;
        }
    }();

    std::jthread scheduler([&] (std::stop_token stoken) {
        while (true) {
            pass("scheduler");

            const std::time_t now  = std::time(nullptr);
            const std::time_t next = next_trigger(now, conf.cron_interval);
            spdlog::debug("[scheduler] next pass at {}", timestamp_fmt(next));

            jthread_wait_until(std::chrono::seconds(next - now), stoken);

            if (stoken.stop_requested()) {
                spdlog::debug("[scheduler] exit");
                return;
            }
        }
    });

    while (true) {
        std::string data(file_read(pipe.path()));
        while (!data.empty() && data.back() == '\n')
            data.pop_back();

        spdlog::debug("[pipe] received: {}", data);

        if (data == "stop")
            break;

        if (data == "apply") {
            pass("pipe");
            continue;
        }

        if (data == "status") {
            const std::string reply = [&] {
                std::lock_guard lock(status_mutex);
                return status;
            }();
            // Will block execution until the client reads from the pipe.
            file_write(reply_pipe.path(), reply);
            continue;
        }

        spdlog::warn("[pipe] unknown command: {}", data);
    }

    spdlog::debug("{:=^60}", "end");
    return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    CLI::App app("Sets external monitor brightness following the sun.", "sunbrightd");

    app.add_flag("-v,--version", [] ([[maybe_unused]] int64_t t) {
        std::puts(SUNBRIGHT_VERSION);
        std::exit(EXIT_SUCCESS);
    }, "Print version and exit");

    int steps    = 0;
    int interval = 0;
    int offset   = 0;
    std::string log_level;

    const auto steps_opt = app.add_option("--steps", steps, "Adjustment steps inside each transition window.")
            ->check(CLI::Range(constants::adjust_steps_min, constants::adjust_steps_max));
    const auto interval_opt = app.add_option("--interval", interval, "Minutes between brightness passes.")
            ->check(CLI::IsMember(std::vector<int>(constants::cron_intervals.begin(), constants::cron_intervals.end())));
    const auto offset_opt = app.add_option("--offset", offset, "Minutes the ramps extend past sunrise and before sunset.")
            ->check(CLI::Range(constants::offset_minutes_min, constants::offset_minutes_max));
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error, critical, off.");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    config::overrides ovr;
    if (*steps_opt)
        ovr.adjust_steps = steps;
    if (*interval_opt)
        ovr.cron_interval = interval;
    if (*offset_opt)
        ovr.sunrise_sunset_offset = offset;

    const std::filesystem::path log_dir = [] {
        const std::string dir = env("SUNBRIGHT_LOG_DIR");
        return dir.empty() ? xdg_state_dir() / "sunbrightd/logs" : std::filesystem::path(dir);
    }();

    std::filesystem::create_directories(log_dir);
    spdlog::set_default_logger(spdlog::rotating_logger_mt("sunbrightd", log_dir / "sunbrightd.log", 1048576 * 5, 3));
    spdlog::set_level(spdlog::level::warn);
    spdlog::cfg::load_env_levels();
    if (!log_level.empty())
        spdlog::set_level(spdlog::level::from_str(log_level));
    spdlog::flush_every(std::chrono::seconds(10));
    spdlog::flush_on(spdlog::level::err);
    spdlog::info("sunbrightd v{}", SUNBRIGHT_VERSION);

    const lockfile flock(xdg_runtime_dir() / constants::flock_filename);
    const std::optional<lockfile::token> token = flock.try_acquire();
    if (!token) {
        spdlog::error("another sunbrightd instance is running with pid {}", flock.owner());
        fmt::print(stderr, "sunbrightd is already running (pid {})\n", flock.owner());
        return EXIT_FAILURE;
    }

    const std::optional<config> conf = [&] () -> std::optional<config> {
        try {
            return config(config::default_filepath(), ovr);
        } catch (const config_error &e) {
            spdlog::critical("[config] {}", e.what());
            fmt::print(stderr, "config error: {}\n", e.what());
            return std::nullopt;
        }
    }();

    if (!conf) {
        return EXIT_FAILURE;
    }

    set_timezone(conf->location.timezone);
    spdlog::info("[config] {}", conf->to_json().dump());

    return message_loop(*conf);
}
