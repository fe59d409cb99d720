// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <sunbrightd/config.hpp>
#include <sunbrightd/constants.hpp>
#include <sunbrightd/errors.hpp>
#include <sunbrightd/file.hpp>
#include <sunbrightd/time.hpp>

using nlohmann::json;
using namespace sunbrightd;

namespace {

json profile_to_json(brightness_profile p) {
    return {
        {"day_brightness", p.day_brightness},
        {"night_brightness", p.night_brightness},
    };
}

brightness_profile profile_from_json(const json &in, brightness_profile fallback) {
    return {
        in.value("day_brightness", fallback.day_brightness),
        in.value("night_brightness", fallback.night_brightness),
    };
}

brightness_profile profile_from_json(const json &in) {
    return {
        in.at("day_brightness").get<double>(),
        in.at("night_brightness").get<double>(),
    };
}

void check_brightness(const std::string &what, brightness_profile p) {
    using namespace constants;
    for (const double val : {p.day_brightness, p.night_brightness}) {
        if (val < brightness_min || val > brightness_max) {
            throw config_error(fmt::format("{}: brightness {} not in range [{} - {}]", what, val, brightness_min, brightness_max));
        }
    }
}

}

void config::defaults()
{
    location.city      = "Bremen";
    location.country   = "Germany";
    location.timezone  = "Europe/Berlin";
    location.latitude  = 53.075144;
    location.longitude = 8.802161;

    fallback_day.start = "07:00";
    fallback_day.end   = "19:00";

    adjust_steps          = 5;
    cron_interval         = 12;
    sunrise_sunset_offset = 60;
    single_step_mode      = step_mode::PLATEAU;
    season_policy         = "month";
    hemisphere            = "north";

    default_profile.summer = {100, 60};
    default_profile.winter = {90, 60};

    monitors = profile_table();
}

config::config()
{
    defaults();
}

config::config(std::filesystem::path filepath, const overrides &ovr)
    : filepath_(std::move(filepath))
{
    defaults();

    file_parse();

    apply(ovr);

    validate();
}

config::config(const json &in, const overrides &ovr)
{
    defaults();

    from_json(in);

    apply(ovr);

    validate();
}

void config::from_json(const json &in)
{
    try {
        location.city      = in.value("city", location.city);
        location.country   = in.value("country", location.country);
        location.timezone  = in.value("timezone", location.timezone);
        location.latitude  = in.value("latitude", location.latitude);
        location.longitude = in.value("longitude", location.longitude);

        adjust_steps          = in.value("adjust_steps", adjust_steps);
        cron_interval         = in.value("cron_interval", cron_interval);
        sunrise_sunset_offset = in.value("sunrise_sunset_offset", sunrise_sunset_offset);
        season_policy         = in.value("season_policy", season_policy);
        hemisphere            = in.value("hemisphere", hemisphere);

        if (in.contains("single_step_mode")) {
            single_step_mode = step_mode_from_name(in["single_step_mode"].get<std::string>());
        }

        if (in.contains("fallback_day")) {
            fallback_day.start = in["fallback_day"].value("start", fallback_day.start);
            fallback_day.end   = in["fallback_day"].value("end", fallback_day.end);
        }

        if (in.contains("default")) {
            const json &def = in["default"];
            if (def.contains("summer"))
                default_profile.summer = profile_from_json(def["summer"], default_profile.summer);
            if (def.contains("winter"))
                default_profile.winter = profile_from_json(def["winter"], default_profile.winter);
        }

        if (in.contains("monitors")) {
            for (const auto &[model, data] : in["monitors"].items()) {
                monitor_entry entry;
                entry.model  = model;
                entry.serial = data.value("serial", "");
                if (data.contains("summer"))
                    entry.profiles.summer = profile_from_json(data["summer"]);
                if (data.contains("winter"))
                    entry.profiles.winter = profile_from_json(data["winter"]);
                monitors.add(std::move(entry));
            }
        }
    } catch (const json::exception &e) {
        throw config_error(fmt::format("invalid config: {}", e.what()));
    } catch (const std::invalid_argument &e) {
        throw config_error(fmt::format("invalid config: {}", e.what()));
    }
}

json config::to_json() const
{
    json ret {
        {"city", location.city},
        {"country", location.country},
        {"timezone", location.timezone},
        {"latitude", location.latitude},
        {"longitude", location.longitude},
        {"adjust_steps", adjust_steps},
        {"cron_interval", cron_interval},
        {"sunrise_sunset_offset", sunrise_sunset_offset},
        {"single_step_mode", step_mode_name(single_step_mode)},
        {"season_policy", season_policy},
        {"hemisphere", hemisphere},

        {"fallback_day", {
                {"start", fallback_day.start},
                {"end", fallback_day.end},
        }},

        {"default", {
                {"summer", profile_to_json(default_profile.summer)},
                {"winter", profile_to_json(default_profile.winter)},
        }},

        {"monitors", json::object()},
    };

    for (const auto &[serial, entry] : monitors.entries()) {
        json m {{"serial", serial}};
        if (entry.profiles.summer)
            m["summer"] = profile_to_json(*entry.profiles.summer);
        if (entry.profiles.winter)
            m["winter"] = profile_to_json(*entry.profiles.winter);
        ret["monitors"][entry.model] = m;
    }

    return ret;
}

void config::apply(const overrides &ovr)
{
    if (ovr.adjust_steps)
        adjust_steps = *ovr.adjust_steps;
    if (ovr.cron_interval)
        cron_interval = *ovr.cron_interval;
    if (ovr.sunrise_sunset_offset)
        sunrise_sunset_offset = *ovr.sunrise_sunset_offset;
}

void config::validate() const
{
    using namespace constants;

    if (adjust_steps < adjust_steps_min || adjust_steps > adjust_steps_max) {
        throw config_error(fmt::format("Number of steps must be in the range of {} - {}", adjust_steps_min, adjust_steps_max));
    }

    if (std::ranges::find(cron_intervals, cron_interval) == cron_intervals.end()) {
        throw config_error(fmt::format("Cron interval can be one of {} min", fmt::join(cron_intervals, ", ")));
    }

    if (sunrise_sunset_offset < offset_minutes_min || sunrise_sunset_offset > offset_minutes_max) {
        throw config_error(fmt::format("Sunrise and sunset offset must be in the range of {} - {}", offset_minutes_min, offset_minutes_max));
    }

    if (location.latitude < -90 || location.latitude > 90) {
        throw config_error(fmt::format("latitude {} not in range [-90 - 90]", location.latitude));
    }

    if (location.longitude < -180 || location.longitude > 180) {
        throw config_error(fmt::format("longitude {} not in range [-180 - 180]", location.longitude));
    }

    if (season_policy != "month" && season_policy != "equinox") {
        throw config_error(fmt::format("season_policy can be 'month' or 'equinox', not '{}'", season_policy));
    }

    if (hemisphere != "north" && hemisphere != "south") {
        throw config_error(fmt::format("hemisphere can be 'north' or 'south', not '{}'", hemisphere));
    }

    try {
        const clock_time start = parse_clock(fallback_day.start);
        const clock_time end   = parse_clock(fallback_day.end);
        if (start.hour * 60 + start.minute >= end.hour * 60 + end.minute) {
            throw config_error(fmt::format("fallback_day: start {} is not before end {}", fallback_day.start, fallback_day.end));
        }
    } catch (const std::invalid_argument &e) {
        throw config_error(fmt::format("fallback_day: {}", e.what()));
    }

    check_brightness("default.summer", default_profile.summer);
    check_brightness("default.winter", default_profile.winter);

    for (const auto &[serial, entry] : monitors.entries()) {
        if (!entry.profiles.complete()) {
            throw config_error(fmt::format("monitor '{}' (serial {}) needs both a summer and a winter profile", entry.model, serial));
        }
        check_brightness(entry.model + ".summer", *entry.profiles.summer);
        check_brightness(entry.model + ".winter", *entry.profiles.winter);
    }
}

season_resolver config::seasons() const
{
    season_resolver resolver = season_policy == "equinox" ? season_resolver(season_by_equinox) : season_resolver(season_by_month);
    return hemisphere == "south" ? southern_hemisphere(resolver) : resolver;
}

const std::filesystem::path &config::filepath() const
{
    return filepath_;
}

std::filesystem::path config::default_filepath()
{
    const std::string path = env("SUNBRIGHT_CONFIG_PATH");
    if (!path.empty())
        return path;
    return xdg_config_dir() / constants::config_dirname / constants::config_filename;
}

void config::file_pretty_write() const
{
    std::filesystem::create_directories(filepath_.parent_path());
    std::ofstream fs(filepath_);
    fs.exceptions(std::fstream::failbit);
    fs << std::setw(4) << config::to_json();
}

void config::file_parse()
{
    if (!std::filesystem::exists(filepath_)) {
        spdlog::warn("[config] {} not found, writing defaults", filepath_);
        try {
            file_pretty_write();
        } catch (const std::exception &e) {
            spdlog::error("[config] could not write {}: {}", filepath_, e.what());
        }
        return;
    }

    spdlog::info("[config] reading {}", filepath_);

    const json jdata = [&] {
        try {
            return json::parse(file_read(filepath_));
        } catch (const json::exception &e) {
            spdlog::error("[config] syntax error, using the defaults: {}", e.what());
            return json();
        }
    }();

    if (!jdata.empty()) {
        from_json(jdata);
    }
}
