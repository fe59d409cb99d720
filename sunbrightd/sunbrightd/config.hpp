// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <optional>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>

#include <sunbrightd/curve.hpp>
#include <sunbrightd/profile.hpp>
#include <sunbrightd/season.hpp>

namespace sunbrightd {
class config {

	void defaults();

	void file_parse();
	void file_pretty_write() const;

	void from_json(const nlohmann::json &data);

    std::filesystem::path filepath_;
public:

    struct location {
        std::string city;
        std::string country;
        std::string timezone;
        double latitude;
        double longitude;
    } location;

    // Used when the sun does not rise or set on a given day.
    struct fallback_day {
        std::string start;
        std::string end;
    } fallback_day;

    int adjust_steps;
    int cron_interval;
    int sunrise_sunset_offset;
    step_mode single_step_mode;
    std::string season_policy;
    std::string hemisphere;

    default_profiles default_profile;
    profile_table monitors;

    // Command line values, applied on top of the file before validation.
    struct overrides {
        std::optional<int> adjust_steps;
        std::optional<int> cron_interval;
        std::optional<int> sunrise_sunset_offset;
    };

    // Defaults only.
    config();

    // Reads the file (writing the defaults if it does not exist),
    // applies the overrides and validates. Throws config_error.
    config(std::filesystem::path filepath, const overrides &ovr);

    config(const nlohmann::json &data, const overrides &ovr);

    nlohmann::json to_json() const;
    void apply(const overrides &ovr);

    // Throws config_error.
    void validate() const;

    season_resolver seasons() const;

    const std::filesystem::path &filepath() const;

    // $SUNBRIGHT_CONFIG_PATH or $XDG_CONFIG_HOME/sunbright/config.json
    static std::filesystem::path default_filepath();
};
}

#endif // CONFIG_HPP
