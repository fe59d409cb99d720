// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sunbrightd/profile.hpp>
#include <sunbrightd/errors.hpp>

namespace sunbrightd {

const std::optional<brightness_profile> &season_profiles::get(season s) const {
    return s == season::SUMMER ? summer : winter;
}

bool season_profiles::complete() const {
    return summer.has_value() && winter.has_value();
}

brightness_profile default_profiles::get(season s) const {
    return s == season::SUMMER ? summer : winter;
}

void profile_table::add(monitor_entry entry) {
    if (entry.serial.empty()) {
        throw config_error(fmt::format("monitor '{}' has no serial", entry.model));
    }
    const std::string serial = entry.serial;
    const auto [it, inserted] = entries_.try_emplace(serial, std::move(entry));
    if (!inserted) {
        throw config_error(fmt::format("serial '{}' is used by both '{}' and '{}'", serial, it->second.model, entry.model));
    }
}

const monitor_entry *profile_table::find(const std::string &serial) const {
    const auto it = entries_.find(serial);
    return it != entries_.end() ? &it->second : nullptr;
}

const std::map<std::string, monitor_entry> &profile_table::entries() const {
    return entries_;
}

size_t profile_table::size() const {
    return entries_.size();
}

brightness_profile resolve_profile(const monitor_identity &monitor,
                                   season s,
                                   const profile_table &table,
                                   const default_profiles &defaults) {
    const monitor_entry *entry = table.find(monitor.serial);

    if (!entry) {
        spdlog::debug("[profile] {} ({}): no entry, using the {} default", monitor.model, monitor.serial, season_name(s));
        return defaults.get(s);
    }

    const std::optional<brightness_profile> &profile = entry->profiles.get(s);
    if (!profile) {
        throw missing_season_profile(fmt::format("monitor '{}' (serial {}) has no {} profile", entry->model, monitor.serial, season_name(s)));
    }

    spdlog::debug("[profile] {} ({}): matched '{}'", monitor.model, monitor.serial, entry->model);
    return *profile;
}

}
