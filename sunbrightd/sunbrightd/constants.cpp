// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <sunbrightd/constants.hpp>
#include <string_view>

namespace sunbrightd {
namespace constants {
constexpr std::string_view process_name       = "sunbright";
constexpr std::string_view flock_filename     = "sunbrightd.lock";
constexpr std::string_view pass_lock_filename = "sunbright-pass.lock";
constexpr std::string_view fifo_filename      = "sunbrightd.fifo";
constexpr std::string_view reply_fifo_filename = "sunbrightd-reply.fifo";
constexpr std::string_view config_dirname     = "sunbright";
constexpr std::string_view config_filename    = "config.json";
constexpr int adjust_steps_min   = 1;
constexpr int adjust_steps_max   = 10;
constexpr int offset_minutes_min = 0;
constexpr int offset_minutes_max = 120;
constexpr int brightness_min     = 0;
constexpr int brightness_max     = 100;
constexpr std::array<int, 5> cron_intervals {10, 12, 15, 20, 30};
}}
