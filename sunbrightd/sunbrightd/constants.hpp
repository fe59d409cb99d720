// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CONSTANTS_HPP
#define CONSTANTS_HPP

#include <array>
#include <string_view>

namespace sunbrightd {
namespace constants {
extern const std::string_view process_name;
extern const std::string_view flock_filename;
extern const std::string_view pass_lock_filename;
extern const std::string_view fifo_filename;
extern const std::string_view reply_fifo_filename;
extern const std::string_view config_dirname;
extern const std::string_view config_filename;
extern const int adjust_steps_min;
extern const int adjust_steps_max;
extern const int offset_minutes_min;
extern const int offset_minutes_max;
extern const int brightness_min;
extern const int brightness_max;
extern const std::array<int, 5> cron_intervals;
}}

#endif // CONSTANTS_HPP
