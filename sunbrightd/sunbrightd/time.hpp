// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef TIME_HPP
#define TIME_HPP

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>

namespace sunbrightd {

std::time_t timestamp_modify(std::time_t ts, int h, int m, int s);
std::time_t add_day(std::time_t ts);
std::time_t local_midnight(std::time_t ts);
std::string timestamp_fmt(std::time_t ts);
std::string clock_fmt(std::time_t ts);
std::chrono::year_month_day local_date(std::time_t ts);

// Sets TZ for this process, e.g. "Europe/Berlin". An empty name keeps the system zone.
void set_timezone(const std::string &name);

struct clock_time {
    int hour;
    int minute;
};

// Parses a 24h "HH:MM" string. Throws std::invalid_argument.
clock_time parse_clock(std::string_view str);

// First wall clock minute after ts that is a multiple of interval_minutes (cron "*/N").
std::time_t next_trigger(std::time_t ts, int interval_minutes);

class transition_window {
	std::time_t start_;
	std::time_t end_;
public:
	transition_window(std::time_t start, std::time_t end);
	bool in_range(std::time_t t) const;
	std::time_t time_since_start(std::time_t t) const;
	std::time_t time_to_end(std::time_t t) const;
	std::time_t duration() const;
	std::time_t start() const;
	std::time_t end() const;
};

}
#endif // TIME_HPP
