// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <charconv>
#include <system_error>
#include <stdexcept>
#include <fmt/chrono.h>
#include <sunbrightd/time.hpp>

namespace sunbrightd {

std::time_t timestamp_modify(std::time_t ts, int h, int m, int s) {
    std::tm tm = *std::localtime(&ts);
    tm.tm_hour  = h;
    tm.tm_min   = m;
    tm.tm_sec   = 0;
    tm.tm_sec  += s;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

std::time_t add_day(std::time_t ts) {
    std::tm tm = *std::localtime(&ts);
    tm.tm_mday += 1;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

std::time_t local_midnight(std::time_t ts) {
    return timestamp_modify(ts, 0, 0, 0);
}

std::string timestamp_fmt(std::time_t ts) {
    std::string str(std::asctime(std::localtime(&ts)));
    str.pop_back();
    return str;
}

std::string clock_fmt(std::time_t ts) {
    return fmt::format("{:%H:%M:%S}", fmt::localtime(ts));
}

std::chrono::year_month_day local_date(std::time_t ts) {
    const std::tm tm = *std::localtime(&ts);
    return std::chrono::year_month_day(
        std::chrono::year(tm.tm_year + 1900),
        std::chrono::month(unsigned(tm.tm_mon + 1)),
        std::chrono::day(unsigned(tm.tm_mday)));
}

void set_timezone(const std::string &name) {
    if (name.empty())
        return;
    if (setenv("TZ", name.c_str(), 1) < 0) {
        throw std::system_error(errno, std::generic_category(), "setenv(TZ)");
    }
    tzset();
}

clock_time parse_clock(std::string_view str) {
    const auto to_int = [&str] (std::string_view part, int max) {
        int val = -1;
        const auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), val);
        if (ec != std::errc() || ptr != part.data() + part.size() || val < 0 || val > max) {
            throw std::invalid_argument(fmt::format("'{}' should match the 24h format (HH:MM)", str));
        }
        return val;
    };

    if (str.size() != 5 || str[2] != ':') {
        throw std::invalid_argument(fmt::format("'{}' should match the 24h format (HH:MM)", str));
    }

    return { to_int(str.substr(0, 2), 23), to_int(str.substr(3, 2), 59) };
}

std::time_t next_trigger(std::time_t ts, int interval_minutes) {
    if (interval_minutes <= 0 || 60 % interval_minutes != 0) {
        throw std::invalid_argument(fmt::format("interval {} does not divide an hour", interval_minutes));
    }

    const std::tm tm = *std::localtime(&ts);
    const int next_minute = (tm.tm_min / interval_minutes + 1) * interval_minutes;

    // mktime normalizes minute 60 into the next hour
    return timestamp_modify(ts, tm.tm_hour, next_minute, 0);
}

transition_window::transition_window(std::time_t start, std::time_t end)
    : start_(start), end_(end) {
    if (start_ > end_) {
        throw std::logic_error("invalid timestamp range");
    }
}

bool transition_window::in_range(std::time_t t) const {
    return t >= start_ && t < end_;
}

// If negative, it's the time to the start
std::time_t transition_window::time_since_start(std::time_t t) const {
    return t - start_;
}

// If negative, it's the time since the end
std::time_t transition_window::time_to_end(std::time_t t) const {
    return end_ - t;
}

std::time_t transition_window::duration() const {
    return end_ - start_;
}

std::time_t transition_window::start() const {
    return start_;
}

std::time_t transition_window::end() const {
    return end_;
}

} // namespace sunbrightd
