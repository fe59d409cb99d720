// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SEASON_HPP
#define SEASON_HPP

#include <chrono>
#include <functional>
#include <string>

namespace sunbrightd {

enum class season {
	SUMMER,
	WINTER,
};

std::string season_name(season s);

using season_resolver = std::function<season(std::chrono::year_month_day)>;

// April - September: summer, October - March: winter.
season season_by_month(std::chrono::year_month_day date);

// Summer from the March equinox (20th) up to the September equinox (22nd).
season season_by_equinox(std::chrono::year_month_day date);

// Wraps a northern hemisphere resolver, swapping its result.
season_resolver southern_hemisphere(season_resolver resolver);

}

#endif // SEASON_HPP
