// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <utility>
#include <sunbrightd/season.hpp>

namespace sunbrightd {

std::string season_name(season s) {
    switch (s) {
    case season::SUMMER:
        return "summer";
    case season::WINTER:
        return "winter";
    }
    return "error: unknown season";
}

season season_by_month(std::chrono::year_month_day date) {
    const unsigned month = unsigned(date.month());
    return (month >= 4 && month <= 9) ? season::SUMMER : season::WINTER;
}

season season_by_equinox(std::chrono::year_month_day date) {
    using namespace std::chrono;
    const year_month_day spring(date.year(), March, day(20));
    const year_month_day autumn(date.year(), September, day(22));
    return (date >= spring && date < autumn) ? season::SUMMER : season::WINTER;
}

season_resolver southern_hemisphere(season_resolver resolver) {
    return [resolver = std::move(resolver)] (std::chrono::year_month_day date) {
        return resolver(date) == season::SUMMER ? season::WINTER : season::SUMMER;
    };
}

}
