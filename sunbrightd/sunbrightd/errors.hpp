// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sunbrightd {

struct error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Out of range or incomplete configuration.
struct config_error : error {
    using error::error;
};

// dawn > sunrise or sunset > dusk.
struct invalid_solar_ordering : error {
    using error::error;
};

// The sun does not cross the horizon (or the civil twilight altitude) on this date.
struct no_solar_event : error {
    using error::error;
};

struct missing_season_profile : error {
    using error::error;
};

struct device_error : error {
    using error::error;
};

// Another brightness pass holds the pass lock.
struct already_running : error {
    using error::error;
};

}

#endif // ERRORS_HPP
