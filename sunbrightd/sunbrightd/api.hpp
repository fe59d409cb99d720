// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef API_HPP
#define API_HPP

#include <string>
#include <string_view>
#include <vector>

namespace sunbrightd {
    bool daemon_start(const std::vector<std::string> &args);
    bool daemon_stop();
    bool daemon_is_running();
    void daemon_send(std::string_view s);
    std::string daemon_get(std::string_view s);
}

#endif // API_HPP
