// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <stdexcept>
#include <unistd.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <sunbrightd/api.hpp>
#include <sunbrightd/file.hpp>
#include <sunbrightd/constants.hpp>

namespace sunbrightd {

bool daemon_start(const std::vector<std::string> &args) {

    if (daemon_is_running())
        return false;

    const pid_t pid = fork();

    if (pid > 0)
        return true;

    if (pid == 0) {
        std::vector<char *> argv;
        argv.push_back(const_cast<char *>(SUNBRIGHT_DAEMON_PATH));
        for (const auto &arg : args)
            argv.push_back(const_cast<char *>(arg.c_str()));
        argv.push_back(nullptr);
        setsid();
        execv(SUNBRIGHT_DAEMON_PATH, argv.data());
        throw std::runtime_error(fmt::format("execv({}) fail\n", SUNBRIGHT_DAEMON_PATH));
    }

    throw std::runtime_error("fork() fail");
}

bool daemon_stop() {
    if (daemon_is_running()) {
        daemon_send("stop");
        return true;
    }
    return false;
}

bool daemon_is_running() {
    const lockfile flock(xdg_runtime_dir() / constants::flock_filename);
    return !flock.try_acquire().has_value();
}

void daemon_send(std::string_view s) {
    file_write(xdg_runtime_dir() / constants::fifo_filename, s);
}

std::string daemon_get(std::string_view s) {
    return pipe_request(xdg_runtime_dir() / constants::fifo_filename, xdg_runtime_dir() / constants::reply_fifo_filename, s);
}

}
