// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <filesystem>
#include <string>
#include <string_view>
#include <sstream>
#include <system_error>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/file.h>
#include <sys/stat.h>

#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>
#include <sunbrightd/file.hpp>
#include <sunbrightd/constants.hpp>

namespace sunbrightd {

named_pipe::named_pipe(std::filesystem::path filepath) : filepath_(filepath) {
    if (mkfifo(filepath_.c_str(), S_IFIFO | 0640) < 0 && errno != EEXIST) {
        throw std::system_error(errno, std::generic_category(), fmt::format("[named_pipe] mkfifo({})", filepath_));
    }
}

std::filesystem::path named_pipe::path() const {
    return filepath_;
}

named_pipe::~named_pipe() {
    std::error_code ec;
    std::filesystem::remove(filepath_, ec);
    if (ec) {
        spdlog::error("[named_pipe] remove {}: {}", filepath_, ec.message());
    }
}

namespace {

pid_t read_pid(int fd) {
    std::array<char, 32> buf {};
    const ssize_t sz = pread(fd, buf.data(), buf.size(), 0);
    if (sz <= 0) {
        return 0;
    }
    pid_t pid = 0;
    const auto [ptr, ec] = std::from_chars(buf.data(), buf.data() + sz, pid);
    return ec == std::errc() ? pid : 0;
}

void write_pid(int fd, pid_t pid) {
    const std::string str = std::to_string(pid);
    if (ftruncate(fd, 0) < 0 || pwrite(fd, str.data(), str.size(), 0) != ssize_t(str.size())) {
        throw std::system_error(errno, std::generic_category(), "[lockfile] writing pid failed");
    }
}

// The previous owner unlinks the file on release. If that happened between
// our open() and flock(), we locked an orphaned inode.
bool same_file(int fd, const std::filesystem::path &filepath) {
    struct stat fd_st;
    struct stat path_st;
    if (fstat(fd, &fd_st) < 0 || stat(filepath.c_str(), &path_st) < 0) {
        return false;
    }
    return fd_st.st_dev == path_st.st_dev && fd_st.st_ino == path_st.st_ino;
}

}

lockfile::token::token(int fd, std::filesystem::path filepath)
    : fd_(fd), filepath_(std::move(filepath)) {
}

lockfile::token::token(token &&o) noexcept
    : fd_(o.fd_), filepath_(std::move(o.filepath_)) {
    o.fd_ = -1;
}

lockfile::token::~token() {
    release();
}

bool lockfile::token::held() const {
    return fd_ >= 0;
}

void lockfile::token::release() {
    if (fd_ < 0)
        return;

    // unlink before unlocking, so that nobody can lock the old inode and believe it valid
    if (unlink(filepath_.c_str()) < 0 && errno != ENOENT) {
        spdlog::error("[lockfile] unlink({}) failed: {}", filepath_, std::strerror(errno));
    }
    if (flock(fd_, LOCK_UN) < 0) {
        spdlog::error("[lockfile] unlock({}) failed: {}", filepath_, std::strerror(errno));
    }
    close(fd_);
    fd_ = -1;
    spdlog::debug("[lockfile] released {}", filepath_);
}

lockfile::lockfile(std::filesystem::path filepath)
    : filepath_(std::move(filepath)) {
}

std::optional<lockfile::token> lockfile::try_acquire() const {
    constexpr int max_tries = 3;

    for (int tries = 0; tries < max_tries; ++tries) {
        const int fd = open(filepath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0640);
        if (fd < 0) {
            throw std::system_error(errno, std::generic_category(), fmt::format("[lockfile] open({}) failed", filepath_));
        }

        if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
            const int err = errno;
            const pid_t pid = read_pid(fd);
            close(fd);
            if (err == EWOULDBLOCK) {
                spdlog::debug("[lockfile] {} is held by pid {}", filepath_, pid);
                return std::nullopt;
            }
            throw std::system_error(err, std::generic_category(), fmt::format("[lockfile] flock({}) failed", filepath_));
        }

        if (!same_file(fd, filepath_)) {
            spdlog::debug("[lockfile] {} was replaced while locking, retrying ({})...", filepath_, tries + 1);
            close(fd);
            continue;
        }

        const pid_t prev = read_pid(fd);
        if (prev > 0 && prev != getpid()) {
            if (process_alive(prev, constants::process_name)) {
                spdlog::warn("[lockfile] {} belongs to running process {}", filepath_, prev);
                close(fd);
                return std::nullopt;
            }
            spdlog::info("[lockfile] taking over stale lock {} (pid {} is gone)", filepath_, prev);
        }

        token t(fd, filepath_);
        write_pid(fd, getpid());
        spdlog::debug("[lockfile] acquired {}", filepath_);
        return t;
    }

    return std::nullopt;
}

void lockfile::release(token &&t) const {
    t.release();
}

pid_t lockfile::owner() const {
    const int fd = open(filepath_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return 0;
    }
    const pid_t pid = read_pid(fd);
    close(fd);
    return pid;
}

const std::filesystem::path &lockfile::path() const {
    return filepath_;
}

bool process_alive(pid_t pid, std::string_view name) {
    if (pid <= 0) {
        return false;
    }

    if (kill(pid, 0) < 0 && errno == ESRCH) {
        return false;
    }

    // The pid may have been recycled by an unrelated process.
    const std::string cmdline = [pid] {
        try {
            return file_read(fmt::format("/proc/{}/cmdline", pid));
        } catch (const std::ios_base::failure &) {
            return std::string();
        }
    }();

    if (cmdline.empty()) {
        return true;
    }

    return cmdline.find(name) != std::string::npos;
}

std::string file_read(std::filesystem::path filepath) {
    std::ifstream fs(filepath);
    fs.exceptions(std::ifstream::failbit);

    std::ostringstream buf;
    buf << fs.rdbuf();

    return buf.str();
}

void file_write(std::filesystem::path filepath, std::string_view data) {
    std::ofstream fs(filepath);
    fs.exceptions(std::ofstream::failbit);
    fs.write(data.data(), data.size());
}

std::string pipe_request(const std::filesystem::path &command, const std::filesystem::path &reply, std::string_view request) {
    file_write(command, request);
    return file_read(reply);
}

std::string env(std::string_view var) {
    const auto s = std::getenv(var.data());
    return s ? s : "";
}

std::filesystem::path xdg_config_dir() {
    constexpr std::array<std::array<std::string_view, 2>, 2> env_vars {{
        {"XDG_CONFIG_HOME", ""},
        {"HOME", "/.config"}
    }};

    std::filesystem::path ret;

    for (const auto &arr : env_vars) {
        const std::string env_var = env(arr[0]);
        if (!env_var.empty()) {
            ret = fmt::format("{}{}", env_var, arr[1]);
            break;
        }
    }

    if (ret.is_relative())
        throw std::runtime_error("xdg_config_dir should be absolute");

    return ret;
}

std::filesystem::path xdg_state_dir() {
    constexpr std::array<std::array<std::string_view, 2>, 2> env_vars {{
        {"XDG_STATE_HOME", ""},
        {"HOME", "/.local/state"}
    }};

    std::filesystem::path ret;

    for (const auto &arr : env_vars) {
        const std::string env_var = env(arr[0]);
        if (!env_var.empty()) {
            ret = fmt::format("{}{}", env_var, arr[1]);
            break;
        }
    }

    if (ret.is_relative())
        throw std::runtime_error("xdg_state_dir should be absolute");

    return ret;
}

std::filesystem::path xdg_runtime_dir() {
    const std::string dir = env("XDG_RUNTIME_DIR");
    const std::filesystem::path ret = dir.empty() ? std::filesystem::path("/tmp") : std::filesystem::path(dir);

    if (ret.is_relative())
        throw std::runtime_error("xdg_runtime_dir should be absolute");

    return ret;
}

} // namespace sunbrightd
