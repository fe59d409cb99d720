// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef FILE_HPP
#define FILE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <filesystem>
#include <sys/types.h>

namespace sunbrightd {

class named_pipe {
    std::filesystem::path filepath_;
public:
    named_pipe(std::filesystem::path filepath);
    std::filesystem::path path() const;
    ~named_pipe();
};

// Cross-process, non-blocking mutual exclusion on a lock file.
// The owner's pid is written into the file. The lock itself is a flock(2)
// on the open file, which the kernel drops when the owner dies.
class lockfile {
    std::filesystem::path filepath_;
public:
    // Proof of ownership. Releases the lock when destroyed.
    class token {
        int fd_;
        std::filesystem::path filepath_;
        friend class lockfile;
        token(int fd, std::filesystem::path filepath);
    public:
        token(token &&o) noexcept;
        token(const token &) = delete;
        token &operator=(const token &) = delete;
        token &operator=(token &&) = delete;
        ~token();
        bool held() const;
        void release();
    };

    explicit lockfile(std::filesystem::path filepath);

    // Never blocks. Returns std::nullopt if another owner holds the lock.
    std::optional<token> try_acquire() const;
    void release(token &&t) const;

    // pid recorded in the lock file, 0 if there is none.
    pid_t owner() const;
    const std::filesystem::path &path() const;
};

// True if pid exists and its command line mentions name.
bool process_alive(pid_t pid, std::string_view name);

std::string file_read(std::filesystem::path filepath);
void file_write(std::filesystem::path filepath, std::string_view data);

// Writes the request into the command pipe, then blocks until the answer
// arrives on the reply pipe. Other writers to the command pipe never reach
// the reply.
std::string pipe_request(const std::filesystem::path &command, const std::filesystem::path &reply, std::string_view request);

std::string env(std::string_view var);

// https://specifications.freedesktop.org/basedir-spec/basedir-spec-latest.html
std::filesystem::path xdg_config_dir();
std::filesystem::path xdg_state_dir();
std::filesystem::path xdg_runtime_dir();
}

#endif // FILE_HPP
