/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace rwork {

// The child could not be started (missing executable, fork/pipe failure).
class SpawnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ProcessSpec {
    std::filesystem::path executable;
    std::vector<std::string> args;  // excluding argv[0]
    std::vector<std::pair<std::string, std::string>> env;  // added to the inherited environment
};

// A spawned child with its stdout/stderr captured through pipes.
// Destroying a Process that has not exited kills and reaps the child.
class Process final {
public:
    explicit Process(const ProcessSpec& spec);
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) = delete;
    Process& operator=(Process&&) = delete;

    // Drains output until the child exits or the timeout elapses.
    // Returns true once the child has exited.
    bool waitFor(std::chrono::milliseconds timeout);
    void wait();

    [[nodiscard]] bool exited() const noexcept { return exited_; }
    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    // Exit status, or 128 + signal number when the child was killed.
    [[nodiscard]] int exitCode() const noexcept { return exitCode_; }

    [[nodiscard]] const std::string& output() const noexcept { return out_; }
    [[nodiscard]] const std::string& errors() const noexcept { return err_; }

    static constexpr std::size_t kMaxCapture = 8 * 1024 * 1024;

private:
    bool reap();
    bool pump(std::chrono::milliseconds timeout);
    void closePipes() noexcept;

    pid_t pid_ = -1;
    int outFd_ = -1;
    int errFd_ = -1;
    bool exited_ = false;
    int exitCode_ = -1;
    std::string out_;
    std::string err_;
};

// Locates an executable the way execvp would; empty when not found.
[[nodiscard]] std::filesystem::path resolveExecutable(const std::filesystem::path& name);

}
