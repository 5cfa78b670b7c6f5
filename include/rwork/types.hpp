/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace rwork {

// Render job lifecycle states.
enum class Status : std::uint8_t { ReadyToStart, InProgress, Finished, Errored };

// Opaque job identifier.
using JobId = std::string;

struct Job {
    JobId id;
    std::string worker;
    Status status = Status::ReadyToStart;
    int progress = 0;
    std::string timeEstimate;

    // Passed through to the render process untouched
    std::string mapPath;
    std::string sequencePath;
    std::string configPath;
};

[[nodiscard]] const char* statusToString(Status status) noexcept;
[[nodiscard]] std::optional<Status> parseStatus(const std::string& text) noexcept;
[[nodiscard]] inline bool isTerminal(Status status) noexcept {
    return status == Status::Finished || status == Status::Errored;
}

} // namespace rwork
