/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rwork {

// Loaded once at process start and handed to the worker by value.
struct WorkerConfig {
    std::string workerName = "RENDER_MACHINE_01";
    std::filesystem::path enginePath;
    std::filesystem::path projectPath;

    // Exported to the render process so it can import worker-side integration code
    std::filesystem::path moduleDir;
    std::string moduleDirVariable = "UE_PYTHONPATH";

    std::vector<std::string> extraArgs;

    std::chrono::milliseconds pollInterval{std::chrono::seconds(10)};
    std::chrono::milliseconds heartbeatInterval{std::chrono::seconds(5)};
    std::chrono::milliseconds assumedDuration{std::chrono::seconds(60)};

    bool recoverOrphans = false;

    // Defaults overlaid with RWORK_* environment variables.
    [[nodiscard]] static WorkerConfig fromEnv();

    // Empty when usable, otherwise a description of the first problem.
    [[nodiscard]] std::string validate() const;
};

// Positive, finite number of seconds no larger than kMaxDurationSeconds.
inline constexpr double kMaxDurationSeconds = 1e9;
[[nodiscard]] std::optional<std::chrono::milliseconds> parseSeconds(const std::string& text);

}
