/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rwork/config.hpp"
#include "rwork/logger.hpp"
#include <cmath>
#include <cstdlib>
#include <string>

namespace rwork {

namespace {
const char* env_str(const char* name) {
    const char* val = std::getenv(name);
    return (val && *val) ? val : nullptr;
}

std::chrono::milliseconds env_seconds(const char* name, std::chrono::milliseconds defv) {
    const char* val = env_str(name);
    if (!val) {
        return defv;
    }
    if (auto parsed = parseSeconds(val)) {
        return *parsed;
    }
    LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
    return defv;
}
}

std::optional<std::chrono::milliseconds> parseSeconds(const std::string& text) {
    double value = 0;
    std::size_t used = 0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (used != text.size() || !std::isfinite(value) || value <= 0 || value > kMaxDurationSeconds) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<long long>(value * 1000));
}

WorkerConfig WorkerConfig::fromEnv() {
    WorkerConfig config;

    if (const char* v = env_str("RWORK_WORKER")) config.workerName = v;
    if (const char* v = env_str("RWORK_ENGINE")) config.enginePath = v;
    if (const char* v = env_str("RWORK_PROJECT")) config.projectPath = v;
    if (const char* v = env_str("RWORK_MODULE_DIR")) config.moduleDir = v;

    config.pollInterval = env_seconds("RWORK_POLL_SECONDS", config.pollInterval);
    config.heartbeatInterval = env_seconds("RWORK_HEARTBEAT_SECONDS", config.heartbeatInterval);
    config.assumedDuration = env_seconds("RWORK_ASSUMED_SECONDS", config.assumedDuration);

    return config;
}

std::string WorkerConfig::validate() const {
    if (workerName.empty()) {
        return "worker name is empty";
    }
    if (enginePath.empty()) {
        return "engine path is not set";
    }
    if (moduleDirVariable.empty()) {
        return "module directory variable name is empty";
    }
    if (pollInterval.count() <= 0) {
        return "poll interval must be positive";
    }
    if (heartbeatInterval.count() <= 0) {
        return "heartbeat interval must be positive";
    }
    if (assumedDuration.count() <= 0) {
        return "assumed render duration must be positive";
    }
    return "";
}

}
