/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <string>

namespace rwork {

struct ProgressEstimate {
    int percent = 0;            // always within [0, 100]
    std::string timeRemaining;
};

// Supplies the progress reported on each heartbeat while a render runs.
class ProgressSource {
public:
    virtual ~ProgressSource() = default;

    // Called once when the render process has been spawned.
    virtual void begin() = 0;
    [[nodiscard]] virtual ProgressEstimate sample() = 0;
};

// The render engine exposes no progress channel, so this extrapolates from
// wall-clock time against an assumed total duration.
class TimedProgress final : public ProgressSource {
public:
    explicit TimedProgress(std::chrono::milliseconds assumedDuration) noexcept;

    void begin() override;
    [[nodiscard]] ProgressEstimate sample() override;

    // Pure form of sample(), used by the tests.
    [[nodiscard]] static ProgressEstimate estimate(std::chrono::milliseconds elapsed,
                                                   std::chrono::milliseconds assumedDuration);

private:
    std::chrono::milliseconds assumedDuration_;
    std::chrono::steady_clock::time_point start_;
    int last_ = 0;
};

}
