/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rwork/progress.hpp"
#include <algorithm>

namespace rwork {

TimedProgress::TimedProgress(std::chrono::milliseconds assumedDuration) noexcept
    : assumedDuration_(assumedDuration), start_(std::chrono::steady_clock::now()) {
}

void TimedProgress::begin() {
    start_ = std::chrono::steady_clock::now();
    last_ = 0;
}

ProgressEstimate TimedProgress::sample() {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
    ProgressEstimate result = estimate(elapsed, assumedDuration_);

    // steady_clock already makes this non-decreasing; keep it so for any clock
    result.percent = std::max(result.percent, last_);
    last_ = result.percent;
    return result;
}

ProgressEstimate TimedProgress::estimate(std::chrono::milliseconds elapsed,
                                         std::chrono::milliseconds assumedDuration) {
    ProgressEstimate result;
    if (assumedDuration.count() <= 0) {
        result.percent = 100;
        result.timeRemaining = "0s";
        return result;
    }

    auto clampedElapsed = std::max(elapsed, std::chrono::milliseconds(0));
    long long percent = clampedElapsed.count() * 100 / assumedDuration.count();
    result.percent = static_cast<int>(std::clamp(percent, 0LL, 100LL));

    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(assumedDuration - clampedElapsed);
    result.timeRemaining = std::to_string(std::max<long long>(remaining.count(), 0)) + "s";
    return result;
}

}
