/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rwork/types.hpp"

namespace rwork {

const char* statusToString(Status status) noexcept {
    switch (status) {
        case Status::ReadyToStart: return "ready_to_start";
        case Status::InProgress: return "in_progress";
        case Status::Finished: return "finished";
        case Status::Errored: return "errored";
        default: return "unknown";
    }
}

std::optional<Status> parseStatus(const std::string& text) noexcept {
    if (text == "ready_to_start") return Status::ReadyToStart;
    if (text == "in_progress") return Status::InProgress;
    if (text == "finished") return Status::Finished;
    if (text == "errored") return Status::Errored;
    return std::nullopt;
}

}
