/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "rwork/config.hpp"
#include "rwork/process.hpp"
#include "rwork/types.hpp"

namespace rwork {

class JobSource;
class ProgressSource;

enum class FailureKind : uint8_t {
    None,
    Spawn,        // render process could not be started
    NonZeroExit,  // render process reported failure
    Update,       // job source rejected a status write
    Internal      // anything else raised while handling the job
};

[[nodiscard]] const char* failureKindToString(FailureKind kind) noexcept;

struct RenderResult {
    bool ok = false;
    FailureKind failure = FailureKind::None;
    int exitCode = -1;
    std::string output;
    std::string error;
    std::string detail;
    explicit operator bool() const noexcept { return ok; }

    [[nodiscard]] static RenderResult failed(FailureKind kind, std::string detail);
};

// Runs one job to completion. The worker loop only sees this interface.
class Executor {
public:
    virtual ~Executor() = default;
    [[nodiscard]] virtual RenderResult render(const Job& job) = 0;
};

// Spawns the render engine for a job and heartbeats in_progress updates
// to the job source until the engine exits.
class Driver final : public Executor {
public:
    Driver(const WorkerConfig& config, JobSource& source);
    Driver(const WorkerConfig& config, JobSource& source, std::unique_ptr<ProgressSource> progress);
    ~Driver() override;

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;
    Driver(Driver&&) = delete;
    Driver& operator=(Driver&&) = delete;

    [[nodiscard]] RenderResult render(const Job& job) override;

    [[nodiscard]] ProcessSpec buildSpec(const Job& job) const;

private:
    void heartbeat(const JobId& id);

    WorkerConfig config_;
    JobSource& source_;
    std::unique_ptr<ProgressSource> progress_;
};

}
