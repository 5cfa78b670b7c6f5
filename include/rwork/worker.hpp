/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "rwork/config.hpp"
#include "rwork/driver.hpp"
#include "rwork/types.hpp"

namespace rwork {

class JobSource;

// Polls the job source and renders this worker's ready jobs one at a time.
class Worker final {
public:
    Worker(const WorkerConfig& config, JobSource& source, Executor& executor);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

    // Runs the poll loop on a background thread until shutdown().
    [[nodiscard]] bool start();
    // Runs the poll loop on the calling thread until stop (or shutdown()) is set.
    void run(const std::atomic<bool>& stop);
    // Stops polling; a render already in flight is allowed to finish.
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // One poll pass. Returns the number of jobs processed.
    std::size_t runOnce();

    // Claims, renders and finalizes a single job. Never throws.
    RenderResult processJob(const Job& job) noexcept;

    // Marks this worker's in_progress jobs, left behind by a crash, as errored.
    std::size_t recoverOrphanedJobs();

    [[nodiscard]] static std::vector<Job> eligibleJobs(const std::vector<Job>& jobs,
                                                       const std::string& workerName);

    [[nodiscard]] const WorkerConfig& config() const noexcept { return config_; }

private:
    void recoverOnStartup();
    void pollLoop(const std::atomic<bool>& stop);
    std::size_t runPass(const std::atomic<bool>& stop);
    RenderResult claimAndRender(const Job& job);
    [[nodiscard]] bool idle(std::chrono::milliseconds duration, const std::atomic<bool>& stop) const;
    [[nodiscard]] bool stopping(const std::atomic<bool>& stop) const noexcept {
        return stop.load() || shutdown_.load();
    }
    void markErrored(const JobId& id) noexcept;

    WorkerConfig config_;
    JobSource& source_;
    Executor& executor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread pollThread_;
};

}
