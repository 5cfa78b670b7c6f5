/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rwork/worker.hpp"
#include "rwork/job_source.hpp"
#include "rwork/logger.hpp"
#include <algorithm>
#include <iterator>
#include <string>
#include <system_error>

namespace rwork {

namespace {
constexpr const char* kClaimEstimate = "Calculating...";
constexpr const char* kFinishedEstimate = "N/A";
constexpr const char* kErroredEstimate = "0";
constexpr std::chrono::milliseconds kIdleSlice{100};
}

Worker::Worker(const WorkerConfig& config, JobSource& source, Executor& executor)
    : config_(config), source_(source), executor_(executor) {
    LOG_DEBUG("Worker created - name: " + config_.workerName +
              ", poll: " + std::to_string(config_.pollInterval.count()) + "ms" +
              ", heartbeat: " + std::to_string(config_.heartbeatInterval.count()) + "ms");
}

Worker::~Worker() {
    shutdown();
}

bool Worker::start() {
    if (running_.exchange(true)) {
        LOG_WARN("Worker already running");
        return false;
    }

    LOG_INFO("Starting render worker " + config_.workerName);
    shutdown_.store(false);
    recoverOnStartup();

    try {
        pollThread_ = std::thread([this] {
            setThreadName("Poller");
            pollLoop(shutdown_);
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start poll thread: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
    return true;
}

void Worker::run(const std::atomic<bool>& stop) {
    if (running_.exchange(true)) {
        LOG_WARN("Worker already running");
        return;
    }

    LOG_INFO("Running render worker " + config_.workerName);
    shutdown_.store(false);
    recoverOnStartup();
    pollLoop(stop);
    running_.store(false);
}

void Worker::shutdown() noexcept {
    shutdown_.store(true);

    if (pollThread_.joinable()) {
        LOG_INFO("Stopping render worker...");
        try {
            pollThread_.join();
            LOG_INFO("Render worker stopped");
        } catch (const std::system_error& e) {
            LOG_ERROR(e.what());
        }
        running_.store(false);
    }
}

std::size_t Worker::runOnce() {
    return runPass(shutdown_);
}

std::size_t Worker::runPass(const std::atomic<bool>& stop) {
    std::vector<Job> jobs;
    try {
        jobs = source_.fetchAll();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to fetch jobs: " + std::string(e.what()));
        return 0;
    }

    LOG_INFO("Retrieved " + std::to_string(jobs.size()) + " render jobs");
    for (const auto& job : jobs) {
        LOG_DEBUG("Job " + job.id + ", worker: " + job.worker + ", status: " + statusToString(job.status));
    }

    auto eligible = eligibleJobs(jobs, config_.workerName);
    LOG_INFO("Found " + std::to_string(eligible.size()) + " ready_to_start jobs for worker " +
             config_.workerName);

    std::size_t processed = 0;
    for (const auto& job : eligible) {
        if (stopping(stop)) {
            LOG_INFO("Shutdown requested, leaving " + std::to_string(eligible.size() - processed) +
                     " job(s) for the next run");
            break;
        }
        (void)processJob(job);
        ++processed;
    }
    return processed;
}

RenderResult Worker::processJob(const Job& job) noexcept {
    RenderResult result;

    try {
        LogScope scope("job " + job.id);
        try {
            LOG_INFO("Rendering job");
            result = claimAndRender(job);
            if (result.ok) {
                source_.update(job.id, 100, Status::Finished, kFinishedEstimate);
                LOG_INFO("Finished rendering job");
                return result;
            }
        } catch (const RegistryError& e) {
            result = RenderResult::failed(FailureKind::Update, e.what());
        } catch (const std::exception& e) {
            result = RenderResult::failed(FailureKind::Internal, e.what());
        } catch (...) {
            result = RenderResult::failed(FailureKind::Internal, "unknown exception");
        }

        LOG_ERROR(std::string("Error rendering job [") + failureKindToString(result.failure) + "]: " +
                  result.detail);
        markErrored(job.id);
    } catch (const std::exception& e) {
        // Out of memory while recording the failure
        LOG_ERROR(e.what());
        result.ok = false;
        result.failure = FailureKind::Internal;
        markErrored(job.id);
    }
    return result;
}

RenderResult Worker::claimAndRender(const Job& job) {
    // Claim before spawning so a crash leaves the job visibly in progress
    try {
        source_.update(job.id, 0, Status::InProgress, kClaimEstimate);
    } catch (const RegistryError& e) {
        return RenderResult::failed(FailureKind::Update, std::string("claim: ") + e.what());
    }
    LOG_INFO("Started rendering job");
    return executor_.render(job);
}

void Worker::recoverOnStartup() {
    if (!config_.recoverOrphans) {
        return;
    }
    std::size_t recovered = recoverOrphanedJobs();
    if (recovered > 0) {
        LOG_WARN("Marked " + std::to_string(recovered) + " orphaned job(s) as errored");
    }
}

std::size_t Worker::recoverOrphanedJobs() {
    std::vector<Job> jobs;
    try {
        jobs = source_.fetchAll();
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot check for orphaned jobs: " + std::string(e.what()));
        return 0;
    }

    std::size_t recovered = 0;
    for (const auto& job : jobs) {
        if (job.worker != config_.workerName || job.status != Status::InProgress) {
            continue;
        }
        LOG_WARN("Recovering orphaned job: " + job.id);
        markErrored(job.id);
        ++recovered;
    }
    return recovered;
}

std::vector<Job> Worker::eligibleJobs(const std::vector<Job>& jobs, const std::string& workerName) {
    std::vector<Job> eligible;
    std::copy_if(jobs.begin(), jobs.end(), std::back_inserter(eligible),
        [&workerName](const Job& job) {
            return job.worker == workerName && job.status == Status::ReadyToStart;
        });
    return eligible;
}

void Worker::pollLoop(const std::atomic<bool>& stop) {
    LOG_DEBUG("Poll loop started");

    while (!stopping(stop)) {
        try {
            std::size_t processed = runPass(stop);
            if (!idle(config_.pollInterval, stop)) {
                break;
            }
            if (processed > 0) {
                LOG_INFO("Current job(s) finished, searching for new job(s)");
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Poll loop error: " + std::string(e.what()));
            if (!idle(config_.pollInterval, stop)) {
                break;
            }
        }
    }

    LOG_DEBUG("Poll loop stopped");
}

bool Worker::idle(std::chrono::milliseconds duration, const std::atomic<bool>& stop) const {
    auto sleepEnd = std::chrono::steady_clock::now() + duration;
    while (!stopping(stop)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= sleepEnd) {
            return true;
        }
        std::this_thread::sleep_for(std::min(kIdleSlice,
            std::chrono::duration_cast<std::chrono::milliseconds>(sleepEnd - now)));
    }
    return false;
}

void Worker::markErrored(const JobId& id) noexcept {
    try {
        try {
            source_.update(id, 0, Status::Errored, kErroredEstimate);
        } catch (const RegistryError& e) {
            LOG_ERROR("Failed to mark job " + id + " as errored: " + e.what());
        }
    } catch (const std::exception& e) {
        LOG_ERROR(e.what());
    }
}

}
