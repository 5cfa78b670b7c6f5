/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

#include "rwork/driver.hpp"
#include "rwork/job_source.hpp"
#include "rwork/types.hpp"

namespace rwork::test {

struct UpdateRecord {
    JobId id;
    int progress;
    Status status;
    std::string timeEstimate;
};

// In-memory job source that records every write.
class MemorySource final : public JobSource {
public:
    std::vector<Job> fetchAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++fetches_;
        if (failFetch) {
            throw RegistryError("registry unavailable");
        }
        return jobs_;
    }

    void update(const JobId& id, int progress, Status status, const std::string& timeEstimate) override {
        std::lock_guard<std::mutex> lock(mutex_);
        UpdateRecord record{id, progress, status, timeEstimate};
        if (failUpdate && failUpdate(record)) {
            throw RegistryError("update rejected for " + id);
        }
        updates_.push_back(record);
        for (auto& job : jobs_) {
            if (job.id == id) {
                job.progress = progress;
                job.status = status;
                job.timeEstimate = timeEstimate;
            }
        }
    }

    void add(const JobId& id, const std::string& worker, Status status = Status::ReadyToStart) {
        std::lock_guard<std::mutex> lock(mutex_);
        Job job;
        job.id = id;
        job.worker = worker;
        job.status = status;
        job.mapPath = "/Game/Maps/" + id;
        job.sequencePath = "/Game/Sequences/" + id;
        job.configPath = "/Game/Configs/" + id;
        jobs_.push_back(job);
    }

    Job job(const JobId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& job : jobs_) {
            if (job.id == id) return job;
        }
        return {};
    }

    std::vector<UpdateRecord> updates() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return updates_;
    }

    std::vector<UpdateRecord> updatesFor(const JobId& id) const {
        std::vector<UpdateRecord> result;
        for (const auto& record : updates()) {
            if (record.id == id) result.push_back(record);
        }
        return result;
    }

    int fetches() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fetches_;
    }

    bool failFetch = false;
    std::function<bool(const UpdateRecord&)> failUpdate;

private:
    mutable std::mutex mutex_;
    std::vector<Job> jobs_;
    std::vector<UpdateRecord> updates_;
    int fetches_ = 0;
};

// Executor with scripted outcomes, keyed by job id.
class ScriptedExecutor final : public Executor {
public:
    explicit ScriptedExecutor(MemorySource& source) : source_(source) {}

    RenderResult render(const Job& job) override {
        calls.push_back(job.id);
        writesBeforeCall[job.id] = source_.updatesFor(job.id).size();
        if (onRender) {
            onRender(job);
        }
        if (throwFor.count(job.id)) {
            throw std::runtime_error(throwFor[job.id]);
        }
        auto it = exitCodes.find(job.id);
        int code = it == exitCodes.end() ? 0 : it->second;
        // Simulated heartbeat
        source_.update(job.id, 50, Status::InProgress, "30s");
        if (code == 0) {
            RenderResult result;
            result.ok = true;
            result.exitCode = 0;
            return result;
        }
        RenderResult result = RenderResult::failed(FailureKind::NonZeroExit, "exit " + std::to_string(code));
        result.exitCode = code;
        return result;
    }

    std::map<JobId, int> exitCodes;
    std::map<JobId, std::string> throwFor;
    std::vector<JobId> calls;
    std::map<JobId, std::size_t> writesBeforeCall;
    std::function<void(const Job&)> onRender;

private:
    MemorySource& source_;
};

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("rwork_test_" + std::to_string(getpid()) + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Writes an executable /bin/sh script and returns its path.
inline std::filesystem::path writeScript(const std::filesystem::path& dir, const std::string& name,
                                         const std::string& body) {
    auto path = dir / name;
    {
        std::ofstream file(path, std::ios::trunc);
        file << "#!/bin/sh\n" << body << "\n";
    }
    std::filesystem::permissions(path,
        std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
        std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
        std::filesystem::perms::others_exec);
    return path;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}
