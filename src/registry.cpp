/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rwork/registry.hpp"
#include "rwork/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <map>
#include <sstream>
#include <unistd.h>

namespace rwork {

namespace {
constexpr const char* kRequestFile = "request.txt";
constexpr const char* kStatusFile = "status.txt";

using Fields = std::map<std::string, std::string>;

Fields readFields(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw RegistryError("Cannot open " + path.string());
    }
    Fields fields;
    std::string line;
    while (std::getline(file, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        fields[line.substr(0, eq)] = line.substr(eq + 1);
    }
    return fields;
}

// Write to a sibling temp file and rename over the target
void writeFields(const std::filesystem::path& path, const Fields& fields) {
    auto tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw RegistryError("Cannot write " + tempPath.string());
        }
        for (const auto& [key, value] : fields) {
            file << key << '=' << value << '\n';
        }
        file.flush();
        if (!file.good()) {
            throw RegistryError("Short write to " + tempPath.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::filesystem::remove(tempPath, ec);
        throw RegistryError("Cannot publish " + path.string());
    }
}

bool isValidField(const std::string& value) {
    return !value.empty() && value.find('\n') == std::string::npos &&
           value.find('\r') == std::string::npos;
}
}

Registry::Registry(const std::filesystem::path& root, bool createIfMissing)
    : root_(root) {
    if (!createLayout(createIfMissing)) {
        LOG_ERROR("Failed to initialize registry: " + root_.string());
    }
}

SubmitResult Registry::submit(const std::string& worker, const std::string& mapPath,
                              const std::string& sequencePath, const std::string& configPath) {
    if (!isValidField(worker)) {
        return {false, "", SubmissionError::InvalidContent, "Worker name is empty or malformed"};
    }
    if (!isValidField(mapPath) || !isValidField(sequencePath) || !isValidField(configPath)) {
        return {false, "", SubmissionError::InvalidContent,
                "Map, sequence and config references must be non-empty single-line values"};
    }
    if (!std::filesystem::is_directory(root_ / "writing")) {
        return {false, "", SubmissionError::WorkspaceError, "Registry not initialized: " + root_.string()};
    }

    JobId jobId = generateId();
    LOG_DEBUG("Generated job ID: " + jobId);

    auto stagingPath = root_ / "writing" / jobId;
    try {
        std::filesystem::create_directories(stagingPath);
        writeFields(stagingPath / kRequestFile, {
            {"worker", worker},
            {"map", mapPath},
            {"sequence", sequencePath},
            {"config", configPath},
        });
        writeStatus(stagingPath, 0, Status::ReadyToStart, "");

        // Readers never see a half-written job
        std::filesystem::rename(stagingPath, jobPath(jobId));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to submit job " + jobId + ": " + e.what());
        std::error_code ec;
        std::filesystem::remove_all(stagingPath, ec);
        return {false, "", SubmissionError::IoError, e.what()};
    }

    LOG_INFO("Job submitted: " + jobId + " for worker " + worker);
    return {true, jobId, SubmissionError::None, ""};
}

std::vector<Job> Registry::fetchAll() {
    auto jobsDir = root_ / "jobs";
    std::vector<Job> jobs;

    std::error_code ec;
    std::filesystem::directory_iterator it(jobsDir, ec);
    if (ec) {
        throw RegistryError("Cannot list " + jobsDir.string() + ": " + ec.message());
    }

    for (const auto& entry : it) {
        if (!entry.is_directory()) {
            continue;
        }
        if (auto job = readJob(entry.path())) {
            jobs.push_back(std::move(*job));
        }
    }

    // Ids begin with a timestamp, so this is submission order
    std::sort(jobs.begin(), jobs.end(),
              [](const Job& a, const Job& b) { return a.id < b.id; });
    LOG_TRACE("Registry returned " + std::to_string(jobs.size()) + " jobs");
    return jobs;
}

void Registry::update(const JobId& id, int progress, Status status,
                      const std::string& timeEstimate) {
    if (progress < 0 || progress > 100) {
        throw RegistryError("Progress out of range for job " + id + ": " + std::to_string(progress));
    }
    if (timeEstimate.find('\n') != std::string::npos) {
        throw RegistryError("Malformed time estimate for job " + id);
    }

    auto dir = jobPath(id);
    if (!exists(id) || !std::filesystem::exists(dir / kRequestFile)) {
        throw RegistryError("Unknown job: " + id);
    }
    writeStatus(dir, progress, status, timeEstimate);
    LOG_TRACE("Job " + id + " -> " + statusToString(status) + " " + std::to_string(progress) + "%");
}

std::optional<Job> Registry::get(const JobId& id) const {
    if (!exists(id)) {
        return std::nullopt;
    }
    return readJob(jobPath(id));
}

bool Registry::exists(const JobId& id) const noexcept {
    std::error_code ec;
    if (id.empty() || id == "." || id == ".." || id.find('/') != std::string::npos) {
        return false;
    }
    return std::filesystem::is_directory(root_ / "jobs" / id, ec);
}

void Registry::requeue(const JobId& id) {
    auto job = get(id);
    if (!job) {
        throw RegistryError("Unknown job: " + id);
    }
    // A running or waiting job belongs to its worker
    if (!isTerminal(job->status)) {
        throw RegistryError("Job " + id + " is " + statusToString(job->status) +
                            ", only finished or errored jobs can be requeued");
    }
    writeStatus(jobPath(id), 0, Status::ReadyToStart, "");
    LOG_INFO("Job requeued: " + id);
}

bool Registry::createLayout(bool createIfMissing) noexcept {
    try {
        if (!std::filesystem::exists(root_)) {
            if (!createIfMissing) {
                return false;
            }
            std::filesystem::create_directories(root_);
        }

        std::filesystem::create_directories(root_ / "writing");
        std::filesystem::create_directories(root_ / "jobs");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create registry layout: " + std::string(e.what()));
        return false;
    }
}

JobId Registry::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

std::filesystem::path Registry::jobPath(const JobId& id) const {
    return root_ / "jobs" / id;
}

std::optional<Job> Registry::readJob(const std::filesystem::path& dir) const {
    try {
        Fields request = readFields(dir / kRequestFile);
        Fields state = readFields(dir / kStatusFile);

        auto status = parseStatus(state["status"]);
        if (!status) {
            LOG_WARN("Skipping job with unknown status '" + state["status"] + "': " + dir.string());
            return std::nullopt;
        }

        Job job;
        job.id = dir.filename().string();
        job.worker = request["worker"];
        job.mapPath = request["map"];
        job.sequencePath = request["sequence"];
        job.configPath = request["config"];
        job.status = *status;
        job.progress = std::stoi(state["progress"]);
        job.timeEstimate = state["time_estimate"];
        return job;
    } catch (const std::exception& e) {
        LOG_DEBUG("Skipping unreadable job directory " + dir.string() + ": " + e.what());
        return std::nullopt;
    }
}

void Registry::writeStatus(const std::filesystem::path& dir, int progress, Status status,
                           const std::string& timeEstimate) const {
    writeFields(dir / kStatusFile, {
        {"status", statusToString(status)},
        {"progress", std::to_string(progress)},
        {"time_estimate", timeEstimate},
    });
}

}
