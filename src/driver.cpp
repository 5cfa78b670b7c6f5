/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rwork/driver.hpp"
#include "rwork/job_source.hpp"
#include "rwork/logger.hpp"
#include "rwork/progress.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

namespace rwork {

namespace {
// Movie Render Queue runtime executor flags the engine needs to render headless from the command line
const std::vector<std::string> kModeFlags = {
    "-game",
    "-MoviePipelineLocalExecutorClass=/Script/MovieRenderPipelineCore.MoviePipelinePythonHostExecutor",
    "-ExecutorPythonClass=/Engine/PythonTypes.MoviePipelineExampleRuntimeExecutor",
    "-windowed",
    "-resX=1280",
    "-resY=720",
    "-StdOut",
    "-FullStdOutLogOutput",
};

std::string lastLines(const std::string& text, std::size_t count) {
    std::size_t end = text.find_last_not_of("\r\n");
    if (end == std::string::npos) {
        return "";
    }
    std::size_t pos = end + 1;
    for (std::size_t i = 0; i < count && pos > 0; ++i) {
        pos = text.rfind('\n', pos - 1);
        if (pos == std::string::npos) {
            pos = 0;
            break;
        }
    }
    if (pos > 0) ++pos;
    return text.substr(pos, end + 1 - pos);
}

std::string seconds(std::chrono::steady_clock::duration elapsed) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << std::chrono::duration<double>(elapsed).count() << "s";
    return out.str();
}
}

const char* failureKindToString(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::Spawn: return "spawn";
        case FailureKind::NonZeroExit: return "exit";
        case FailureKind::Update: return "update";
        case FailureKind::Internal: return "internal";
        default: return "unknown";
    }
}

RenderResult RenderResult::failed(FailureKind kind, std::string detail) {
    RenderResult result;
    result.ok = false;
    result.failure = kind;
    result.detail = std::move(detail);
    return result;
}

Driver::Driver(const WorkerConfig& config, JobSource& source)
    : Driver(config, source, std::make_unique<TimedProgress>(config.assumedDuration)) {
}

Driver::Driver(const WorkerConfig& config, JobSource& source, std::unique_ptr<ProgressSource> progress)
    : config_(config), source_(source), progress_(std::move(progress)) {
    if (!progress_) {
        progress_ = std::make_unique<TimedProgress>(config_.assumedDuration);
    }
    LOG_DEBUG("Driver created - engine: " + config_.enginePath.string() +
              ", project: " + config_.projectPath.string());
}

Driver::~Driver() = default;

RenderResult Driver::render(const Job& job) {
    try {
        ProcessSpec spec = buildSpec(job);
        LOG_DEBUG("Render command: " + spec.executable.string() + " (" +
                  std::to_string(spec.args.size()) + " args)");

        auto startTime = std::chrono::steady_clock::now();
        Process process(spec);
        progress_->begin();

        // Heartbeat immediately, then once per interval until the engine exits
        do {
            heartbeat(job.id);
        } while (!process.waitFor(config_.heartbeatInterval));

        RenderResult result;
        result.exitCode = process.exitCode();
        result.output = process.output();
        result.error = process.errors();
        auto elapsed = seconds(std::chrono::steady_clock::now() - startTime);

        if (!result.output.empty()) {
            LOG_TRACE("Render output:\n" + result.output);
        }

        if (result.exitCode == 0) {
            result.ok = true;
            LOG_INFO("Render process finished in " + elapsed);
            return result;
        }

        result.failure = FailureKind::NonZeroExit;
        result.detail = "render process exited with code " + std::to_string(result.exitCode);
        LOG_WARN("Render process failed after " + elapsed + " (code " +
                 std::to_string(result.exitCode) + ")");
        auto tail = lastLines(result.error, 10);
        if (!tail.empty()) {
            LOG_WARN("Render stderr:\n" + tail);
        }
        return result;

    } catch (const SpawnError& e) {
        LOG_ERROR(std::string("Cannot start render: ") + e.what());
        return RenderResult::failed(FailureKind::Spawn, e.what());
    } catch (const RegistryError& e) {
        LOG_ERROR(std::string("Heartbeat failed: ") + e.what());
        return RenderResult::failed(FailureKind::Update, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Render monitoring failed: ") + e.what());
        return RenderResult::failed(FailureKind::Internal, e.what());
    }
}

ProcessSpec Driver::buildSpec(const Job& job) const {
    ProcessSpec spec;
    spec.executable = config_.enginePath;

    if (!config_.projectPath.empty()) {
        spec.args.push_back(config_.projectPath.string());
    }
    spec.args.push_back(job.mapPath);
    spec.args.push_back("-JobId=" + job.id);
    spec.args.push_back("-LevelSequence=" + job.sequencePath);
    spec.args.push_back("-MoviePipelineConfig=" + job.configPath);
    spec.args.insert(spec.args.end(), kModeFlags.begin(), kModeFlags.end());
    spec.args.insert(spec.args.end(), config_.extraArgs.begin(), config_.extraArgs.end());

    auto moduleDir = config_.moduleDir.empty() ? std::filesystem::current_path() : config_.moduleDir;
    spec.env.emplace_back(config_.moduleDirVariable, moduleDir.string());
    return spec;
}

void Driver::heartbeat(const JobId& id) {
    ProgressEstimate estimate = progress_->sample();
    source_.update(id, estimate.percent, Status::InProgress, estimate.timeRemaining);
    LOG_DEBUG("Heartbeat " + std::to_string(estimate.percent) + "%, " +
              estimate.timeRemaining + " remaining");
}

}
