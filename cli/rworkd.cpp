/*
 * rwork - Render worker daemon (rworkd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rwork/config.hpp"
#include "rwork/driver.hpp"
#include "rwork/logger.hpp"
#include "rwork/registry.hpp"
#include "rwork/worker.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace rwork;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "rwork Render Worker Daemon v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <registry> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  registry             Job registry directory\n\n";
    std::cout << "Options:\n";
    std::cout << "  --worker <name>      Worker identity whose jobs are claimed\n";
    std::cout << "  --engine <path>      Render engine executable\n";
    std::cout << "  --project <path>     Project file passed to the engine\n";
    std::cout << "  --module-dir <dir>   Directory exported to the engine (default: executable dir)\n";
    std::cout << "  --arg <value>        Extra engine argument (repeatable)\n";
    std::cout << "  --poll <sec>         Idle time between polls (default 10)\n";
    std::cout << "  --heartbeat <sec>    Progress update interval (default 5)\n";
    std::cout << "  --assumed <sec>      Assumed render duration for estimates (default 60)\n";
    std::cout << "  --once               Process one poll pass and exit\n";
    std::cout << "  --recover-orphans    Mark this worker's stale in_progress jobs as errored\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  -v, --version        Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  RWORK_LOG_LEVEL          Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  RWORK_WORKER             Worker identity\n";
    std::cout << "  RWORK_ENGINE             Render engine executable\n";
    std::cout << "  RWORK_PROJECT            Project file\n";
    std::cout << "  RWORK_MODULE_DIR         Directory exported to the engine\n";
    std::cout << "  RWORK_POLL_SECONDS       Idle time between polls\n";
    std::cout << "  RWORK_HEARTBEAT_SECONDS  Progress update interval\n";
    std::cout << "  RWORK_ASSUMED_SECONDS    Assumed render duration\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./registry --worker RENDER_MACHINE_01 --engine /opt/UE/UnrealEditor \\\n";
    std::cout << "      --project ~/Projects/Demo/Demo.uproject\n";
}

std::filesystem::path executableDir(const char* argv0) {
    std::filesystem::path exePath(argv0 ? argv0 : "");
    std::error_code ec;
    auto resolved = std::filesystem::canonical("/proc/self/exe", ec);
    if (!ec) {
        return resolved.parent_path();
    }
    if (!exePath.empty()) {
        exePath = std::filesystem::absolute(exePath, ec);
        if (!ec) {
            return exePath.parent_path();
        }
    }
    return std::filesystem::current_path();
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::initFromEnv();

    std::filesystem::path registryPath = argv[1];
    WorkerConfig config = WorkerConfig::fromEnv();
    if (config.moduleDir.empty()) {
        config.moduleDir = executableDir(argv[0]);
    }
    bool once = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--once") {
            once = true;
        } else if (arg == "--recover-orphans") {
            config.recoverOrphans = true;
        } else if (arg == "--worker" && hasValue) {
            config.workerName = argv[++i];
        } else if (arg == "--engine" && hasValue) {
            config.enginePath = argv[++i];
        } else if (arg == "--project" && hasValue) {
            config.projectPath = argv[++i];
        } else if (arg == "--module-dir" && hasValue) {
            config.moduleDir = argv[++i];
        } else if (arg == "--arg" && hasValue) {
            config.extraArgs.emplace_back(argv[++i]);
        } else if ((arg == "--poll" || arg == "--heartbeat" || arg == "--assumed") && hasValue) {
            auto value = parseSeconds(argv[++i]);
            if (!value) {
                std::cerr << "Error: " << arg << " expects a positive number of seconds\n";
                return 1;
            }
            if (arg == "--poll") config.pollInterval = *value;
            else if (arg == "--heartbeat") config.heartbeatInterval = *value;
            else config.assumedDuration = *value;
        } else {
            std::cerr << "Error: Unknown or incomplete option: " << arg << "\n";
            return 1;
        }
    }

    if (auto problem = config.validate(); !problem.empty()) {
        std::cerr << "Error: " << problem << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    setThreadName("Main");

    try {
        Registry registry(registryPath, true);
        Driver driver(config, registry);
        Worker worker(config, registry, driver);

        LOG_DEBUG("========================================");
        LOG_DEBUG("rwork Render Worker Starting");
        LOG_DEBUG("========================================");
        LOG_DEBUG("Worker: " + config.workerName);
        LOG_DEBUG("Registry: " + registryPath.string());
        LOG_DEBUG("Engine: " + config.enginePath.string());
        LOG_DEBUG("Project: " + config.projectPath.string());
        LOG_DEBUG("Module dir: " + config.moduleDir.string() + " (" + config.moduleDirVariable + ")");
        LOG_DEBUG("========================================");

        if (once) {
            if (config.recoverOrphans) {
                (void)worker.recoverOrphanedJobs();
            }
            std::size_t processed = worker.runOnce();
            LOG_INFO("Processed " + std::to_string(processed) + " job(s)");
            return 0;
        }

        if (!worker.start()) {
            LOG_ERROR("Failed to start worker");
            return 1;
        }

        std::filesystem::path pidPath = registryPath / ".rworkd.pid";
        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            } else {
                LOG_WARN("Cannot write pid file: " + pidPath.string());
            }
        }

        while (!g_shutdown_requested && worker.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG_INFO("Shutdown requested, finishing current job...");
        worker.shutdown();
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Worker error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("rworkd stopped");
    return 0;
}
