/*
 * rwork - Render job status tool (rstat)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rwork/registry.hpp"
#include "rwork/logger.hpp"
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace rwork;

void printUsage(const char* progName) {
    std::cout << "rwork Render Job Status Tool\n\n";
    std::cout << "Usage: " << progName << " <registry> [job_id] [--wait] [--requeue]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  registry      Job registry directory\n";
    std::cout << "  job_id        Job to show (optional, also read from piped stdin)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -w, --wait    Block until the job is finished or errored\n";
    std::cout << "  --requeue     Reset a finished or errored job to ready_to_start\n\n";
    std::cout << "Behavior:\n";
    std::cout << "  - If job_id provided: print that job, exit 0 finished, 1 errored, 2 pending\n";
    std::cout << "  - If no job_id: list every job in the registry\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./registry\n";
    std::cout << "  " << progName << " ./registry 1731808123456789_12345_0 --wait\n";
    std::cout << "  rsub ./registry W /Game/Map /Game/Seq /Game/Cfg | " << progName << " ./registry -w\n";
}

void printJob(const Job& job) {
    std::cout << "id:            " << job.id << "\n";
    std::cout << "worker:        " << job.worker << "\n";
    std::cout << "status:        " << statusToString(job.status) << "\n";
    std::cout << "progress:      " << job.progress << "%\n";
    std::cout << "time estimate: " << job.timeEstimate << "\n";
    std::cout << "map:           " << job.mapPath << "\n";
    std::cout << "sequence:      " << job.sequencePath << "\n";
    std::cout << "config:        " << job.configPath << "\n";
}

void printTable(const std::vector<Job>& jobs) {
    std::cout << std::left << std::setw(28) << "ID" << std::setw(22) << "WORKER"
              << std::setw(16) << "STATUS" << std::setw(6) << "PCT" << "ETA\n";
    for (const auto& job : jobs) {
        std::cout << std::left << std::setw(28) << job.id << std::setw(22) << job.worker
                  << std::setw(16) << statusToString(job.status) << std::setw(6) << job.progress
                  << job.timeEstimate << "\n";
    }
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string registryPath = argv[1];
    std::string jobId;
    bool wait = false;
    bool requeue = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    }

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-w" || arg == "--wait") {
            wait = true;
        } else if (arg == "--requeue") {
            requeue = true;
        } else {
            jobId = arg;
        }
    }

    // Job ID piped from rsub
    if (jobId.empty() && !isatty(fileno(stdin))) {
        std::cin >> jobId;
    }

    try {
        Registry registry(registryPath, false);

        if (jobId.empty()) {
            if (wait || requeue) {
                std::cerr << "Error: a job id is required for --wait and --requeue" << std::endl;
                return 1;
            }
            printTable(registry.fetchAll());
            return 0;
        }

        if (!registry.exists(jobId)) {
            std::cerr << "Job not found: " << jobId << std::endl;
            return 1;
        }

        if (requeue) {
            registry.requeue(jobId);
        }

        auto job = registry.get(jobId);
        while (wait && job && !isTerminal(job->status)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            job = registry.get(jobId);
        }

        if (!job) {
            std::cerr << "Job record unreadable: " << jobId << std::endl;
            return 1;
        }

        printJob(*job);
        switch (job->status) {
            case Status::Finished: return 0;
            case Status::Errored: return 1;
            default: return 2; // Not terminal yet
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
