/*
 * rwork - Render job submission tool (rsub)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rwork/registry.hpp"
#include "rwork/logger.hpp"
#include <cstdlib>
#include <iostream>

using namespace rwork;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "rwork Render Job Submission Tool v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <registry> <worker> <map> <sequence> <config>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  registry      Job registry directory\n";
    std::cout << "  worker        Worker identity that should render the job\n";
    std::cout << "  map           Map/level asset path\n";
    std::cout << "  sequence      Level sequence asset path\n";
    std::cout << "  config        Movie pipeline config asset path\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  RWORK_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << progName << " ./registry RENDER_MACHINE_01 /Game/Maps/Main \\\n";
    std::cout << "      /Game/Cinematics/Intro /Game/Cinematics/HighQuality\n";
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; RWORK_LOG_LEVEL overrides
    if (!std::getenv("RWORK_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

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

    if (argc != 6) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        Registry registry(argv[1], true);
        SubmitResult result = registry.submit(argv[2], argv[3], argv[4], argv[5]);

        if (result.ok) {
            // Just the job ID so the output can be piped
            std::cout << result.id << std::endl;
            return 0;
        }
        std::cerr << "Error: " << result.message << std::endl;
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
