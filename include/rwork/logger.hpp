/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace rwork {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    // Literal and e.what() messages; usable where building a string could throw
    static void log(LogLevel level, const char* message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    static void error(const char* msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const char* msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const char* msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const char* msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const char* msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Tags every line logged by the current thread with a label (e.g. the job
// being rendered) for as long as the scope lives. Scopes nest.
class LogScope {
public:
    explicit LogScope(const std::string& label);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

    // Label of the innermost live scope on this thread, empty if none.
    [[nodiscard]] static const std::string& current() noexcept;

private:
    std::string previous_;
};

// Thread naming for log context
void setThreadName(const std::string& name);

}

#define LOG_ERROR(msg) ::rwork::Logger::error(msg)
#define LOG_WARN(msg)  ::rwork::Logger::warn(msg)
#define LOG_INFO(msg)  ::rwork::Logger::info(msg)
#define LOG_DEBUG(msg) ::rwork::Logger::debug(msg)
#define LOG_TRACE(msg) ::rwork::Logger::trace(msg)
