/*
 * spindle - Asynchronous Render Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace spindle {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

using LogSink = std::function<void(LogLevel, const std::string&)>;

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Receives every emitted message in addition to stderr. Pass nullptr to clear.
    static void setSink(LogSink sink) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
void clearThreadName();

}

#define LOG_ERROR(msg) ::spindle::Logger::error(msg)
#define LOG_WARN(msg)  ::spindle::Logger::warn(msg)
#define LOG_INFO(msg)  ::spindle::Logger::info(msg)
#define LOG_DEBUG(msg) ::spindle::Logger::debug(msg)
#define LOG_TRACE(msg) ::spindle::Logger::trace(msg)
