/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the console logger.
 */

#include "nodeboot/infra/logger.hpp"

#include "nodeboot/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace nodeboot::infra {

std::mutex Logger::mutex_;
LogLevel Logger::threshold_ = LogLevel::INFO;

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

LogLevel Logger::level()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
}

bool Logger::enabled(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= threshold_;
}

std::optional<LogLevel> Logger::parse_level(const std::string& name)
{
    std::string n = String::to_lower(String::trim(name));
    if (n == "trace")
        return LogLevel::TRACE;
    if (n == "debug")
        return LogLevel::DEBUG;
    if (n == "info")
        return LogLevel::INFO;
    if (n == "warn" || n == "warning")
        return LogLevel::WARN;
    if (n == "error")
        return LogLevel::ERROR;
    if (n == "fatal")
        return LogLevel::FATAL;
    return std::nullopt;
}

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops entries below the configured threshold.
 * 2. **Chronometry**: Captures the wall clock as `YYYY-MM-DD HH:MM:SS`.
 * 3. **Stream Segregation**: Routes by severity.
 * 4. **Stylization**: Colors the tag only when writing to a TTY.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < threshold_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    bool to_err = level >= LogLevel::WARN;
    auto& stream = to_err ? std::cerr : std::cout;
    bool colored = ::isatty(to_err ? STDERR_FILENO : STDOUT_FILENO) == 1;

    // Note: mutex protects std::localtime's internal static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    const char* color = "";
    const char* tag = "";
    switch (level) {
    case LogLevel::TRACE:
        color = "\033[90m";
        tag = "[TRCE] ";
        break;
    case LogLevel::DEBUG:
        color = "\033[36m";
        tag = "[DBUG] ";
        break;
    case LogLevel::INFO:
        color = "\033[32m";
        tag = "[INFO] ";
        break;
    case LogLevel::WARN:
        color = "\033[33m";
        tag = "[WARN] ";
        break;
    case LogLevel::ERROR:
        color = "\033[31m";
        tag = "[FAIL] ";
        break;
    case LogLevel::FATAL:
        color = "\033[1;31m";
        tag = "[CRIT] ";
        break;
    }

    if (colored) {
        stream << color << tag << message << "\033[0m" << std::endl;
    } else {
        stream << tag << message << std::endl;
    }
}

} // namespace nodeboot::infra
