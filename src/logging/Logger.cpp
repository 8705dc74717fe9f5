//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sink handling and environment-driven construction.
//==========================================================================================================

#include <chrono>
#include <ctime>
#include <iomanip>
#include <cerrno>

#include "logging/Logger.h"

Logger::Logger() : Logger(Options{}) {}

Logger::Logger(const Options& opts)
    : level(opts.level), useStderr(opts.useStderr), color(opts.color), sink(opts.sink) {
    if (!opts.filePath.empty()) {
        setLogFile(opts.filePath);
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.close();
    }
}

std::shared_ptr<Logger> Logger::FromEnvironment() {
    Options opts;
    opts.level = levelFromString(GetEnvOrDefault("MCPE_LOG_LEVEL", "INFO"));
    opts.color = IsTruthy(GetEnvOrDefault("MCPE_LOG_COLOR", "1"));
    opts.useStderr = IsTruthy(GetEnvOrDefault("MCPE_STDIO_MODE", "0"));
    opts.filePath = GetEnvOrDefault("MCPE_LOG_FILE", "");
    return std::make_shared<Logger>(opts);
}

void Logger::setUseStderr(bool v) {
    std::lock_guard<std::mutex> lock(logMutex);
    useStderr = v;
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.close();
    }
    logFile.open(filePath, std::ios::out | std::ios::app);
    if (!logFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    auto now = std::chrono::system_clock::now();
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm buf{};
    ::localtime_r(&nowTime, &buf);
    logFile << "\n=== Log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    logFile.flush();
}

void Logger::log(const char* levelLabel, const std::string& msg, const char* file, unsigned int line) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::ostringstream oss;
    // Sinks other than a terminal get plain labels
    const bool colorize = color && sink == nullptr;
    if (colorize) {
        const char* labelColor = (::strncmp(levelLabel, "ERROR", 5) == 0) ? "\033[38;5;88m" /* burgundy */ : "\033[35m" /* purple */;
        oss << "[" << labelColor << levelLabel << "\033[0m] " << file << ":" << line << ": " << msg << '\n';
    } else {
        oss << "[" << levelLabel << "] " << file << ":" << line << ": " << msg << '\n';
    }
    const std::string logMessage = oss.str();

    if (sink != nullptr) {
        *sink << logMessage;
        sink->flush();
    } else if (useStderr) {
        std::cerr << logMessage;
    } else {
        std::cout << logMessage << std::flush;
    }

    if (logFile.is_open()) {
        logFile << logMessage;
        logFile.flush();
    }
}
