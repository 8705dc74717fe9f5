//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Leveled, std::format based logger passed explicitly to engine components.
//==========================================================================================================
#pragma once

#include <mutex>
#include <iostream>
#include <sstream>
#include <fstream>
#include <memory>
#include <string>
#include <cstring>
#include <format>
#include <atomic>
#include <cctype>
#include "env/EnvVars.h"

class Logger {
public:
    // Severity level scoped to Logger
    enum class Level {
        DEBUG = 0,
        INFO  = 1,
        WARN  = 2,
        ERROR = 3,
        FATAL = 4
    };

    //==========================================================================================================
    // Options
    // Purpose: Construction-time sink configuration.
    // Fields:
    //   level: Minimum severity that is emitted.
    //   useStderr: Write console output to stderr (required when stdout carries JSON-RPC frames).
    //   color: Colorize the level label with ANSI escapes.
    //   filePath: Optional file that receives an appended copy of every line.
    //   sink: Optional stream that replaces the console (non-owning; used by tests).
    //==========================================================================================================
    struct Options {
        Level level{Level::INFO};
        bool useStderr{false};
        bool color{true};
        std::string filePath;
        std::ostream* sink{nullptr};
    };

    Logger();
    explicit Logger(const Options& opts);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Build a logger from MCPE_LOG_LEVEL, MCPE_LOG_COLOR, MCPE_STDIO_MODE and MCPE_LOG_FILE.
    // Returns:
    //   Shared logger ready to hand to engine components.
    //==========================================================================================================
    static std::shared_ptr<Logger> FromEnvironment();

    // Convert common level strings to Logger::Level (case-insensitive). Defaults to INFO.
    static Level levelFromString(const std::string& lvl) {
        std::string s; s.reserve(lvl.size());
        for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (s == "DEBUG") return Level::DEBUG;
        if (s == "INFO")  return Level::INFO;
        if (s == "WARN" || s == "WARNING")  return Level::WARN;
        if (s == "ERROR") return Level::ERROR;
        if (s == "FATAL") return Level::FATAL;
        return Level::INFO;
    }

    bool enabled(Level lvl) const {
        return static_cast<int>(lvl) >= static_cast<int>(level.load());
    }

    void setLevel(Level lvl) { level.store(lvl); }
    Level getLevel() const { return level.load(); }

    // Routes console output to stderr from now on.
    void setUseStderr(bool v);

    // Opens (append) a log file; failure is reported on stderr and logging continues without it.
    void setLogFile(const std::string& filePath);

    // Variadic logging using C++20 std::vformat with runtime format strings
    template <typename... Args>
    void logf(const char* levelLabel, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error: {}", e.what());
        }
        log(levelLabel, buffer, file, line);
    }

    void log(const char* levelLabel, const std::string& msg, const char* file, unsigned int line);

private:
    std::atomic<Level> level{Level::INFO};
    bool useStderr{false};
    bool color{true};
    std::ostream* sink{nullptr};
    std::ofstream logFile;
    std::mutex logMutex;
};

// Leveled logging macros; the first argument is a Logger reference.
#define LOG_DEBUG(logger, fmt, ...) if ((logger).enabled(Logger::Level::DEBUG)) (logger).logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(logger, fmt, ...)  if ((logger).enabled(Logger::Level::INFO))  (logger).logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(logger, fmt, ...)  if ((logger).enabled(Logger::Level::WARN))  (logger).logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(logger, fmt, ...) if ((logger).enabled(Logger::Level::ERROR)) (logger).logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
