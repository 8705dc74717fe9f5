//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcp-engine command line entry point (HTTP/SSE or stdio)
//==========================================================================================================

#include <csignal>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpe/Engine.h"

using namespace mcpe;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--transport")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    const std::string transport = getArgValue(argc, argv, "--transport").value_or(GetEnvOrDefault("MCPE_TRANSPORT", "http"));
    if (transport != "http" && transport != "stdio") {
        std::fprintf(stderr, "unknown transport: %s (expected http or stdio)\n", transport.c_str());
        return 2;
    }
    const bool stdioMode = transport == "stdio";

    auto logger = Logger::FromEnvironment();
    if (auto lvl = getArgValue(argc, argv, "--log-level")) {
        logger->setLevel(Logger::levelFromString(*lvl));
    }
    if (stdioMode) {
        // stdout carries only JSON-RPC
        logger->setUseStderr(true);
    }

    ServerConfig config = ServerConfig::FromEnvironment();
    if (auto addr = getArgValue(argc, argv, "--addr")) {
        config.address = *addr;
    }
    if (auto name = getArgValue(argc, argv, "--name")) {
        config.name = *name;
    }

    std::unique_ptr<Engine> engine;
    try {
        engine = std::make_unique<Engine>(config, logger);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(*logger, "invalid configuration: {}", e.what());
        return 2;
    }

    boost::asio::io_context signalIoc;
    boost::asio::signal_set signals(signalIoc, SIGINT, SIGTERM);
    std::stop_source stdioStop;
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        LOG_INFO(*logger, "received signal {}", signo);
        if (stdioMode) {
            stdioStop.request_stop();
        } else {
            engine->Shutdown();
        }
    });
    std::thread signalThread([&signalIoc] { signalIoc.run(); });

    int rc = 0;
    try {
        if (stdioMode) {
            auto ec = engine->ServeStdio(stdioStop.get_token());
            if (ec) {
                LOG_ERROR(*logger, "stdio transport stopped: {}", ec.message());
                rc = 1;
            }
            engine->Shutdown();
        } else {
            engine->ServeHTTP();
        }
    } catch (const std::exception& e) {
        LOG_ERROR(*logger, "server failed: {}", e.what());
        engine->Shutdown();
        rc = 1;
    }

    boost::system::error_code ignored;
    signals.cancel(ignored);
    signalIoc.stop();
    signalThread.join();
    return rc;
}
