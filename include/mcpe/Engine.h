//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Engine.h
// Purpose: Assembles repositories, sessions, notifications, service, router and transports into one server
//==========================================================================================================

#pragma once

#include <memory>
#include <stop_token>
#include <system_error>

#include "logging/Logger.h"
#include "mcpe/MethodRouter.h"
#include "mcpe/ServerConfig.h"
#include "mcpe/ServerService.h"
#include "mcpe/SessionRegistry.hpp"

namespace mcpe {

class Engine {
public:
    // Validates config (std::invalid_argument on failure) and wires every component.
    Engine(ServerConfig config, std::shared_ptr<Logger> logger);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    //==========================================================================================================
    // StartHTTP
    // Purpose: Binds and starts the HTTP(S) listener without blocking.
    // Returns:
    //   The bound port.
    //==========================================================================================================
    unsigned short StartHTTP();

    // StartHTTP, then block until Shutdown() completes.
    void ServeHTTP();

    //==========================================================================================================
    // ServeStdio
    // Purpose: Runs the newline-delimited stdio loop on the calling thread.
    // Args:
    //   stop: Caller cancellation; the engine root token stops the loop as well.
    // Returns:
    //   Empty on end of input or cancellation, the terminal I/O error otherwise.
    //==========================================================================================================
    std::error_code ServeStdio(std::stop_token stop);

    //==========================================================================================================
    // Shutdown
    // Purpose: Cancels the root token, stops the HTTP listener within the grace period, then waits the
    //          drain delay. Idempotent and safe from any thread.
    //==========================================================================================================
    void Shutdown();

    std::shared_ptr<ServerService> Service() const;
    std::shared_ptr<MethodRouter> Router() const;
    std::shared_ptr<SessionRegistry> Registry() const;
    const ServerConfig& Config() const;
    std::stop_token RootToken() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpe
