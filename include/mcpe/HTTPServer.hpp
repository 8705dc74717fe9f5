//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS listener using Boost.Beast (TLS 1.3 only for HTTPS) serving
//          JSON-RPC POSTs, SSE streams and the SSE /message companion endpoint
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <string>

#include "logging/Logger.h"
#include "mcpe/MethodRouter.h"
#include "mcpe/ServerService.h"
#include "mcpe/SessionRegistry.hpp"

namespace mcpe {

class HTTPServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Listener configuration.
    // Fields:
    //   address/port: Bind endpoint; port "0" picks an ephemeral port (see LocalPort()).
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   ioThreads: Threads running the I/O context.
    //   workerThreads: Pool running blocking method dispatch off the I/O threads.
    //   keepAliveInterval: Idle time after which an SSE stream receives a keep-alive comment.
    //   sessionQueueCapacity: Event queue and inbox bound for each SSE session.
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8080"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::size_t ioThreads{1};
        std::size_t workerThreads{4};
        std::chrono::milliseconds keepAliveInterval{15000};
        std::size_t sessionQueueCapacity{100};
    };

    struct Dependencies {
        std::shared_ptr<MethodRouter> router;
        std::shared_ptr<ServerService> service;
        std::shared_ptr<SessionRegistry> registry;
        std::shared_ptr<Logger> logger;
    };

    using ErrorHandler = std::function<void(const std::string&)>;

    // Throws std::invalid_argument for a missing dependency, a bad scheme or an unusable port.
    HTTPServer(const Options& opts, Dependencies deps);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Binds the listener (throwing on failure) and starts the accept loop on background threads.
    // Args:
    //   root: Process root stop token; in-flight calls and SSE loops observe it.
    // Returns:
    //   Future that becomes ready once the I/O threads are running.
    //==========================================================================================================
    std::future<void> Start(std::stop_token root);

    //==========================================================================================================
    // Stop
    // Purpose: Stops accepting, closes SSE sessions, waits up to grace for in-flight requests and streams,
    //          then stops the I/O context and joins its threads. Safe to call more than once.
    //==========================================================================================================
    void Stop(std::chrono::milliseconds grace);

    // Bound port; valid after Start().
    unsigned short LocalPort() const;

    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpe
