//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Engine configuration with named fields, environment overrides and validation
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "mcpe/Repositories.h"
#include "mcpe/version.h"

namespace mcpe {

//==========================================================================================================
// ServerConfig
// Purpose: Everything needed to assemble an Engine. Repository pointers left empty get in-memory defaults.
// Fields:
//   name/version/instructions: Identity reported by initialize and /status.
//   address: Listen address, "host:port", ":port" (all interfaces) or "[v6]:port".
//   scheme: "http" or "https"; https requires certFile and keyFile.
//   requestTimeout: Per-call deadline enforced by the method router.
//   shutdownGrace: Time the HTTP listener waits for in-flight work on shutdown.
//   drainDelay: Pause after the listener stops, before the process may exit.
//   keepAliveInterval: Idle time before an SSE stream receives a keep-alive comment.
//   sessionQueueCapacity: Bound for each SSE session's event queue and notification inbox.
//   ioThreads/workerThreads: HTTP I/O threads and blocking dispatch pool size.
//   registerEchoTool: Install the built-in "echo" tool.
//==========================================================================================================
struct ServerConfig {
    std::string name{"mcp-engine"};
    std::string version{getVersionString()};
    std::string instructions;

    std::string address{":8080"};
    std::string scheme{"http"};
    std::string certFile;
    std::string keyFile;

    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds shutdownGrace{5000};
    std::chrono::milliseconds drainDelay{500};
    std::chrono::milliseconds keepAliveInterval{15000};
    std::size_t sessionQueueCapacity{100};
    std::size_t ioThreads{1};
    std::size_t workerThreads{4};

    bool registerEchoTool{true};

    std::shared_ptr<IResourceRepository> resources;
    std::shared_ptr<IToolRepository> tools;
    std::shared_ptr<IPromptRepository> prompts;
    std::shared_ptr<ISessionRepository> sessions;

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Defaults overridden by MCPE_NAME, MCPE_VERSION, MCPE_INSTRUCTIONS, MCPE_ADDR, MCPE_SCHEME,
    //          MCPE_CERT_FILE, MCPE_KEY_FILE, MCPE_REQUEST_TIMEOUT_MS and MCPE_SHUTDOWN_GRACE_MS.
    // Notes:
    //   Unparsable durations are ignored; the rest is checked by Validate().
    //==========================================================================================================
    static ServerConfig FromEnvironment();

    // Throws std::invalid_argument naming the first offending field.
    void Validate() const;
};

struct ListenAddress {
    std::string host;
    std::string port;
};

//==========================================================================================================
// ParseListenAddress
// Purpose: Splits "host:port", ":port" and "[v6]:port". An empty host means all IPv4 interfaces.
// Returns:
//   Host and numeric port string. Throws std::invalid_argument when malformed.
//==========================================================================================================
ListenAddress ParseListenAddress(const std::string& address);

} // namespace mcpe
