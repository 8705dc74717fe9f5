//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Environment overrides, address parsing and validation for ServerConfig
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "env/EnvVars.h"
#include "mcpe/ServerConfig.h"

namespace mcpe {

ServerConfig ServerConfig::FromEnvironment() {
    ServerConfig cfg;
    cfg.name = GetEnvOrDefault("MCPE_NAME", cfg.name);
    cfg.version = GetEnvOrDefault("MCPE_VERSION", cfg.version);
    cfg.instructions = GetEnvOrDefault("MCPE_INSTRUCTIONS", cfg.instructions);
    cfg.address = GetEnvOrDefault("MCPE_ADDR", cfg.address);
    cfg.scheme = GetEnvOrDefault("MCPE_SCHEME", cfg.scheme);
    cfg.certFile = GetEnvOrDefault("MCPE_CERT_FILE", cfg.certFile);
    cfg.keyFile = GetEnvOrDefault("MCPE_KEY_FILE", cfg.keyFile);
    if (auto t = GetEnvMillis("MCPE_REQUEST_TIMEOUT_MS")) {
        cfg.requestTimeout = *t;
    }
    if (auto g = GetEnvMillis("MCPE_SHUTDOWN_GRACE_MS")) {
        cfg.shutdownGrace = *g;
    }
    return cfg;
}

void ServerConfig::Validate() const {
    if (name.empty()) {
        throw std::invalid_argument("ServerConfig: name must not be empty");
    }
    if (version.empty()) {
        throw std::invalid_argument("ServerConfig: version must not be empty");
    }
    if (requestTimeout.count() <= 0) {
        throw std::invalid_argument("ServerConfig: requestTimeout must be positive");
    }
    if (shutdownGrace.count() < 0 || drainDelay.count() < 0) {
        throw std::invalid_argument("ServerConfig: shutdownGrace and drainDelay must not be negative");
    }
    if (keepAliveInterval.count() <= 0) {
        throw std::invalid_argument("ServerConfig: keepAliveInterval must be positive");
    }
    if (sessionQueueCapacity == 0) {
        throw std::invalid_argument("ServerConfig: sessionQueueCapacity must be positive");
    }
    if (ioThreads == 0 || workerThreads == 0) {
        throw std::invalid_argument("ServerConfig: ioThreads and workerThreads must be positive");
    }
    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument("ServerConfig: scheme must be http or https");
    }
    if (scheme == "https" && (certFile.empty() || keyFile.empty())) {
        throw std::invalid_argument("ServerConfig: https requires certFile and keyFile");
    }
    (void)ParseListenAddress(address);
}

ListenAddress ParseListenAddress(const std::string& address) {
    ListenAddress out;
    std::string portPart;
    if (!address.empty() && address.front() == '[') {
        auto rb = address.find(']');
        if (rb == std::string::npos || rb + 1 >= address.size() || address[rb + 1] != ':') {
            throw std::invalid_argument("invalid listen address: " + address);
        }
        out.host = address.substr(1, rb - 1);
        portPart = address.substr(rb + 2);
    } else {
        auto colon = address.rfind(':');
        if (colon == std::string::npos) {
            throw std::invalid_argument("listen address needs a port: " + address);
        }
        out.host = address.substr(0, colon);
        portPart = address.substr(colon + 1);
    }
    if (out.host.empty()) {
        out.host = "0.0.0.0";
    }
    const bool numeric = !portPart.empty() && portPart.size() <= 5 &&
                         std::all_of(portPart.begin(), portPart.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!numeric || std::stoul(portPart) > 65535ul) {
        throw std::invalid_argument("invalid port in listen address: " + address);
    }
    out.port = portPart;
    return out;
}

} // namespace mcpe
