//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Engine.cpp
// Purpose: Engine wiring and the shutdown sequence
//==========================================================================================================

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "mcpe/Engine.h"
#include "mcpe/HTTPServer.hpp"
#include "mcpe/InMemoryRepositories.hpp"
#include "mcpe/NotificationHub.hpp"
#include "mcpe/StdioTransport.hpp"

namespace mcpe {

class Engine::Impl {
public:
    ServerConfig config;
    std::shared_ptr<Logger> logger;
    std::shared_ptr<SessionRegistry> registry;
    std::shared_ptr<NotificationHub> hub;
    std::shared_ptr<ServerService> service;
    std::shared_ptr<MethodRouter> router;
    std::unique_ptr<HTTPServer> http;

    std::stop_source root;

    std::mutex shutdownMutex;
    std::condition_variable shutdownCv;
    bool shutdownStarted{false};
    bool shutdownDone{false};

    Impl(ServerConfig cfg, std::shared_ptr<Logger> log) : config(std::move(cfg)), logger(std::move(log)) {
        if (!logger) {
            throw std::invalid_argument("Engine: logger is required");
        }
        config.Validate();

        if (!config.resources) config.resources = std::make_shared<InMemoryResourceRepository>();
        if (!config.tools) config.tools = std::make_shared<InMemoryToolRepository>();
        if (!config.prompts) config.prompts = std::make_shared<InMemoryPromptRepository>();
        if (!config.sessions) config.sessions = std::make_shared<InMemorySessionRepository>();

        registry = std::make_shared<SessionRegistry>(logger);
        hub = std::make_shared<NotificationHub>(registry, logger);
        ServerService::Dependencies deps{config.resources, config.tools, config.prompts, config.sessions, hub, logger};
        service = std::make_shared<ServerService>(ServerInfo{config.name, config.version, config.instructions},
                                                  std::move(deps));
        router = std::make_shared<MethodRouter>(logger, config.requestTimeout);
        RegisterBuiltinMethods(*router, service);
        if (config.registerEchoTool) {
            RegisterEchoTool(*service);
        }
        LOG_INFO(*logger, "Engine: {} {} ready", config.name, config.version);
    }

    unsigned short startHTTP() {
        std::lock_guard<std::mutex> lock(shutdownMutex);
        if (shutdownStarted) {
            throw std::logic_error("Engine: already shut down");
        }
        if (http) {
            return http->LocalPort();
        }
        auto listen = ParseListenAddress(config.address);
        HTTPServer::Options opts;
        opts.address = listen.host;
        opts.port = listen.port;
        opts.scheme = config.scheme;
        opts.certFile = config.certFile;
        opts.keyFile = config.keyFile;
        opts.ioThreads = config.ioThreads;
        opts.workerThreads = config.workerThreads;
        opts.keepAliveInterval = config.keepAliveInterval;
        opts.sessionQueueCapacity = config.sessionQueueCapacity;
        http = std::make_unique<HTTPServer>(opts, HTTPServer::Dependencies{router, service, registry, logger});
        http->SetErrorHandler([logger = logger](const std::string& msg) {
            LOG_DEBUG(*logger, "Engine: transport error reported: {}", msg);
        });
        http->Start(root.get_token()).wait();
        return http->LocalPort();
    }

    void shutdown() {
        {
            std::unique_lock<std::mutex> lock(shutdownMutex);
            if (shutdownStarted) {
                // A concurrent caller finishes the sequence; wait for it
                shutdownCv.wait(lock, [this] { return shutdownDone; });
                return;
            }
            shutdownStarted = true;
        }
        LOG_INFO(*logger, "Engine: shutting down");
        root.request_stop();
        if (http) {
            http->Stop(config.shutdownGrace);
        }
        registry->CloseAll();
        std::this_thread::sleep_for(config.drainDelay);
        {
            std::lock_guard<std::mutex> lock(shutdownMutex);
            shutdownDone = true;
        }
        shutdownCv.notify_all();
        LOG_INFO(*logger, "Engine: shutdown complete");
    }

    void waitForShutdown() {
        std::unique_lock<std::mutex> lock(shutdownMutex);
        shutdownCv.wait(lock, [this] { return shutdownDone; });
    }
};

Engine::Engine(ServerConfig config, std::shared_ptr<Logger> logger)
    : pImpl(std::make_unique<Impl>(std::move(config), std::move(logger))) {}

Engine::~Engine() {
    pImpl->shutdown();
}

unsigned short Engine::StartHTTP() {
    return pImpl->startHTTP();
}

void Engine::ServeHTTP() {
    StartHTTP();
    pImpl->waitForShutdown();
}

std::error_code Engine::ServeStdio(std::stop_token stop) {
    // Either the caller or the engine root ends the loop
    std::stop_source combined;
    std::stop_callback onCaller(stop, [&combined] { combined.request_stop(); });
    std::stop_callback onRoot(pImpl->root.get_token(), [&combined] { combined.request_stop(); });

    StdioTransport transport(pImpl->router, pImpl->logger);
    transport.SetErrorHandler([logger = pImpl->logger](const std::string& msg) {
        LOG_DEBUG(*logger, "Engine: stdio error reported: {}", msg);
    });
    return transport.Run(combined.get_token());
}

void Engine::Shutdown() {
    pImpl->shutdown();
}

std::shared_ptr<ServerService> Engine::Service() const { return pImpl->service; }
std::shared_ptr<MethodRouter> Engine::Router() const { return pImpl->router; }
std::shared_ptr<SessionRegistry> Engine::Registry() const { return pImpl->registry; }
const ServerConfig& Engine::Config() const { return pImpl->config; }
std::stop_token Engine::RootToken() const { return pImpl->root.get_token(); }

} // namespace mcpe
