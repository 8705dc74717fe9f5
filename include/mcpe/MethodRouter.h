//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRouter.h
// Purpose: JSON-RPC method dispatch table with bounded-time handler execution
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcpe/JSONRPCTypes.h"

namespace mcpe {

class ServerService;

//==========================================================================================================
// CallContext
// Purpose: Per-call execution context handed to method handlers.
// Fields:
//   stop: Requested when the call deadline passes or the caller (root context, HTTP request) cancels.
//   deadline: Absolute time after which the router stops waiting for the handler.
//   sessionId: SSE session the request arrived on, when any.
//==========================================================================================================
struct CallContext {
    std::stop_token stop;
    std::chrono::steady_clock::time_point deadline;
    std::optional<std::string> sessionId;
};

//==========================================================================================================
// MethodHandler
// Purpose: Handler for one method. params is a null JSONValue when the request carried none.
// Returns:
//   The result, or std::nullopt for an empty object result. Structured errors are reported by throwing
//   errors::McpException; errors::DomainError and other std::exception types are mapped by the router.
//==========================================================================================================
using MethodHandler = std::function<std::optional<JSONValue>(const CallContext& ctx, const JSONValue& params)>;

// Side effect for a one-way "notifications/..." message; never produces a response.
using NotificationHook = std::function<void(const JSONRPCRequest& notification)>;

struct CallState;

//==========================================================================================================
// CallCompletion
// Purpose: Tracks a handler that was still running when its call answered with a timeout or
//          cancellation error. Serial transports wait on it before taking the next message.
//          A default-constructed completion is already done.
//==========================================================================================================
class CallCompletion {
public:
    CallCompletion() = default;

    bool Done() const;

    // Blocks until the handler has returned or stop is requested; returns Done().
    bool Wait(std::stop_token stop) const;

private:
    friend class MethodRouter;
    explicit CallCompletion(std::shared_ptr<CallState> state) : state(std::move(state)) {}

    std::shared_ptr<CallState> state;
};

class MethodRouter {
public:
    static constexpr std::chrono::milliseconds DefaultCallTimeout{30000};

    explicit MethodRouter(std::shared_ptr<Logger> logger);
    MethodRouter(std::shared_ptr<Logger> logger, std::chrono::milliseconds callTimeout);

    MethodRouter(const MethodRouter&) = delete;
    MethodRouter& operator=(const MethodRouter&) = delete;

    void Register(const std::string& method, MethodHandler handler);
    void RegisterNotification(const std::string& method, NotificationHook hook);
    bool HasMethod(const std::string& method) const;

    //==========================================================================================================
    // Dispatch
    // Purpose: Route one decoded request.
    // Args:
    //   request: Decoded request.
    //   caller: Cancellation of the caller (process root or transport request).
    //   sessionId: Originating SSE session, if any.
    //   completion: When set, receives a handle on a handler that outlived its timeout or cancellation.
    // Returns:
    //   nullptr for one-way notifications, otherwise a response echoing request.id with exactly one of
    //   result/error. Never throws for handler failures.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> Dispatch(const JSONRPCRequest& request,
                                              std::stop_token caller,
                                              const std::optional<std::string>& sessionId = std::nullopt,
                                              CallCompletion* completion = nullptr);

    //==========================================================================================================
    // HandleMessage
    // Purpose: Full lifecycle for raw bytes: decode, validate, dispatch, encode.
    // Returns:
    //   Serialized response, or std::nullopt when the message was a one-way notification.
    //==========================================================================================================
    std::optional<std::string> HandleMessage(const std::string& bytes,
                                             std::stop_token caller,
                                             const std::optional<std::string>& sessionId = std::nullopt,
                                             CallCompletion* completion = nullptr);

    std::chrono::milliseconds CallTimeout() const { return callTimeout; }

private:
    std::shared_ptr<Logger> logger;
    std::chrono::milliseconds callTimeout;
    mutable std::shared_mutex tableMutex;
    std::unordered_map<std::string, MethodHandler> handlers;
    std::unordered_map<std::string, NotificationHook> notificationHooks;
};

//==========================================================================================================
// RegisterBuiltinMethods
// Purpose: Installs initialize, ping, resources/*, tools/*, prompts/* and a silent
//          notifications/initialized hook, all backed by the application service.
//==========================================================================================================
void RegisterBuiltinMethods(MethodRouter& router, std::shared_ptr<ServerService> service);

} // namespace mcpe
