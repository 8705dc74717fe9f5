//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRouter.cpp
// Purpose: Method dispatch, per-call deadline enforcement and error mapping at the router boundary
//==========================================================================================================

#include <condition_variable>
#include <exception>
#include <format>
#include <mutex>
#include <thread>

#include "mcpe/MessageCodec.h"
#include "mcpe/MethodRouter.h"
#include "mcpe/errors/Errors.h"

namespace mcpe {

// Shared between the dispatching thread and the handler thread; outlives whichever finishes last.
struct CallState {
    std::mutex mutex;
    std::condition_variable_any cv;
    bool done{false};
    std::optional<JSONValue> result;
    std::exception_ptr failure;
    std::stop_source stop;
};

bool CallCompletion::Done() const {
    if (!state) return true;
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->done;
}

bool CallCompletion::Wait(std::stop_token stop) const {
    if (!state) return true;
    std::unique_lock<std::mutex> lock(state->mutex);
    return state->cv.wait(lock, stop, [this] { return state->done; });
}

namespace {

errors::McpError mapFailure(const std::exception_ptr& failure) {
    try {
        std::rethrow_exception(failure);
    } catch (const errors::McpException& e) {
        return e.error();
    } catch (const errors::DomainError& e) {
        if (e.code() == JSONRPCErrorCodes::NotFound || e.code() == JSONRPCErrorCodes::BadRequest) {
            return errors::makeError(e.code(), e.what());
        }
        return errors::makeError(JSONRPCErrorCodes::InternalError, std::string("Internal error: ") + e.what());
    } catch (const std::exception& e) {
        return errors::makeError(JSONRPCErrorCodes::InternalError, std::string("Internal error: ") + e.what());
    }
}

} // namespace

MethodRouter::MethodRouter(std::shared_ptr<Logger> logger)
    : MethodRouter(std::move(logger), DefaultCallTimeout) {}

MethodRouter::MethodRouter(std::shared_ptr<Logger> logger, std::chrono::milliseconds callTimeout)
    : logger(std::move(logger)), callTimeout(callTimeout) {}

void MethodRouter::Register(const std::string& method, MethodHandler handler) {
    std::unique_lock<std::shared_mutex> lock(tableMutex);
    handlers[method] = std::move(handler);
}

void MethodRouter::RegisterNotification(const std::string& method, NotificationHook hook) {
    std::unique_lock<std::shared_mutex> lock(tableMutex);
    notificationHooks[method] = std::move(hook);
}

bool MethodRouter::HasMethod(const std::string& method) const {
    std::shared_lock<std::shared_mutex> lock(tableMutex);
    return handlers.find(method) != handlers.end();
}

std::unique_ptr<JSONRPCResponse> MethodRouter::Dispatch(const JSONRPCRequest& request,
                                                        std::stop_token caller,
                                                        const std::optional<std::string>& sessionId,
                                                        CallCompletion* completion) {
    if (request.IsOneWay()) {
        NotificationHook hook;
        {
            std::shared_lock<std::shared_mutex> lock(tableMutex);
            auto it = notificationHooks.find(request.method);
            if (it != notificationHooks.end()) hook = it->second;
        }
        if (hook) {
            try {
                hook(request);
            } catch (const std::exception& e) {
                LOG_ERROR(*logger, "MethodRouter: notification hook for {} failed: {}", request.method, e.what());
            }
        } else {
            LOG_DEBUG(*logger, "MethodRouter: notification {} has no hook", request.method);
        }
        return nullptr;
    }

    MethodHandler handler;
    {
        std::shared_lock<std::shared_mutex> lock(tableMutex);
        auto it = handlers.find(request.method);
        if (it != handlers.end()) handler = it->second;
    }
    if (!handler) {
        LOG_DEBUG(*logger, "MethodRouter: method not found: {}", request.method);
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                   std::format("Method '{}' not found", request.method));
    }

    LOG_DEBUG(*logger, "MethodRouter: dispatching {} id={}", request.method, IdToString(request.id));

    auto state = std::make_shared<CallState>();
    const auto deadline = std::chrono::steady_clock::now() + callTimeout;
    CallContext ctx{state->stop.get_token(), deadline, sessionId};
    JSONValue params = request.params.value_or(JSONValue());

    // Caller cancellation propagates into the per-call token and wakes the waiter below
    std::stop_callback forwardCancel(caller, [state] {
        state->stop.request_stop();
        std::lock_guard<std::mutex> lock(state->mutex);
        state->cv.notify_all();
    });

    std::thread([state, handler = std::move(handler), ctx, params = std::move(params)]() {
        std::optional<JSONValue> result;
        std::exception_ptr failure;
        try {
            result = handler(ctx, params);
        } catch (...) {
            failure = std::current_exception();
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->result = std::move(result);
            state->failure = failure;
            state->done = true;
        }
        state->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(state->mutex);
    const bool finished = state->cv.wait_until(lock, deadline, [&] {
        return state->done || state->stop.stop_requested();
    });

    if (!state->done) {
        state->stop.request_stop();
        if (completion) {
            *completion = CallCompletion(state);
        }
        if (!finished) {
            LOG_WARN(*logger, "MethodRouter: {} id={} timed out after {} ms", request.method, IdToString(request.id),
                     static_cast<long long>(callTimeout.count()));
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError,
                                       std::format("Internal error: request timed out after {} ms",
                                                   static_cast<long long>(callTimeout.count())));
        }
        LOG_INFO(*logger, "MethodRouter: {} id={} cancelled by caller", request.method, IdToString(request.id));
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Internal error: request cancelled");
    }

    if (state->failure) {
        auto err = mapFailure(state->failure);
        if (err.code == JSONRPCErrorCodes::InternalError) {
            LOG_ERROR(*logger, "MethodRouter: {} id={} failed: {}", request.method, IdToString(request.id), err.message);
        }
        return errors::makeErrorResponse(request.id, err);
    }

    auto response = std::make_unique<JSONRPCResponse>();
    response->id = request.id;
    response->result = state->result.has_value() ? std::move(state->result.value()) : JSONValue(JSONValue::Object{});
    return response;
}

std::optional<std::string> MethodRouter::HandleMessage(const std::string& bytes,
                                                       std::stop_token caller,
                                                       const std::optional<std::string>& sessionId,
                                                       CallCompletion* completion) {
    auto decoded = codec::Decode(bytes);
    if (auto* err = std::get_if<codec::DecodeError>(&decoded)) {
        LOG_WARN(*logger, "MethodRouter: rejected message ({}): {}", err->error.code, err->error.message);
        return codec::EncodeError(err->id, err->error);
    }
    auto response = Dispatch(std::get<JSONRPCRequest>(decoded), std::move(caller), sessionId, completion);
    if (!response) {
        return std::nullopt;
    }
    return codec::EncodeResponse(*response);
}

} // namespace mcpe
