//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SSE.cpp
// Purpose: SSE framing, event loop and /message intake
//==========================================================================================================

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <mutex>
#include <type_traits>
#include <variant>

#include "mcpe/MessageCodec.h"
#include "mcpe/SSE.h"
#include "mcpe/errors/Errors.h"

namespace mcpe {
namespace sse {

std::string FormatConnectedEvent(const std::string& sessionId) {
    return "event: connected\ndata: {\"sessionId\": \"" + sessionId + "\"}\n\n";
}

std::string FormatEndpointEvent(const std::string& messagePath, const std::string& sessionId) {
    return "event: endpoint\ndata: " + messagePath + "?sessionId=" + sessionId + "\n\n";
}

std::string FormatMessageEvent(const std::string& json) {
    return "event: message\ndata: " + json + "\n\n";
}

std::string NewSessionId() {
    // random_generator is not thread-safe; one per thread
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

namespace {

void forgetSession(const StreamDependencies& deps, const std::shared_ptr<Session>& session) {
    deps.registry->Remove(session->Id());
    try {
        deps.service->UnregisterSession(session->Id());
    } catch (const std::exception& e) {
        LOG_WARN(*deps.logger, "SSE: failed to unregister session {}: {}", session->Id(), e.what());
    }
    session->Close();
}

} // namespace

StreamExit ServeStream(const StreamDependencies& deps,
                       const std::shared_ptr<Session>& session,
                       ISSEWriter& writer,
                       std::stop_token root,
                       const StreamOptions& opts) {
    ///////////////////////////////////////// Connecting ///////////////////////////////////////////
    if (!writer.SupportsFlush()) {
        LOG_ERROR(*deps.logger, "SSE: streaming unsupported by response writer");
        session->Close();
        return StreamExit::Unsupported;
    }

    if (!deps.registry->Add(session)) {
        LOG_ERROR(*deps.logger, "SSE: duplicate session id {}", session->Id());
        session->Close();
        return StreamExit::SessionClosed;
    }
    try {
        deps.service->RegisterSession(ClientSession{session->Id(), session->UserAgent(), true});
    } catch (const std::exception& e) {
        LOG_WARN(*deps.logger, "SSE: failed to record session {}: {}", session->Id(), e.what());
    }

    try {
        writer.WriteHeaders();
        writer.WriteAndFlush(FormatConnectedEvent(session->Id()));
        writer.WriteAndFlush(FormatEndpointEvent(opts.messagePath, session->Id()));
    } catch (const std::exception& e) {
        LOG_INFO(*deps.logger, "SSE: session {} lost during handshake: {}", session->Id(), e.what());
        forgetSession(deps, session);
        return StreamExit::PeerGone;
    }
    LOG_INFO(*deps.logger, "SSE: session {} connected (user agent: {})", session->Id(), session->UserAgent());

    ///////////////////////////////////////// Streaming ///////////////////////////////////////////
    StreamExit exit = StreamExit::SessionClosed;
    for (bool streaming = true; streaming;) {
        Session::Item item = session->WaitNext(root, opts.keepAliveInterval);
        try {
            std::visit([&](auto&& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    writer.WriteAndFlush(v);
                } else if constexpr (std::is_same_v<T, Notification>) {
                    writer.WriteAndFlush(FormatMessageEvent(codec::EncodeNotification(v)));
                } else if constexpr (std::is_same_v<T, Session::IdleTimeout>) {
                    writer.WriteAndFlush(KeepAliveFrame);
                } else {
                    exit = root.stop_requested() ? StreamExit::RootCancelled : StreamExit::SessionClosed;
                    streaming = false;
                }
            }, item);
        } catch (const std::exception& e) {
            LOG_INFO(*deps.logger, "SSE: session {} write failed: {}", session->Id(), e.what());
            exit = StreamExit::PeerGone;
            streaming = false;
        }
    }

    ///////////////////////////////////////// Closed ///////////////////////////////////////////
    forgetSession(deps, session);
    LOG_INFO(*deps.logger, "SSE: session {} closed", session->Id());
    return exit;
}

MessageOutcome HandleMessage(SessionRegistry& registry,
                             MethodRouter& router,
                             Logger& logger,
                             const std::optional<std::string>& sessionId,
                             const std::string& body,
                             std::stop_token root) {
    if (!sessionId.has_value() || sessionId->empty()) {
        return MessageOutcome{400, codec::EncodeError(JSONRPCId{nullptr},
                                                      errors::makeError(JSONRPCErrorCodes::InvalidParams, "Missing sessionId"))};
    }
    auto session = registry.Get(*sessionId);
    if (!session) {
        LOG_WARN(logger, "SSE: message for unknown session {}", *sessionId);
        return MessageOutcome{400, codec::EncodeError(JSONRPCId{nullptr},
                                                      errors::makeError(JSONRPCErrorCodes::InvalidParams, "Invalid session ID"))};
    }

    // The call is cancelled by either the process root or the session closing
    std::stop_source callStop;
    std::stop_callback onRoot(root, [&callStop] { callStop.request_stop(); });
    std::stop_callback onSession(session->StopToken(), [&callStop] { callStop.request_stop(); });

    auto reply = router.HandleMessage(body, callStop.get_token(), *sessionId);
    if (reply.has_value() && !session->EnqueueEvent(FormatMessageEvent(*reply))) {
        LOG_WARN(logger, "SSE: dropped reply for session {} (closed or queue full)", *sessionId);
    }
    return MessageOutcome{202, "{\"status\":\"accepted\"}"};
}

} // namespace sse
} // namespace mcpe
