//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SSE.h
// Purpose: Server-Sent Events session lifecycle: framing, per-connection event loop and /message intake
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "logging/Logger.h"
#include "mcpe/MethodRouter.h"
#include "mcpe/ServerService.h"
#include "mcpe/Session.hpp"
#include "mcpe/SessionRegistry.hpp"

namespace mcpe {
namespace sse {

///////////////////////////////////////// Framing ///////////////////////////////////////////
// Comment frame written while idle so dead peers surface as write failures
constexpr const char* KeepAliveFrame = ": ping\n\n";

std::string FormatConnectedEvent(const std::string& sessionId);
std::string FormatEndpointEvent(const std::string& messagePath, const std::string& sessionId);
std::string FormatMessageEvent(const std::string& json);

// Fresh random (version 4) UUID string
std::string NewSessionId();

//==========================================================================================================
// ISSEWriter
// Purpose: Output side of one text/event-stream response.
// Notes:
//   WriteHeaders and WriteAndFlush throw on I/O failure; the event loop treats that as peer disconnect.
//==========================================================================================================
class ISSEWriter {
public:
    virtual ~ISSEWriter() = default;
    virtual bool SupportsFlush() const = 0;
    virtual void WriteHeaders() = 0;
    virtual void WriteAndFlush(const std::string& chunk) = 0;
};

struct StreamOptions {
    std::chrono::milliseconds keepAliveInterval{15000};
    std::string messagePath{"/message"};
};

struct StreamDependencies {
    std::shared_ptr<SessionRegistry> registry;
    std::shared_ptr<ServerService> service;
    std::shared_ptr<Logger> logger;
};

enum class StreamExit {
    Unsupported,    // writer cannot flush; nothing was registered
    SessionClosed,  // session closed by registry or server
    RootCancelled,  // process root cancelled
    PeerGone        // write failed
};

//==========================================================================================================
// ServeStream
// Purpose: Runs one SSE connection from Connecting through Streaming to Closed on the calling thread.
// Args:
//   deps: Registry, service (session bookkeeping) and logger.
//   session: Freshly created session owned by this call for its lifetime.
//   writer: Response writer for the connection.
//   root: Process root stop token.
//   opts: Keep-alive interval and the /message path announced to the client.
// Returns:
//   Why the stream ended. On every exit path except Unsupported the session is removed from the
//   registry and the service, then closed.
//==========================================================================================================
StreamExit ServeStream(const StreamDependencies& deps,
                       const std::shared_ptr<Session>& session,
                       ISSEWriter& writer,
                       std::stop_token root,
                       const StreamOptions& opts = {});

struct MessageOutcome {
    int httpStatus{202};
    std::string body;
};

//==========================================================================================================
// HandleMessage
// Purpose: Companion POST /message intake. Routes the body through the router and pushes the reply into
//          the session's event queue instead of the HTTP response.
// Returns:
//   202 {"status":"accepted"} on success, 400 with a JSON-RPC error for a missing or unknown session.
//==========================================================================================================
MessageOutcome HandleMessage(SessionRegistry& registry,
                             MethodRouter& router,
                             Logger& logger,
                             const std::optional<std::string>& sessionId,
                             const std::string& body,
                             std::stop_token root);

} // namespace sse
} // namespace mcpe
