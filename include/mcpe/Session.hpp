//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.hpp
// Purpose: One live SSE client: bounded event queue, bounded notification inbox and lifecycle signal
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stop_token>
#include <string>
#include <variant>

#include "mcpe/Protocol.h"

namespace mcpe {

//==========================================================================================================
// Session
// Purpose: Queue pair owned by the SSE connection that created it. Producers (the registry broadcast,
//          the /message endpoint) only ever enqueue without blocking; the owning event loop is the
//          single consumer and the only caller of Close().
// Notes:
//   - Close() is idempotent. After it returns every enqueue is rejected, the inbox is released, and
//     the session stop token is signalled.
//   - The event queue is not drained on close; pending frames are simply never written.
//==========================================================================================================
class Session {
public:
    static constexpr std::size_t DefaultQueueCapacity = 100;

    struct Closed {};
    struct IdleTimeout {};
    using Item = std::variant<std::string, Notification, Closed, IdleTimeout>;

    Session(std::string id, std::string userAgent);
    Session(std::string id, std::string userAgent, std::size_t eventQueueCapacity, std::size_t inboxCapacity);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& Id() const { return id; }
    const std::string& UserAgent() const { return userAgent; }

    //==========================================================================================================
    // EnqueueEvent
    // Purpose: Queue an already framed SSE chunk for verbatim writing.
    // Returns:
    //   false when the session is closed or the queue is full (the frame is dropped).
    //==========================================================================================================
    bool EnqueueEvent(std::string frame);

    //==========================================================================================================
    // Deliver
    // Purpose: Non-blocking notification delivery into the inbox.
    // Returns:
    //   false when the session is closed or the inbox is full (the notification is dropped).
    //==========================================================================================================
    bool Deliver(const Notification& notification);

    //==========================================================================================================
    // WaitNext
    // Purpose: Block until an event, a notification, close, root cancellation, or maxWait elapses.
    // Args:
    //   root: Process root stop token; cancellation is reported as Closed.
    //   maxWait: Idle limit; reaching it yields IdleTimeout.
    // Returns:
    //   The next item. Events and notifications are served alternately when both are pending.
    //==========================================================================================================
    Item WaitNext(std::stop_token root, std::chrono::milliseconds maxWait);

    void Close();
    bool IsClosed() const;
    bool IsConnected() const { return !IsClosed(); }

    // Cancelled when the session closes; handlers running for this session may observe it.
    std::stop_token StopToken() const { return stopSource.get_token(); }

    std::size_t PendingEvents() const;
    std::size_t PendingNotifications() const;

private:
    const std::string id;
    const std::string userAgent;
    const std::size_t eventCapacity;
    const std::size_t inboxCapacity;

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<std::string> events;
    std::deque<Notification> inbox;
    bool closed{false};
    bool preferInbox{false};
    std::stop_source stopSource;
};

} // namespace mcpe
