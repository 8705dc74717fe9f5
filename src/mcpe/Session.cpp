//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session queue and lifecycle implementation
//==========================================================================================================

#include "mcpe/Session.hpp"

namespace mcpe {

Session::Session(std::string id, std::string userAgent)
    : Session(std::move(id), std::move(userAgent), DefaultQueueCapacity, DefaultQueueCapacity) {}

Session::Session(std::string id, std::string userAgent, std::size_t eventQueueCapacity, std::size_t inboxCapacity)
    : id(std::move(id)),
      userAgent(std::move(userAgent)),
      eventCapacity(eventQueueCapacity),
      inboxCapacity(inboxCapacity) {}

bool Session::EnqueueEvent(std::string frame) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed || events.size() >= eventCapacity) {
            return false;
        }
        events.push_back(std::move(frame));
    }
    cv.notify_one();
    return true;
}

bool Session::Deliver(const Notification& notification) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed || inbox.size() >= inboxCapacity) {
            return false;
        }
        inbox.push_back(notification);
    }
    cv.notify_one();
    return true;
}

Session::Item Session::WaitNext(std::stop_token root, std::chrono::milliseconds maxWait) {
    std::unique_lock<std::mutex> lock(mutex);
    const bool ready = cv.wait_for(lock, root, maxWait, [this] {
        return closed || !events.empty() || !inbox.empty();
    });
    if (closed || root.stop_requested()) {
        return Closed{};
    }
    if (!ready) {
        return IdleTimeout{};
    }
    // Alternate between the two queues so neither can starve the other
    const bool takeInbox = !inbox.empty() && (events.empty() || preferInbox);
    preferInbox = !takeInbox;
    if (takeInbox) {
        Notification n = std::move(inbox.front());
        inbox.pop_front();
        return n;
    }
    std::string frame = std::move(events.front());
    events.pop_front();
    return frame;
}

void Session::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            return;
        }
        closed = true;
        inbox.clear();
        inbox.shrink_to_fit();
    }
    stopSource.request_stop();
    cv.notify_all();
}

bool Session::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

std::size_t Session::PendingEvents() const {
    std::lock_guard<std::mutex> lock(mutex);
    return events.size();
}

std::size_t Session::PendingNotifications() const {
    std::lock_guard<std::mutex> lock(mutex);
    return inbox.size();
}

} // namespace mcpe
