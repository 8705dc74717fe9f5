//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.hpp
// Purpose: Concurrency-safe lookup table of live SSE sessions used for targeted and broadcast delivery
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcpe/Session.hpp"

namespace mcpe {

//==========================================================================================================
// SessionRegistry
// Purpose: Holds non-owning (weak) handles to sessions keyed by id. The SSE connection owns the
//          Session; the registry never keeps one alive and never yields a closed one.
// Notes:
//   - Broadcast copies the live handles under the lock and delivers after releasing it. Delivery is a
//     non-blocking enqueue; a full inbox drops the notification for that session only.
//   - A session removed (or closed) before delivery observes nothing, because Session::Deliver checks
//     its closed flag under the same lock that Close() sets it.
//==========================================================================================================
class SessionRegistry {
public:
    struct BroadcastResult {
        std::size_t delivered{0};
        std::size_t dropped{0};
    };

    explicit SessionRegistry(std::shared_ptr<Logger> logger);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Registers a session. Returns false when the id is already registered to a live session.
    bool Add(const std::shared_ptr<Session>& session);

    void Remove(const std::string& id);

    // Returns the live session or nullptr when unknown, removed, closed or destroyed.
    std::shared_ptr<Session> Get(const std::string& id);

    BroadcastResult Broadcast(const Notification& notification);

    // Closes and forgets every registered session (shutdown path).
    void CloseAll();

    std::size_t Count();

private:
    std::shared_ptr<Logger> logger;
    std::mutex mutex;
    std::unordered_map<std::string, std::weak_ptr<Session>> sessions;
};

} // namespace mcpe
