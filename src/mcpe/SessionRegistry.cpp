//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionRegistry.cpp
// Purpose: Session registry implementation
//==========================================================================================================

#include <vector>

#include "mcpe/SessionRegistry.hpp"

namespace mcpe {

SessionRegistry::SessionRegistry(std::shared_ptr<Logger> logger) : logger(std::move(logger)) {}

bool SessionRegistry::Add(const std::shared_ptr<Session>& session) {
    if (!session) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(session->Id());
    if (it != sessions.end()) {
        auto existing = it->second.lock();
        if (existing && !existing->IsClosed()) {
            LOG_WARN(*logger, "SessionRegistry: duplicate session id {}", session->Id());
            return false;
        }
    }
    sessions[session->Id()] = session;
    LOG_DEBUG(*logger, "SessionRegistry: added session {} ({} registered)", session->Id(), sessions.size());
    return true;
}

void SessionRegistry::Remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    if (sessions.erase(id) > 0) {
        LOG_DEBUG(*logger, "SessionRegistry: removed session {} ({} registered)", id, sessions.size());
    }
}

std::shared_ptr<Session> SessionRegistry::Get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return nullptr;
    }
    auto session = it->second.lock();
    if (!session || session->IsClosed()) {
        sessions.erase(it);
        return nullptr;
    }
    return session;
}

SessionRegistry::BroadcastResult SessionRegistry::Broadcast(const Notification& notification) {
    std::vector<std::shared_ptr<Session>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex);
        targets.reserve(sessions.size());
        for (auto it = sessions.begin(); it != sessions.end();) {
            auto session = it->second.lock();
            if (!session) {
                it = sessions.erase(it);
                continue;
            }
            targets.push_back(std::move(session));
            ++it;
        }
    }

    BroadcastResult result;
    for (const auto& session : targets) {
        if (session->Deliver(notification)) {
            ++result.delivered;
        } else {
            ++result.dropped;
            LOG_WARN(*logger, "SessionRegistry: dropped {} for session {} (inbox full or closed)", notification.method, session->Id());
        }
    }
    return result;
}

void SessionRegistry::CloseAll() {
    std::unordered_map<std::string, std::weak_ptr<Session>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex);
        drained.swap(sessions);
    }
    for (auto& [id, handle] : drained) {
        if (auto session = handle.lock()) {
            session->Close();
        }
    }
    if (!drained.empty()) {
        LOG_INFO(*logger, "SessionRegistry: closed {} session(s)", drained.size());
    }
}

std::size_t SessionRegistry::Count() {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto it = sessions.begin(); it != sessions.end();) {
        auto session = it->second.lock();
        if (!session || session->IsClosed()) {
            it = sessions.erase(it);
        } else {
            ++it;
        }
    }
    return sessions.size();
}

} // namespace mcpe
