//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NotificationHub.cpp
// Purpose: Notification hub implementation over the session registry
//==========================================================================================================

#include "mcpe/NotificationHub.hpp"
#include "mcpe/errors/Errors.h"

namespace mcpe {

NotificationHub::NotificationHub(std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Logger> logger)
    : registry(std::move(registry)), logger(std::move(logger)) {}

void NotificationHub::SendNotification(const std::string& sessionId, const Notification& notification) {
    auto session = registry->Get(sessionId);
    if (!session) {
        throw errors::SessionNotFound(sessionId);
    }
    if (!session->Deliver(notification)) {
        LOG_WARN(*logger, "NotificationHub: {} dropped for session {} (inbox full or closed)", notification.method, sessionId);
        return;
    }
    LOG_DEBUG(*logger, "NotificationHub: {} sent to session {}", notification.method, sessionId);
}

void NotificationHub::BroadcastNotification(const Notification& notification) {
    auto result = registry->Broadcast(notification);
    LOG_DEBUG(*logger, "NotificationHub: broadcast {} delivered={} dropped={}", notification.method, result.delivered, result.dropped);
}

} // namespace mcpe
