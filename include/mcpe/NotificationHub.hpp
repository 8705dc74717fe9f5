//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NotificationHub.hpp
// Purpose: Targeted and broadcast delivery of server notifications to registered SSE sessions
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "logging/Logger.h"
#include "mcpe/Protocol.h"
#include "mcpe/SessionRegistry.hpp"

namespace mcpe {

//==========================================================================================================
// INotificationSender
// Purpose: Delivery seam used by the application service to publish change notifications.
// Methods:
//   SendNotification(sessionId, n): Deliver to one session; throws errors::SessionNotFound when the id is
//                                   not registered.
//   BroadcastNotification(n): Deliver to every registered session.
//==========================================================================================================
class INotificationSender {
public:
    virtual ~INotificationSender() = default;
    virtual void SendNotification(const std::string& sessionId, const Notification& notification) = 0;
    virtual void BroadcastNotification(const Notification& notification) = 0;
};

class NotificationHub : public INotificationSender {
public:
    NotificationHub(std::shared_ptr<SessionRegistry> registry, std::shared_ptr<Logger> logger);

    void SendNotification(const std::string& sessionId, const Notification& notification) override;
    void BroadcastNotification(const Notification& notification) override;

private:
    std::shared_ptr<SessionRegistry> registry;
    std::shared_ptr<Logger> logger;
};

} // namespace mcpe
