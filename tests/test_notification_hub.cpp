//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_notification_hub.cpp
// Purpose: Tests for targeted and broadcast notification delivery
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>

#include "TestSupport.h"
#include "mcpe/NotificationHub.hpp"
#include "mcpe/errors/Errors.h"

using namespace mcpe;
using namespace std::chrono_literals;

TEST(NotificationHub, TargetedDeliveryReachesOnlyThatSession) {
    auto registry = std::make_shared<SessionRegistry>(test::QuietLogger());
    NotificationHub hub(registry, test::QuietLogger());
    auto a = std::make_shared<Session>("a", "");
    auto b = std::make_shared<Session>("b", "");
    registry->Add(a);
    registry->Add(b);

    Notification n;
    n.method = "custom/progress";
    n.params["percent"] = std::make_shared<JSONValue>(int64_t{50});
    hub.SendNotification("b", n);

    EXPECT_EQ(a->PendingNotifications(), 0u);
    auto item = b->WaitNext(std::stop_token{}, 100ms);
    ASSERT_TRUE(std::holds_alternative<Notification>(item));
    const auto& got = std::get<Notification>(item);
    EXPECT_EQ(got.method, "custom/progress");
    EXPECT_EQ(std::get<int64_t>(got.params.at("percent")->value), 50);
}

TEST(NotificationHub, UnknownOrClosedSessionIsNotFound) {
    auto registry = std::make_shared<SessionRegistry>(test::QuietLogger());
    NotificationHub hub(registry, test::QuietLogger());
    Notification n;
    n.method = "x";
    EXPECT_THROW(hub.SendNotification("missing", n), errors::SessionNotFound);

    auto s = std::make_shared<Session>("s", "");
    registry->Add(s);
    s->Close();
    EXPECT_THROW(hub.SendNotification("s", n), errors::SessionNotFound);
}

TEST(NotificationHub, FullInboxDropsWithoutError) {
    auto registry = std::make_shared<SessionRegistry>(test::QuietLogger());
    NotificationHub hub(registry, test::QuietLogger());
    auto s = std::make_shared<Session>("s", "", 10, 1);
    registry->Add(s);
    Notification n;
    n.method = "x";
    hub.SendNotification("s", n);
    EXPECT_NO_THROW(hub.SendNotification("s", n));
    EXPECT_EQ(s->PendingNotifications(), 1u);
}

TEST(NotificationHub, BroadcastWithNoSessionsIsANoOp) {
    auto registry = std::make_shared<SessionRegistry>(test::QuietLogger());
    NotificationHub hub(registry, test::QuietLogger());
    Notification n;
    n.method = Methods::ResourcesListChanged;
    EXPECT_NO_THROW(hub.BroadcastNotification(n));

    auto s = std::make_shared<Session>("s", "");
    registry->Add(s);
    hub.BroadcastNotification(n);
    EXPECT_EQ(s->PendingNotifications(), 1u);
}
