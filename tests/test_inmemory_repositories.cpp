//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_repositories.cpp
// Purpose: Tests for the in-memory repository implementations
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "mcpe/InMemoryRepositories.hpp"
#include "mcpe/errors/Errors.h"

using namespace mcpe;

TEST(InMemoryResourceRepository, GetUnknownThrowsNotFound) {
    InMemoryResourceRepository repo;
    try {
        repo.GetResource("mem://missing");
        FAIL() << "expected ResourceNotFound";
    } catch (const errors::ResourceNotFound& e) {
        EXPECT_EQ(e.code(), 404);
        EXPECT_EQ(e.uri, "mem://missing");
    }
}

TEST(InMemoryResourceRepository, ListKeepsInsertionOrderAcrossReplace) {
    InMemoryResourceRepository repo;
    repo.AddResource(Resource{"mem://1", "one", "", "", "a"});
    repo.AddResource(Resource{"mem://2", "two", "", "", "b"});
    repo.AddResource(Resource{"mem://3", "three", "", "", "c"});
    // Replacing keeps the original position
    repo.AddResource(Resource{"mem://1", "uno", "", "", "z"});

    auto list = repo.ListResources();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].uri, "mem://1");
    EXPECT_EQ(list[0].name, "uno");
    EXPECT_EQ(list[1].uri, "mem://2");
    EXPECT_EQ(list[2].uri, "mem://3");
    EXPECT_EQ(repo.GetResource("mem://1").text, "z");
}

TEST(InMemoryResourceRepository, DeleteIsIdempotent) {
    InMemoryResourceRepository repo;
    repo.AddResource(Resource{"mem://x", "x", "", "", ""});
    repo.DeleteResource("mem://x");
    EXPECT_NO_THROW(repo.DeleteResource("mem://x"));
    EXPECT_TRUE(repo.ListResources().empty());
    EXPECT_THROW(repo.GetResource("mem://x"), errors::ResourceNotFound);
}

TEST(InMemoryResourceRepository, EmptyKeyIsRejected) {
    InMemoryResourceRepository repo;
    try {
        repo.AddResource(Resource{});
        FAIL() << "expected ValidationError";
    } catch (const errors::ValidationError& e) {
        EXPECT_EQ(e.code(), 400);
        EXPECT_EQ(e.field, "uri");
    }
}

TEST(InMemoryToolRepository, RoundTripAndNotFound) {
    InMemoryToolRepository repo;
    Tool t;
    t.name = "sum";
    t.description = "adds numbers";
    t.parameters.push_back(ToolParameter{"a", "first", "number", true});
    repo.AddTool(t);

    Tool back = repo.GetTool("sum");
    EXPECT_EQ(back.description, "adds numbers");
    ASSERT_EQ(back.parameters.size(), 1u);
    EXPECT_TRUE(back.parameters[0].required);
    EXPECT_THROW(repo.GetTool("nope"), errors::ToolNotFound);
    EXPECT_THROW(repo.AddTool(Tool{}), errors::ValidationError);
}

TEST(InMemoryPromptRepository, RoundTripAndNotFound) {
    InMemoryPromptRepository repo;
    Prompt p;
    p.name = "greet";
    p.templateText = "Hi {{name}}";
    repo.AddPrompt(p);
    EXPECT_EQ(repo.GetPrompt("greet").templateText, "Hi {{name}}");
    EXPECT_EQ(repo.ListPrompts().size(), 1u);
    repo.DeletePrompt("greet");
    EXPECT_THROW(repo.GetPrompt("greet"), errors::PromptNotFound);
}

TEST(InMemorySessionRepository, TracksSessions) {
    InMemorySessionRepository repo;
    repo.AddSession(ClientSession{"s1", "curl/8", true});
    repo.AddSession(ClientSession{"s2", "", true});
    EXPECT_EQ(repo.ListSessions().size(), 2u);
    EXPECT_EQ(repo.GetSession("s1").userAgent, "curl/8");
    repo.DeleteSession("s1");
    EXPECT_THROW(repo.GetSession("s1"), errors::SessionNotFound);
    EXPECT_EQ(repo.ListSessions().size(), 1u);
}

TEST(InMemoryToolRepository, ConcurrentWritersAndReaders) {
    InMemoryToolRepository repo;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&repo, t] {
            for (int i = 0; i < 50; ++i) {
                Tool tool;
                tool.name = "tool-" + std::to_string(t) + "-" + std::to_string(i);
                repo.AddTool(tool);
                (void)repo.ListTools();
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(repo.ListTools().size(), 200u);
}
