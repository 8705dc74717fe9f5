//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryRepositories.hpp
// Purpose: Mutex-guarded, insertion-ordered in-memory repositories (engine defaults and test fixtures)
//==========================================================================================================

#pragma once

#include <memory>

#include "mcpe/Repositories.h"

namespace mcpe {

class InMemoryResourceRepository : public IResourceRepository {
public:
    InMemoryResourceRepository();
    ~InMemoryResourceRepository() override;

    Resource GetResource(const std::string& uri) override;
    std::vector<Resource> ListResources() override;
    void AddResource(const Resource& resource) override;
    void DeleteResource(const std::string& uri) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

class InMemoryToolRepository : public IToolRepository {
public:
    InMemoryToolRepository();
    ~InMemoryToolRepository() override;

    Tool GetTool(const std::string& name) override;
    std::vector<Tool> ListTools() override;
    void AddTool(const Tool& tool) override;
    void DeleteTool(const std::string& name) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

class InMemoryPromptRepository : public IPromptRepository {
public:
    InMemoryPromptRepository();
    ~InMemoryPromptRepository() override;

    Prompt GetPrompt(const std::string& name) override;
    std::vector<Prompt> ListPrompts() override;
    void AddPrompt(const Prompt& prompt) override;
    void DeletePrompt(const std::string& name) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

class InMemorySessionRepository : public ISessionRepository {
public:
    InMemorySessionRepository();
    ~InMemorySessionRepository() override;

    ClientSession GetSession(const std::string& id) override;
    std::vector<ClientSession> ListSessions() override;
    void AddSession(const ClientSession& session) override;
    void DeleteSession(const std::string& id) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpe
