//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Repositories.h
// Purpose: Storage interfaces for resources, tools, prompts and client sessions
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "mcpe/Protocol.h"

namespace mcpe {

//==========================================================================================================
// Repository contract (all four interfaces)
//   Get*: Returns the entity or throws errors::DomainError with code 404 (typed *NotFound error).
//   List*: Returns all entities in insertion order.
//   Add*: Inserts or replaces by key; throws errors::ValidationError for an empty key.
//   Delete*: Removes by key; deleting an unknown key is not an error.
// Implementations must be safe for concurrent use.
//==========================================================================================================
class IResourceRepository {
public:
    virtual ~IResourceRepository() = default;
    virtual Resource GetResource(const std::string& uri) = 0;
    virtual std::vector<Resource> ListResources() = 0;
    virtual void AddResource(const Resource& resource) = 0;
    virtual void DeleteResource(const std::string& uri) = 0;
};

class IToolRepository {
public:
    virtual ~IToolRepository() = default;
    virtual Tool GetTool(const std::string& name) = 0;
    virtual std::vector<Tool> ListTools() = 0;
    virtual void AddTool(const Tool& tool) = 0;
    virtual void DeleteTool(const std::string& name) = 0;
};

class IPromptRepository {
public:
    virtual ~IPromptRepository() = default;
    virtual Prompt GetPrompt(const std::string& name) = 0;
    virtual std::vector<Prompt> ListPrompts() = 0;
    virtual void AddPrompt(const Prompt& prompt) = 0;
    virtual void DeletePrompt(const std::string& name) = 0;
};

class ISessionRepository {
public:
    virtual ~ISessionRepository() = default;
    virtual ClientSession GetSession(const std::string& id) = 0;
    virtual std::vector<ClientSession> ListSessions() = 0;
    virtual void AddSession(const ClientSession& session) = 0;
    virtual void DeleteSession(const std::string& id) = 0;
};

} // namespace mcpe
