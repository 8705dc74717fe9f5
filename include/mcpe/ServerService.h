//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerService.h
// Purpose: Application service: server identity, repository pass-throughs, tool execution and
//          list-changed notifications
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "logging/Logger.h"
#include "mcpe/NotificationHub.hpp"
#include "mcpe/Protocol.h"
#include "mcpe/Repositories.h"

namespace mcpe {

//==========================================================================================================
// ToolHandler
// Purpose: Strategy executed by tools/call.
// Args:
//   params: Tool parameters (already checked for required names).
//   stop: Cancelled when the per-call deadline passes or the caller goes away.
// Returns:
//   A string (sent as one text content item), an object already holding a "content" array (sent as is),
//   or any other JSON value (serialized into one text content item).
//==========================================================================================================
using ToolHandler = std::function<JSONValue(const JSONValue::Object& params, std::stop_token stop)>;

class ServerService {
public:
    //==========================================================================================================
    // Dependencies
    // Purpose: Collaborators injected into the service. Every pointer is required.
    //==========================================================================================================
    struct Dependencies {
        std::shared_ptr<IResourceRepository> resources;
        std::shared_ptr<IToolRepository> tools;
        std::shared_ptr<IPromptRepository> prompts;
        std::shared_ptr<ISessionRepository> sessions;
        std::shared_ptr<INotificationSender> notifier;
        std::shared_ptr<Logger> logger;
    };

    // Throws std::invalid_argument when a dependency is missing or info.name/info.version is empty.
    ServerService(ServerInfo info, Dependencies deps);

    const ServerInfo& GetServerInfo() const { return info; }

    // Resources
    std::vector<Resource> ListResources();
    Resource GetResource(const std::string& uri);
    void AddResource(const Resource& resource);
    void DeleteResource(const std::string& uri);

    // Tools
    std::vector<Tool> ListTools();
    Tool GetTool(const std::string& name);
    void AddTool(const Tool& tool);
    void DeleteTool(const std::string& name);

    // Prompts
    std::vector<Prompt> ListPrompts();
    Prompt GetPrompt(const std::string& name);
    void AddPrompt(const Prompt& prompt);
    void DeletePrompt(const std::string& name);

    // Sessions
    void RegisterSession(const ClientSession& session);
    void UnregisterSession(const std::string& id);
    std::vector<ClientSession> ListSessions();

    // Notifications (errors propagate to the caller)
    void SendNotification(const std::string& sessionId, const Notification& notification);
    void BroadcastNotification(const Notification& notification);

    //==========================================================================================================
    // RegisterToolHandler
    // Purpose: Associates an execution strategy with a tool name. Replaces any previous handler.
    //==========================================================================================================
    void RegisterToolHandler(const std::string& name, ToolHandler handler);

    //==========================================================================================================
    // ExecuteTool
    // Purpose: Runs the strategy registered for tool.name.
    // Returns:
    //   Handler output. Throws errors::DomainError (501) when no strategy is registered.
    //==========================================================================================================
    JSONValue ExecuteTool(const Tool& tool, const JSONValue::Object& params, std::stop_token stop);

private:
    void notifyListChanged(const char* method);

    ServerInfo info;
    Dependencies deps;
    std::mutex handlersMutex;
    std::unordered_map<std::string, ToolHandler> toolHandlers;
};

// Converts a tool argument to display text: strings verbatim, other values as compact JSON.
std::string StringifyArgument(const JSONValue& value);

//==========================================================================================================
// RegisterEchoTool
// Purpose: Adds the built-in "echo" tool (required string parameter "message") and its strategy.
//==========================================================================================================
void RegisterEchoTool(ServerService& service);

} // namespace mcpe
