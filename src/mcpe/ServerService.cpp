//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerService.cpp
// Purpose: Application service implementation
//==========================================================================================================

#include <stdexcept>

#include "mcpe/ServerService.h"
#include "mcpe/errors/Errors.h"

namespace mcpe {

ServerService::ServerService(ServerInfo info, Dependencies deps)
    : info(std::move(info)), deps(std::move(deps)) {
    if (this->info.name.empty() || this->info.version.empty()) {
        throw std::invalid_argument("ServerService: name and version are required");
    }
    if (!this->deps.resources || !this->deps.tools || !this->deps.prompts || !this->deps.sessions) {
        throw std::invalid_argument("ServerService: all repositories are required");
    }
    if (!this->deps.notifier || !this->deps.logger) {
        throw std::invalid_argument("ServerService: notifier and logger are required");
    }
}

void ServerService::notifyListChanged(const char* method) {
    Notification n;
    n.method = method;
    try {
        deps.notifier->BroadcastNotification(n);
    } catch (const std::exception& e) {
        // Delivery failure never fails the mutation that triggered it
        LOG_WARN(*deps.logger, "ServerService: failed to broadcast {}: {}", method, e.what());
    }
}

//////////////////////////////////////////// Resources ////////////////////////////////////////////
std::vector<Resource> ServerService::ListResources() {
    return deps.resources->ListResources();
}

Resource ServerService::GetResource(const std::string& uri) {
    return deps.resources->GetResource(uri);
}

void ServerService::AddResource(const Resource& resource) {
    deps.resources->AddResource(resource);
    notifyListChanged(Methods::ResourcesListChanged);
}

void ServerService::DeleteResource(const std::string& uri) {
    deps.resources->DeleteResource(uri);
    notifyListChanged(Methods::ResourcesListChanged);
}

//////////////////////////////////////////// Tools ////////////////////////////////////////////
std::vector<Tool> ServerService::ListTools() {
    return deps.tools->ListTools();
}

Tool ServerService::GetTool(const std::string& name) {
    return deps.tools->GetTool(name);
}

void ServerService::AddTool(const Tool& tool) {
    deps.tools->AddTool(tool);
    notifyListChanged(Methods::ToolsListChanged);
}

void ServerService::DeleteTool(const std::string& name) {
    deps.tools->DeleteTool(name);
    notifyListChanged(Methods::ToolsListChanged);
}

//////////////////////////////////////////// Prompts ////////////////////////////////////////////
std::vector<Prompt> ServerService::ListPrompts() {
    return deps.prompts->ListPrompts();
}

Prompt ServerService::GetPrompt(const std::string& name) {
    return deps.prompts->GetPrompt(name);
}

void ServerService::AddPrompt(const Prompt& prompt) {
    deps.prompts->AddPrompt(prompt);
    notifyListChanged(Methods::PromptsListChanged);
}

void ServerService::DeletePrompt(const std::string& name) {
    deps.prompts->DeletePrompt(name);
    notifyListChanged(Methods::PromptsListChanged);
}

//////////////////////////////////////////// Sessions ////////////////////////////////////////////
void ServerService::RegisterSession(const ClientSession& session) {
    deps.sessions->AddSession(session);
}

void ServerService::UnregisterSession(const std::string& id) {
    deps.sessions->DeleteSession(id);
}

std::vector<ClientSession> ServerService::ListSessions() {
    return deps.sessions->ListSessions();
}

void ServerService::SendNotification(const std::string& sessionId, const Notification& notification) {
    deps.notifier->SendNotification(sessionId, notification);
}

void ServerService::BroadcastNotification(const Notification& notification) {
    deps.notifier->BroadcastNotification(notification);
}

//////////////////////////////////////////// Tool execution ////////////////////////////////////////////
void ServerService::RegisterToolHandler(const std::string& name, ToolHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex);
    toolHandlers[name] = std::move(handler);
}

JSONValue ServerService::ExecuteTool(const Tool& tool, const JSONValue::Object& params, std::stop_token stop) {
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex);
        auto it = toolHandlers.find(tool.name);
        if (it != toolHandlers.end()) {
            handler = it->second;
        }
    }
    if (!handler) {
        throw errors::DomainError::NotImplemented("no handler registered for tool " + tool.name);
    }
    LOG_DEBUG(*deps.logger, "ServerService: executing tool {}", tool.name);
    return handler(params, std::move(stop));
}

std::string StringifyArgument(const JSONValue& value) {
    if (value.isString()) {
        return std::get<std::string>(value.value);
    }
    return serializeJSONValue(value);
}

void RegisterEchoTool(ServerService& service) {
    Tool echo;
    echo.name = "echo";
    echo.description = "Echoes back the input message";
    echo.parameters.push_back(ToolParameter{"message", "The message to echo back", "string", true});
    service.AddTool(echo);
    service.RegisterToolHandler(echo.name, [](const JSONValue::Object& params, std::stop_token) -> JSONValue {
        auto it = params.find("message");
        if (it == params.end() || !it->second) {
            return JSONValue(std::string());
        }
        return JSONValue(StringifyArgument(*it->second));
    });
}

} // namespace mcpe
