//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants, method names and the domain entities served by the engine
//==========================================================================================================

#pragma once

#include "mcpe/JSONRPCTypes.h"
#include <string>
#include <vector>

namespace mcpe {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Prefix marking one-way client notifications
constexpr const char* NOTIFICATION_PREFIX = "notifications/";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Server identity reported by initialize and /status
struct ServerInfo {
    std::string name;
    std::string version;
    std::string instructions;
};

///////////////////////////////////////// Domain entities ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::string description;
    std::string mimeType;
    // Body returned by resources/read; not part of resources/list entries
    std::string text;
};

struct ToolParameter {
    std::string name;
    std::string description;
    std::string type;
    bool required{false};
};

struct Tool {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;
};

struct PromptParameter {
    std::string name;
    std::string description;
    std::string type;
    bool required{false};
};

struct Prompt {
    std::string name;
    std::string description;
    std::string templateText;
    std::vector<PromptParameter> parameters;
};

// A connected SSE client as recorded by the session repository
struct ClientSession {
    std::string id;
    std::string userAgent;
    bool connected{false};
};

//==========================================================================================================
// Notification
// Purpose: Server-to-client one-way message; params is always an object (possibly empty).
//==========================================================================================================
struct Notification {
    std::string method;
    JSONValue::Object params;

    JSONRPCNotification ToJSONRPC() const {
        return JSONRPCNotification(method, JSONValue(params));
    }
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Client notifications
    constexpr const char* Initialized = "notifications/initialized";

    // Server to client
    constexpr const char* ResourcesListChanged = "resources/list/changed";
    constexpr const char* ToolsListChanged = "tools/list/changed";
    constexpr const char* PromptsListChanged = "prompts/list/changed";
}

} // namespace mcpe
