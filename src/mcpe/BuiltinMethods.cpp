//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinMethods.cpp
// Purpose: MCP method set (initialize, ping, resources/*, tools/*, prompts/*) on top of ServerService
//==========================================================================================================

#include <format>
#include <stdexcept>

#include "mcpe/MethodRouter.h"
#include "mcpe/ServerService.h"
#include "mcpe/errors/Errors.h"

namespace mcpe {

namespace {

JSONValue::Object emptyObject() { return JSONValue::Object{}; }

std::shared_ptr<JSONValue> val(JSONValue v) { return std::make_shared<JSONValue>(std::move(v)); }

std::shared_ptr<JSONValue> str(const std::string& s) { return val(JSONValue(s)); }

// params must be absent, null or an object
const JSONValue::Object& requireObjectParams(const JSONValue& params) {
    static const JSONValue::Object none;
    if (params.isNull()) {
        return none;
    }
    if (!params.isObject()) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "Invalid params");
    }
    return std::get<JSONValue::Object>(params.value);
}

// Non-empty string member or an InvalidParams error naming the parameter
std::string requireString(const JSONValue::Object& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->second || !it->second->isString() ||
        std::get<std::string>(it->second->value).empty()) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams,
                                   std::format("Missing or invalid '{}' parameter", key));
    }
    return std::get<std::string>(it->second->value);
}

// Tool arguments: "arguments" wins over "parameters"; absence of both is an empty set
JSONValue::Object toolArguments(const JSONValue::Object& params) {
    for (const char* key : {"arguments", "parameters"}) {
        auto it = params.find(key);
        if (it == params.end() || !it->second || it->second->isNull()) {
            continue;
        }
        if (!it->second->isObject()) {
            throw errors::McpException(JSONRPCErrorCodes::InvalidParams,
                                       std::format("Invalid params: '{}' must be an object", key));
        }
        return std::get<JSONValue::Object>(it->second->value);
    }
    return emptyObject();
}

// Collaborator lookups: 404 passes through unchanged, every other failure is an internal error
template <typename Fn>
auto lookup(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const errors::DomainError& e) {
        if (e.code() == JSONRPCErrorCodes::NotFound) {
            throw;
        }
        throw errors::McpException(JSONRPCErrorCodes::InternalError, std::string("Internal error: ") + e.what());
    }
}

JSONValue textContent(const std::string& text) {
    JSONValue::Object item;
    item["type"] = str("text");
    item["text"] = str(text);
    JSONValue::Array content;
    content.push_back(val(JSONValue(std::move(item))));
    JSONValue::Object result;
    result["content"] = val(JSONValue(std::move(content)));
    return JSONValue(std::move(result));
}

// Shapes a tool handler's output into the MCP content-array result
JSONValue toToolResult(const JSONValue& output) {
    if (output.isString()) {
        return textContent(std::get<std::string>(output.value));
    }
    if (output.isObject()) {
        const JSONValue* content = output.find("content");
        if (content && content->isArray()) {
            return output;
        }
    }
    return textContent(serializeJSONValue(output));
}

JSONValue inputSchema(const Tool& tool) {
    JSONValue::Object properties;
    JSONValue::Array required;
    for (const auto& p : tool.parameters) {
        JSONValue::Object prop;
        prop["type"] = str(p.type.empty() ? "string" : p.type);
        if (!p.description.empty()) {
            prop["description"] = str(p.description);
        }
        properties[p.name] = val(JSONValue(std::move(prop)));
        if (p.required) {
            required.push_back(str(p.name));
        }
    }
    JSONValue::Object schema;
    schema["type"] = str("object");
    schema["properties"] = val(JSONValue(std::move(properties)));
    if (!required.empty()) {
        schema["required"] = val(JSONValue(std::move(required)));
    }
    return JSONValue(std::move(schema));
}

JSONValue::Object listChangedCapability() {
    JSONValue::Object cap;
    cap["listChanged"] = val(JSONValue(true));
    return cap;
}

JSONValue handleInitialize(ServerService& service) {
    const auto& info = service.GetServerInfo();

    JSONValue::Object capabilities;
    capabilities["resources"] = val(JSONValue(listChangedCapability()));
    capabilities["tools"] = val(JSONValue(listChangedCapability()));
    capabilities["prompts"] = val(JSONValue(listChangedCapability()));
    capabilities["logging"] = val(JSONValue(emptyObject()));

    JSONValue::Object serverInfo;
    serverInfo["name"] = str(info.name);
    serverInfo["version"] = str(info.version);

    JSONValue::Object result;
    result["protocolVersion"] = str(PROTOCOL_VERSION);
    result["serverInfo"] = val(JSONValue(std::move(serverInfo)));
    result["capabilities"] = val(JSONValue(std::move(capabilities)));
    if (!info.instructions.empty()) {
        result["instructions"] = str(info.instructions);
    }
    return JSONValue(std::move(result));
}

JSONValue handleListResources(ServerService& service) {
    JSONValue::Array list;
    for (const auto& r : lookup([&] { return service.ListResources(); })) {
        JSONValue::Object entry;
        entry["uri"] = str(r.uri);
        entry["name"] = str(r.name);
        if (!r.description.empty()) entry["description"] = str(r.description);
        if (!r.mimeType.empty()) entry["mimeType"] = str(r.mimeType);
        list.push_back(val(JSONValue(std::move(entry))));
    }
    JSONValue::Object result;
    result["resources"] = val(JSONValue(std::move(list)));
    return JSONValue(std::move(result));
}

JSONValue handleReadResource(ServerService& service, const JSONValue& params) {
    const auto& obj = requireObjectParams(params);
    const std::string uri = requireString(obj, "uri");
    Resource resource = lookup([&] {
        try {
            return service.GetResource(uri);
        } catch (const errors::ResourceNotFound&) {
            throw errors::DomainError::NotFound(std::format("Resource not found: {}", uri));
        }
    });

    JSONValue::Object content;
    content["uri"] = str(resource.uri);
    content["mimeType"] = str(resource.mimeType.empty() ? "text/plain" : resource.mimeType);
    content["text"] = str(resource.text);
    JSONValue::Array contents;
    contents.push_back(val(JSONValue(std::move(content))));
    JSONValue::Object result;
    result["contents"] = val(JSONValue(std::move(contents)));
    return JSONValue(std::move(result));
}

JSONValue handleListTools(ServerService& service) {
    JSONValue::Array list;
    for (const auto& t : lookup([&] { return service.ListTools(); })) {
        JSONValue::Object entry;
        entry["name"] = str(t.name);
        entry["description"] = str(t.description);
        entry["inputSchema"] = val(inputSchema(t));
        list.push_back(val(JSONValue(std::move(entry))));
    }
    JSONValue::Object result;
    result["tools"] = val(JSONValue(std::move(list)));
    return JSONValue(std::move(result));
}

JSONValue handleCallTool(ServerService& service, const CallContext& ctx, const JSONValue& params) {
    const auto& obj = requireObjectParams(params);
    const std::string name = requireString(obj, "name");
    Tool tool = lookup([&] {
        try {
            return service.GetTool(name);
        } catch (const errors::ToolNotFound&) {
            throw errors::DomainError::NotFound(std::format("Tool not found: {}", name));
        }
    });

    JSONValue::Object args = toolArguments(obj);
    std::string missing;
    for (const auto& p : tool.parameters) {
        if (!p.required) continue;
        auto it = args.find(p.name);
        if (it == args.end() || !it->second || it->second->isNull()) {
            if (!missing.empty()) missing += ", ";
            missing += p.name;
        }
    }
    if (!missing.empty()) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams,
                                   std::format("Missing required parameters: {}", missing));
    }

    JSONValue output;
    try {
        output = service.ExecuteTool(tool, args, ctx.stop);
    } catch (const errors::DomainError& e) {
        if (e.code() == 501) {
            throw errors::McpException(JSONRPCErrorCodes::InternalError,
                                       std::format("Tool handler not implemented for: {}", name));
        }
        throw;
    }
    return toToolResult(output);
}

JSONValue handleListPrompts(ServerService& service) {
    JSONValue::Array list;
    for (const auto& p : lookup([&] { return service.ListPrompts(); })) {
        JSONValue::Object entry;
        entry["name"] = str(p.name);
        entry["description"] = str(p.description);
        JSONValue::Array arguments;
        for (const auto& a : p.parameters) {
            JSONValue::Object arg;
            arg["name"] = str(a.name);
            arg["description"] = str(a.description);
            arg["required"] = val(JSONValue(a.required));
            arguments.push_back(val(JSONValue(std::move(arg))));
        }
        entry["arguments"] = val(JSONValue(std::move(arguments)));
        list.push_back(val(JSONValue(std::move(entry))));
    }
    JSONValue::Object result;
    result["prompts"] = val(JSONValue(std::move(list)));
    return JSONValue(std::move(result));
}

} // namespace

void RegisterBuiltinMethods(MethodRouter& router, std::shared_ptr<ServerService> service) {
    if (!service) {
        throw std::invalid_argument("RegisterBuiltinMethods: service is required");
    }

    router.Register(Methods::Initialize, [service](const CallContext&, const JSONValue&) -> std::optional<JSONValue> {
        return handleInitialize(*service);
    });
    router.Register(Methods::Ping, [](const CallContext&, const JSONValue&) -> std::optional<JSONValue> {
        return std::nullopt;
    });
    router.Register(Methods::ListResources, [service](const CallContext&, const JSONValue&) -> std::optional<JSONValue> {
        return handleListResources(*service);
    });
    router.Register(Methods::ReadResource, [service](const CallContext&, const JSONValue& params) -> std::optional<JSONValue> {
        return handleReadResource(*service, params);
    });
    router.Register(Methods::ListTools, [service](const CallContext&, const JSONValue&) -> std::optional<JSONValue> {
        return handleListTools(*service);
    });
    router.Register(Methods::CallTool, [service](const CallContext& ctx, const JSONValue& params) -> std::optional<JSONValue> {
        return handleCallTool(*service, ctx, params);
    });
    router.Register(Methods::ListPrompts, [service](const CallContext&, const JSONValue&) -> std::optional<JSONValue> {
        return handleListPrompts(*service);
    });
    router.Register(Methods::GetPrompt, [](const CallContext&, const JSONValue&) -> std::optional<JSONValue> {
        throw errors::McpException(JSONRPCErrorCodes::InternalError, "Prompt get not implemented");
    });

    // Client lifecycle notification; accepted without side effects
    router.RegisterNotification(Methods::Initialized, [](const JSONRPCRequest&) {});
}

} // namespace mcpe
