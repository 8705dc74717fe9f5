//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: JSON-RPC request decoding and response/notification encoding
//========================================================================================================

#include "mcpe/MessageCodec.h"

namespace mcpe {
namespace codec {

namespace {

DecodeError invalidRequest(const std::string& message, std::optional<JSONRPCId> id) {
    return DecodeError{errors::makeError(JSONRPCErrorCodes::InvalidRequest, message), std::move(id)};
}

} // namespace

DecodeResult Decode(const std::string& bytes) {
    JSONValue doc;
    try {
        doc = parseJSON(bytes);
    } catch (const JSONParseError& e) {
        return DecodeError{errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error", JSONValue(std::string(e.what()))),
                           JSONRPCId{nullptr}};
    }

    if (!doc.isObject()) {
        return invalidRequest("Invalid Request", JSONRPCId{nullptr});
    }

    JSONRPCRequest req;
    if (const JSONValue* idv = doc.find("id")) {
        auto id = IdFromJSONValue(*idv);
        if (!id.has_value()) {
            return invalidRequest("Invalid Request: id must be a string, number or null", JSONRPCId{nullptr});
        }
        req.id = std::move(id);
    }

    const JSONValue* version = doc.find("jsonrpc");
    if (!version || !version->isString() || std::get<std::string>(version->value) != JSONRPC_VERSION) {
        return invalidRequest("Invalid JSON-RPC version", req.id);
    }

    const JSONValue* method = doc.find("method");
    if (!method || !method->isString() || std::get<std::string>(method->value).empty()) {
        return invalidRequest("Invalid Request: method must be a non-empty string", req.id);
    }
    req.method = std::get<std::string>(method->value);

    if (const JSONValue* params = doc.find("params")) {
        req.params = *params;
    }
    return req;
}

MessageKind Classify(const std::string& bytes) {
    JSONValue doc;
    try {
        doc = parseJSON(bytes);
    } catch (const JSONParseError&) {
        return MessageKind::Unknown;
    }
    if (!doc.isObject()) {
        return MessageKind::Unknown;
    }
    const auto& obj = std::get<JSONValue::Object>(doc.value);
    const bool hasId = obj.find("id") != obj.end();
    if (obj.find("method") != obj.end()) {
        return hasId ? MessageKind::Request : MessageKind::Notification;
    }
    if (hasId && (obj.find("result") != obj.end() || obj.find("error") != obj.end())) {
        return MessageKind::Response;
    }
    return MessageKind::Unknown;
}

std::string EncodeResponse(const JSONRPCResponse& response) {
    return response.Serialize();
}

std::string EncodeResult(const std::optional<JSONRPCId>& id, const JSONValue& result) {
    return JSONRPCResponse(id, result).Serialize();
}

std::string EncodeError(const std::optional<JSONRPCId>& id, const errors::McpError& err) {
    return errors::makeErrorResponse(id, err)->Serialize();
}

std::string EncodeNotification(const Notification& notification) {
    return notification.ToJSONRPC().Serialize();
}

} // namespace codec
} // namespace mcpe
