//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Decoding of inbound JSON-RPC requests and encoding of responses and notifications
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>

#include "mcpe/JSONRPCTypes.h"
#include "mcpe/Protocol.h"
#include "mcpe/errors/Errors.h"

namespace mcpe {
namespace codec {

enum class MessageKind {
    Request,
    Notification,
    Response,
    Unknown
};

//==========================================================================================================
// DecodeError
// Purpose: Failure to turn bytes into a request. Carries the JSON-RPC error and the id to echo.
// Fields:
//   error: -32700 for malformed JSON, -32600 for a structurally invalid request.
//   id: Parsed id when one could be read; null for parse errors.
//==========================================================================================================
struct DecodeError {
    errors::McpError error;
    std::optional<JSONRPCId> id;
};

using DecodeResult = std::variant<JSONRPCRequest, DecodeError>;

//==========================================================================================================
// Decode
// Purpose: Schema-light request decoding; only jsonrpc, id, method and params are read.
// Args:
//   bytes: One JSON-RPC message.
// Returns:
//   JSONRPCRequest on success, DecodeError otherwise (never throws for bad input).
//==========================================================================================================
DecodeResult Decode(const std::string& bytes);

// Classify a message without validating it.
MessageKind Classify(const std::string& bytes);

std::string EncodeResponse(const JSONRPCResponse& response);
std::string EncodeResult(const std::optional<JSONRPCId>& id, const JSONValue& result);
std::string EncodeError(const std::optional<JSONRPCId>& id, const errors::McpError& err);
std::string EncodeNotification(const Notification& notification);

} // namespace codec
} // namespace mcpe
