//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed JSON-RPC errors, domain errors raised by collaborators, and their mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpe/JSONRPCTypes.h"

namespace mcpe {
namespace errors {

// Categorization of JSON-RPC and domain pass-through error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    DomainBadRequest,
    DomainNotFound,
    Unknown
};

// Typed error representation carried in JSON-RPC error responses.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/domain numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::BadRequest: return ErrorCategory::DomainBadRequest;
        case JSONRPCErrorCodes::NotFound: return ErrorCategory::DomainNotFound;
        default: return ErrorCategory::Unknown;
    }
}

inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = errVal.find("code");
    const JSONValue* msg = errVal.find("message");
    if (!code || !msg) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) || !msg->isString()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = errVal.find("data")) {
        data = *d;
    }
    return makeError(static_cast<int>(std::get<int64_t>(code->value)), std::get<std::string>(msg->value), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response (absent ids stay absent).
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const std::optional<JSONRPCId>& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// McpException
// Purpose: Thrown by method handlers to return a structured JSON-RPC error with a chosen code.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}
    McpException(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : McpException(makeError(code, message, std::move(data))) {}

    const McpError& error() const noexcept { return error_; }

private:
    McpError error_;
};

//==========================================================================================================
// DomainError
// Purpose: Error raised by repositories and the application service. The code follows HTTP status
//          values (404 not found, 400 invalid input, ...). The method router forwards 404 and 400 as
//          JSON-RPC error codes and maps every other domain error to Internal Error.
//==========================================================================================================
class DomainError : public std::runtime_error {
public:
    DomainError(const std::string& message, int code) : std::runtime_error(message), code_(code) {}
    int code() const noexcept { return code_; }

    static DomainError NotFound(const std::string& what = "not found") { return DomainError(what, 404); }
    static DomainError Unauthorized(const std::string& what = "unauthorized") { return DomainError(what, 401); }
    static DomainError InvalidInput(const std::string& what = "invalid input") { return DomainError(what, 400); }
    static DomainError Internal(const std::string& what = "internal server error") { return DomainError(what, 500); }
    static DomainError NotImplemented(const std::string& what = "not implemented") { return DomainError(what, 501); }

private:
    int code_;
};

class ResourceNotFound : public DomainError {
public:
    explicit ResourceNotFound(const std::string& uri)
        : DomainError("resource with URI " + uri + " not found", 404), uri(uri) {}
    std::string uri;
};

class ToolNotFound : public DomainError {
public:
    explicit ToolNotFound(const std::string& name)
        : DomainError("tool with name " + name + " not found", 404), name(name) {}
    std::string name;
};

class PromptNotFound : public DomainError {
public:
    explicit PromptNotFound(const std::string& name)
        : DomainError("prompt with name " + name + " not found", 404), name(name) {}
    std::string name;
};

class SessionNotFound : public DomainError {
public:
    explicit SessionNotFound(const std::string& id)
        : DomainError("session with ID " + id + " not found", 404), id(id) {}
    std::string id;
};

class ValidationError : public DomainError {
public:
    ValidationError(const std::string& field, const std::string& message)
        : DomainError("validation failed for field " + field + ": " + message, 400), field(field), detail(message) {}
    std::string field;
    std::string detail;
};

} // namespace errors
} // namespace mcpe
