//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 message types for the MCP engine
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace mcpe {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array (order preserved).
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }

    // Returns the member named key when this is an object holding it (null member pointers read as absent).
    const JSONValue* find(const std::string& key) const;
};

// Structural equality; object member order is irrelevant.
bool operator==(const JSONValue& a, const JSONValue& b);

//==========================================================================================================
// JSONParseError
// Purpose: Thrown by parseJSON for syntactically invalid input.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    explicit JSONParseError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// parseJSON
// Purpose: Parses a complete JSON document; trailing non-whitespace is an error.
// Args:
//   json: UTF-8 text.
// Returns:
//   Parsed value. Throws JSONParseError on malformed input.
//==========================================================================================================
JSONValue parseJSON(const std::string& json);

// Compact serialization (no insignificant whitespace).
std::string serializeJSONValue(const JSONValue& value);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id: string, number, or null. Message types hold it in std::optional so that an
//          absent id stays distinguishable from an explicit null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, double, std::nullptr_t>;

// Converts a parsed JSON value to an id; std::nullopt when the value is not a valid id type.
std::optional<JSONRPCId> IdFromJSONValue(const JSONValue& v);
JSONValue IdToJSONValue(const JSONRPCId& id);
// Human readable id used in log lines ("<absent>" when there is none).
std::string IdToString(const std::optional<JSONRPCId>& id);

constexpr const char* JSONRPC_VERSION = "2.0";

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
// Methods:
//   Serialize(): Returns canonical JSON string for the message.
//   Deserialize(json): Parses JSON string into this object; returns true on success.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = JSONRPC_VERSION;

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual bool Deserialize(const std::string& json) = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request with optional id, method, and optional params.
// Notes:
//   A request without an id whose method starts with "notifications/" is one-way (see IsOneWay()).
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    std::optional<JSONRPCId> id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(std::optional<JSONRPCId> id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;

    bool IsOneWay() const;
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response carrying either result or error.
// Notes:
//   An absent id is echoed as absence (the "id" member is omitted on the wire).
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    std::optional<JSONRPCId> id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(std::optional<JSONRPCId> id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(std::optional<JSONRPCId> id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: JSON-RPC 2.0 notification (no id, no response).
//==========================================================================================================
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus domain pass-through codes used by the engine.
// Notes:
//   Domain codes mirror HTTP status values and are forwarded unchanged from collaborator errors.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    // Domain pass-through codes
    constexpr int BadRequest = 400;
    constexpr int NotFound = 404;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
// Args:
//   id: Request id to echo (absent, string, number or null).
//   code: Integer error code.
//   message: Error message.
//   data: Optional structured payload.
// Returns:
//   unique_ptr<JSONRPCResponse> with error populated.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const std::optional<JSONRPCId>& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcpe
