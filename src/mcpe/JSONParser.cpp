//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, serializer and JSON-RPC message (de)serialization
//==========================================================================================================

#include <cmath>
#include <cctype>
#include <cstdlib>
#include <format>
#include <sstream>
#include <iomanip>
#include <limits>
#include "mcpe/JSONRPCTypes.h"

namespace mcpe {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::find(const std::string& key) const {
    if (!std::holds_alternative<Object>(value)) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

bool operator==(const JSONValue& a, const JSONValue& b) {
    if (a.value.index() != b.value.index()) {
        // 1 and 1.0 compare equal
        if (std::holds_alternative<int64_t>(a.value) && std::holds_alternative<double>(b.value)) {
            return static_cast<double>(std::get<int64_t>(a.value)) == std::get<double>(b.value);
        }
        if (std::holds_alternative<double>(a.value) && std::holds_alternative<int64_t>(b.value)) {
            return std::get<double>(a.value) == static_cast<double>(std::get<int64_t>(b.value));
        }
        return false;
    }
    if (std::holds_alternative<JSONValue::Array>(a.value)) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (size_t i = 0; i < x.size(); ++i) {
            const JSONValue nullValue;
            const JSONValue& xi = x[i] ? *x[i] : nullValue;
            const JSONValue& yi = y[i] ? *y[i] : nullValue;
            if (!(xi == yi)) return false;
        }
        return true;
    }
    if (std::holds_alternative<JSONValue::Object>(a.value)) {
        const auto& x = std::get<JSONValue::Object>(a.value);
        const auto& y = std::get<JSONValue::Object>(b.value);
        if (x.size() != y.size()) return false;
        for (const auto& [key, val] : x) {
            auto it = y.find(key);
            if (it == y.end()) return false;
            const JSONValue nullValue;
            const JSONValue& xv = val ? *val : nullValue;
            const JSONValue& yv = it->second ? *it->second : nullValue;
            if (!(xv == yv)) return false;
        }
        return true;
    }
    return a.value == b.value;
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {

constexpr int MaxDepth = 256;

void appendUtf8(std::string& out, unsigned int code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(std::format("{} at offset {}", what, i));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by \uDC00..\uDFFF
                        if (i + 2 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            fail("Unpaired surrogate");
                        }
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) fail("Invalid value");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("Invalid fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("Invalid exponent");
        }
        std::string num = s.substr(start, i - start);
        try {
            if (!isFloat) {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            }
        } catch (const std::out_of_range&) {
            // Integers beyond int64 degrade to double
        }
        // Underflow yields zero or a denormal; overflow is clamped to the largest finite double
        double d = std::strtod(num.c_str(), nullptr);
        if (std::isinf(d)) {
            d = std::copysign(std::numeric_limits<double>::max(), d);
        }
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        if (++depth > MaxDepth) fail("Nesting too deep");
        JSONValue::Array arr;
        if (!match(']')) {
            while (true) {
                JSONValue val = parseValue();
                arr.push_back(std::make_shared<JSONValue>(std::move(val)));
                if (match(']')) break;
                if (!match(',')) fail("Expected ',' in array");
            }
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        if (++depth > MaxDepth) fail("Nesting too deep");
        JSONValue::Object obj;
        if (!match('}')) {
            while (true) {
                std::string key = parseString();
                if (!match(':')) fail("Expected ':' after key");
                JSONValue val = parseValue();
                obj[key] = std::make_shared<JSONValue>(std::move(val));
                if (match('}')) break;
                if (!match(',')) fail("Expected ',' in object");
            }
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }
};

void writeEscaped(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeValue(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                oss << std::format("{}", v);
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                if (v[i]) { writeValue(oss, *v[i]); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeEscaped(oss, key);
                oss << ':';
                if (val) { writeValue(oss, *val); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.get());
}

void writeId(std::ostringstream& oss, const JSONRPCId& id) {
    writeValue(oss, IdToJSONValue(id));
}

} // namespace

JSONValue parseJSON(const std::string& json) {
    JsonParser p(json);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != json.size()) {
        p.fail("Unexpected trailing characters");
    }
    return v;
}

std::string serializeJSONValue(const JSONValue& value) {
    std::ostringstream oss;
    writeValue(oss, value);
    return oss.str();
}

std::optional<JSONRPCId> IdFromJSONValue(const JSONValue& v) {
    if (std::holds_alternative<std::string>(v.value)) return JSONRPCId{std::get<std::string>(v.value)};
    if (std::holds_alternative<int64_t>(v.value)) return JSONRPCId{std::get<int64_t>(v.value)};
    if (std::holds_alternative<double>(v.value)) return JSONRPCId{std::get<double>(v.value)};
    if (std::holds_alternative<std::nullptr_t>(v.value)) return JSONRPCId{nullptr};
    return std::nullopt;
}

JSONValue IdToJSONValue(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue { return JSONValue(v); }, id);
}

std::string IdToString(const std::optional<JSONRPCId>& id) {
    if (!id.has_value()) {
        return "<absent>";
    }
    return serializeJSONValue(IdToJSONValue(id.value()));
}

namespace {

// Fills the common fields; returns false when the document is not an object.
bool readEnvelope(const std::string& json, JSONValue& doc, std::string& version) {
    doc = parseJSON(json);
    if (!doc.isObject()) {
        return false;
    }
    if (const JSONValue* v = doc.find("jsonrpc"); v && v->isString()) {
        version = std::get<std::string>(v->value);
    }
    return true;
}

} // namespace

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    writeEscaped(oss, jsonrpc);
    if (id.has_value()) {
        oss << ",\"id\":";
        writeId(oss, id.value());
    }
    oss << ",\"method\":";
    writeEscaped(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        writeValue(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    try {
        JSONValue doc;
        if (!readEnvelope(json, doc, jsonrpc)) return false;
        const JSONValue* m = doc.find("method");
        if (!m || !m->isString()) return false;
        method = std::get<std::string>(m->value);
        id.reset();
        if (const JSONValue* idv = doc.find("id")) {
            id = IdFromJSONValue(*idv);
            if (!id.has_value()) return false;
        }
        params.reset();
        if (const JSONValue* p = doc.find("params")) {
            params = *p;
        }
        return !method.empty();
    } catch (const JSONParseError&) {
        return false;
    }
}

bool JSONRPCRequest::IsOneWay() const {
    return !id.has_value() && method.rfind("notifications/", 0) == 0;
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    writeEscaped(oss, jsonrpc);
    if (id.has_value()) {
        oss << ",\"id\":";
        writeId(oss, id.value());
    }
    if (error.has_value()) {
        oss << ",\"error\":";
        writeValue(oss, error.value());
    } else {
        oss << ",\"result\":";
        if (result.has_value()) { writeValue(oss, result.value()); } else { oss << "{}"; }
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    try {
        JSONValue doc;
        if (!readEnvelope(json, doc, jsonrpc)) return false;
        id.reset();
        if (const JSONValue* idv = doc.find("id")) {
            id = IdFromJSONValue(*idv);
            if (!id.has_value()) return false;
        }
        result.reset();
        error.reset();
        if (const JSONValue* r = doc.find("result")) result = *r;
        if (const JSONValue* e = doc.find("error")) error = *e;
        return result.has_value() != error.has_value();
    } catch (const JSONParseError&) {
        return false;
    }
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    writeEscaped(oss, jsonrpc);
    oss << ",\"method\":";
    writeEscaped(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        writeValue(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    try {
        JSONValue doc;
        if (!readEnvelope(json, doc, jsonrpc)) return false;
        if (doc.find("id") != nullptr) return false;
        const JSONValue* m = doc.find("method");
        if (!m || !m->isString()) return false;
        method = std::get<std::string>(m->value);
        params.reset();
        if (const JSONValue* p = doc.find("params")) params = *p;
        return !method.empty();
    } catch (const JSONParseError&) {
        return false;
    }
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const std::optional<JSONRPCId>& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcpe
