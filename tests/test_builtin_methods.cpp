//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_builtin_methods.cpp
// Purpose: End-to-end tests of the MCP method set through the router and application service
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "TestSupport.h"
#include "mcpe/errors/Errors.h"

using namespace mcpe;

namespace {

JSONRPCResponse call(test::Wiring& w, const std::string& method, const std::string& paramsJson = "") {
    std::string wire = R"({"jsonrpc":"2.0","id":1,"method":")" + method + "\"";
    if (!paramsJson.empty()) {
        wire += ",\"params\":" + paramsJson;
    }
    wire += "}";
    auto out = w.router->HandleMessage(wire, std::stop_token{});
    if (!out) {
        throw std::runtime_error("no response for " + method);
    }
    return test::ParseResponse(*out);
}

const JSONValue::Array& arrayAt(const JSONValue& v, const char* key) {
    return std::get<JSONValue::Array>(v.find(key)->value);
}

} // namespace

TEST(BuiltinMethods, InitializeReportsIdentityAndCapabilities) {
    auto w = test::MakeWiring();
    auto resp = call(w, "initialize", R"({"protocolVersion":"2024-11-05","capabilities":{}})");
    ASSERT_FALSE(resp.IsError());
    const JSONValue& r = *resp.result;
    EXPECT_EQ(test::Str(r.find("protocolVersion")), "2024-11-05");
    EXPECT_EQ(test::Str(r.find("serverInfo")->find("name")), "test-server");
    EXPECT_EQ(test::Str(r.find("serverInfo")->find("version")), "9.9.9");
    EXPECT_EQ(test::Str(r.find("instructions")), "be nice");
    const JSONValue* caps = r.find("capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_TRUE(std::get<bool>(caps->find("tools")->find("listChanged")->value));
    EXPECT_TRUE(std::get<bool>(caps->find("resources")->find("listChanged")->value));
    EXPECT_TRUE(std::get<bool>(caps->find("prompts")->find("listChanged")->value));
    EXPECT_TRUE(caps->find("logging")->isObject());
}

TEST(BuiltinMethods, PingAnswersEmptyObject) {
    auto w = test::MakeWiring();
    auto out = w.router->HandleMessage(R"({"jsonrpc":"2.0","id":1,"method":"ping"})", std::stop_token{});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, R"({"jsonrpc":"2.0","id":1,"result":{}})");
}

TEST(BuiltinMethods, EchoReturnsTextContent) {
    auto w = test::MakeWiring();
    auto resp = call(w, "tools/call", R"({"name":"echo","arguments":{"message":"hi"}})");
    ASSERT_FALSE(resp.IsError());
    EXPECT_EQ(*resp.result, parseJSON(R"({"content":[{"type":"text","text":"hi"}]})"));
}

TEST(BuiltinMethods, EchoAcceptsLegacyParametersKey) {
    auto w = test::MakeWiring();
    auto resp = call(w, "tools/call", R"({"name":"echo","parameters":{"message":"legacy"}})");
    ASSERT_FALSE(resp.IsError());
    EXPECT_EQ(*resp.result, parseJSON(R"({"content":[{"type":"text","text":"legacy"}]})"));
}

TEST(BuiltinMethods, EchoStringifiesNonStringArgument) {
    auto w = test::MakeWiring();
    auto resp = call(w, "tools/call", R"({"name":"echo","arguments":{"message":{"a":[1,2]}}})");
    ASSERT_FALSE(resp.IsError());
    const auto& content = arrayAt(*resp.result, "content");
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(test::Str(content[0]->find("text")), R"({"a":[1,2]})");
}

TEST(BuiltinMethods, EchoWithoutMessageIsInvalidParams) {
    auto w = test::MakeWiring();
    auto resp = call(w, "tools/call", R"({"name":"echo","arguments":{}})");
    ASSERT_TRUE(resp.IsError());
    EXPECT_EQ(test::ErrorCode(resp), -32602);
    EXPECT_EQ(test::ErrorMessage(resp), "Missing required parameters: message");
}

TEST(BuiltinMethods, UnknownToolIsNotFound) {
    auto w = test::MakeWiring();
    auto resp = call(w, "tools/call", R"({"name":"nope","arguments":{}})");
    ASSERT_TRUE(resp.IsError());
    EXPECT_EQ(test::ErrorCode(resp), 404);
    EXPECT_EQ(test::ErrorMessage(resp), "Tool not found: nope");
}

TEST(BuiltinMethods, ToolCallRequiresName) {
    auto w = test::MakeWiring();
    auto resp = call(w, "tools/call", R"({"arguments":{}})");
    ASSERT_TRUE(resp.IsError());
    EXPECT_EQ(test::ErrorCode(resp), -32602);
    EXPECT_EQ(test::ErrorMessage(resp), "Missing or invalid 'name' parameter");
}

TEST(BuiltinMethods, NonObjectParamsAreInvalid) {
    auto w = test::MakeWiring();
    auto resp = call(w, "tools/call", "[1,2]");
    ASSERT_TRUE(resp.IsError());
    EXPECT_EQ(test::ErrorCode(resp), -32602);

    auto badArgs = call(w, "tools/call", R"({"name":"echo","arguments":"hi"})");
    ASSERT_TRUE(badArgs.IsError());
    EXPECT_EQ(test::ErrorCode(badArgs), -32602);
}

TEST(BuiltinMethods, ToolWithoutHandlerIsInternalError) {
    auto w = test::MakeWiring();
    Tool t;
    t.name = "orphan";
    t.description = "registered without a strategy";
    w.service->AddTool(t);
    auto resp = call(w, "tools/call", R"({"name":"orphan"})");
    ASSERT_TRUE(resp.IsError());
    EXPECT_EQ(test::ErrorCode(resp), -32603);
    EXPECT_EQ(test::ErrorMessage(resp), "Tool handler not implemented for: orphan");
}

TEST(BuiltinMethods, ToolOutputShapes) {
    auto w = test::MakeWiring();
    Tool structured;
    structured.name = "stats";
    w.service->AddTool(structured);
    w.service->RegisterToolHandler("stats", [](const JSONValue::Object&, std::stop_token) {
        return parseJSON(R"({"count":3})");
    });
    Tool preformatted;
    preformatted.name = "rich";
    w.service->AddTool(preformatted);
    w.service->RegisterToolHandler("rich", [](const JSONValue::Object&, std::stop_token) {
        return parseJSON(R"({"content":[{"type":"text","text":"a"},{"type":"text","text":"b"}]})");
    });

    auto s = call(w, "tools/call", R"({"name":"stats"})");
    ASSERT_FALSE(s.IsError());
    EXPECT_EQ(*s.result, parseJSON(R"({"content":[{"type":"text","text":"{\"count\":3}"}]})"));

    auto r = call(w, "tools/call", R"({"name":"rich"})");
    ASSERT_FALSE(r.IsError());
    EXPECT_EQ(arrayAt(*r.result, "content").size(), 2u);
}

TEST(BuiltinMethods, ToolsListCarriesInputSchema) {
    auto w = test::MakeWiring();
    auto resp = call(w, "tools/list");
    ASSERT_FALSE(resp.IsError());
    const auto& tools = arrayAt(*resp.result, "tools");
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(test::Str(tools[0]->find("name")), "echo");
    const JSONValue* schema = tools[0]->find("inputSchema");
    ASSERT_NE(schema, nullptr);
    EXPECT_EQ(test::Str(schema->find("type")), "object");
    EXPECT_EQ(test::Str(schema->find("properties")->find("message")->find("type")), "string");
    EXPECT_EQ(*schema->find("required"), parseJSON(R"(["message"])"));
}

TEST(BuiltinMethods, ResourcesListIsOrderedAndIdempotent) {
    auto w = test::MakeWiring();
    w.service->AddResource(Resource{"mem://b", "B", "second letter", "text/plain", "bee"});
    w.service->AddResource(Resource{"mem://a", "A", "", "", "ay"});

    auto first = call(w, "resources/list");
    auto second = call(w, "resources/list");
    ASSERT_FALSE(first.IsError());
    EXPECT_EQ(*first.result, *second.result);

    const auto& list = arrayAt(*first.result, "resources");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(test::Str(list[0]->find("uri")), "mem://b");
    EXPECT_EQ(test::Str(list[1]->find("uri")), "mem://a");
    // Bodies are not part of the listing
    EXPECT_EQ(list[0]->find("text"), nullptr);
    EXPECT_EQ(list[1]->find("description"), nullptr);
}

TEST(BuiltinMethods, ResourcesReadReturnsContents) {
    auto w = test::MakeWiring();
    w.service->AddResource(Resource{"mem://doc", "Doc", "", "text/markdown", "# title"});
    w.service->AddResource(Resource{"mem://plain", "Plain", "", "", "raw"});

    auto resp = call(w, "resources/read", R"({"uri":"mem://doc"})");
    ASSERT_FALSE(resp.IsError());
    EXPECT_EQ(*resp.result,
              parseJSON(R"({"contents":[{"uri":"mem://doc","mimeType":"text/markdown","text":"# title"}]})"));

    auto plain = call(w, "resources/read", R"({"uri":"mem://plain"})");
    ASSERT_FALSE(plain.IsError());
    EXPECT_EQ(test::Str(arrayAt(*plain.result, "contents")[0]->find("mimeType")), "text/plain");
}

TEST(BuiltinMethods, ResourcesReadErrors) {
    auto w = test::MakeWiring();
    auto missing = call(w, "resources/read", R"({"uri":"mem://none"})");
    ASSERT_TRUE(missing.IsError());
    EXPECT_EQ(test::ErrorCode(missing), 404);
    EXPECT_EQ(test::ErrorMessage(missing), "Resource not found: mem://none");

    auto noUri = call(w, "resources/read", R"({})");
    ASSERT_TRUE(noUri.IsError());
    EXPECT_EQ(test::ErrorCode(noUri), -32602);
    EXPECT_EQ(test::ErrorMessage(noUri), "Missing or invalid 'uri' parameter");

    auto noParams = call(w, "resources/read");
    ASSERT_TRUE(noParams.IsError());
    EXPECT_EQ(test::ErrorCode(noParams), -32602);
}

TEST(BuiltinMethods, PromptsListAndGet) {
    auto w = test::MakeWiring();
    Prompt p;
    p.name = "greet";
    p.description = "Say hello";
    p.templateText = "Hello {{name}}";
    p.parameters.push_back(PromptParameter{"name", "Who to greet", "string", true});
    w.service->AddPrompt(p);

    auto list = call(w, "prompts/list");
    ASSERT_FALSE(list.IsError());
    EXPECT_EQ(*list.result, parseJSON(R"({"prompts":[{"name":"greet","description":"Say hello",
        "arguments":[{"name":"name","description":"Who to greet","required":true}]}]})"));

    auto get = call(w, "prompts/get", R"({"name":"greet"})");
    ASSERT_TRUE(get.IsError());
    EXPECT_EQ(test::ErrorCode(get), -32603);
    EXPECT_EQ(test::ErrorMessage(get), "Prompt get not implemented");
}

TEST(BuiltinMethods, InitializedNotificationIsSilent) {
    auto w = test::MakeWiring();
    auto out = w.router->HandleMessage(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", std::stop_token{});
    EXPECT_FALSE(out.has_value());
}

TEST(BuiltinMethods, RegisterRequiresService) {
    MethodRouter router(test::QuietLogger());
    EXPECT_THROW(RegisterBuiltinMethods(router, nullptr), std::invalid_argument);
}
