//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_protocol_handler.cpp
// Purpose: GoogleTests for MCP method dispatch: initialize, internal handshake, tools and resources
//==========================================================================================================

#include <gtest/gtest.h>
#include "vaultmcp/Protocol.h"
#include "vaultmcp/ProtocolHandler.h"
#include "vaultmcp/store/DocumentStore.h"
#include "vaultmcp/tools/ToolInvoker.h"
#include "vaultmcp/tools/VaultTools.h"
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace vaultmcp;
namespace fs = std::filesystem;

namespace {

std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

JSONRPCRequest request(const std::string& method, std::optional<JSONValue> params = std::nullopt) {
    return JSONRPCRequest(JSONRPCId{static_cast<int64_t>(1)}, method, std::move(params));
}

JSONValue initializeParams(const std::string& version) {
    JSONValue::Object ci;
    ci["name"] = str("test-client");
    ci["version"] = str("0.1");
    JSONValue::Object p;
    p["protocolVersion"] = str(version);
    p["clientInfo"] = std::make_shared<JSONValue>(JSONValue{std::move(ci)});
    return JSONValue{std::move(p)};
}

class ProtocolHandlerTest : public ::testing::Test {
protected:
    fs::path dir;
    std::shared_ptr<store::IDocumentStore> docs;
    std::unique_ptr<ProtocolHandler> handler;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("vaultmcp-handler-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(dir);
        std::ofstream(dir / "hello.md") << "# Hello\nworld\n";
        docs = std::make_shared<store::FileSystemDocumentStore>(dir, store::VaultFirewall());
        auto registry = std::make_shared<tools::ToolRegistry>();
        tools::RegisterVaultTools(*registry, docs);
        ProtocolHandlerOptions opts;
        opts.invoker = std::make_shared<tools::ToolInvoker>(registry, nullptr);
        opts.store = docs;
        opts.serverInfo = Implementation("vault-mcp", "test");
        opts.sessionInfo = []() {
            JSONValue::Object o;
            o["activeSessions"] = std::make_shared<JSONValue>(static_cast<int64_t>(3));
            return JSONValue{std::move(o)};
        };
        handler = std::make_unique<ProtocolHandler>(opts);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void initialize() {
        auto resp = handler->HandleRequest(request(Methods::Initialize, initializeParams(PROTOCOL_VERSION)), "S1");
        ASSERT_FALSE(resp->IsError());
    }
};

} // namespace

TEST_F(ProtocolHandlerTest, InitializeNegotiatesSupportedVersion) {
    auto resp = handler->HandleRequest(request(Methods::Initialize, initializeParams("2024-11-05")), "S1");
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(resp->result->GetString("protocolVersion"), std::optional<std::string>("2024-11-05"));
    const JSONValue* info = resp->result->Find("serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->GetString("name"), std::optional<std::string>("vault-mcp"));
    ASSERT_NE(resp->result->Find("capabilities"), nullptr);
    EXPECT_NE(resp->result->Find("capabilities")->Find("tools"), nullptr);
    EXPECT_TRUE(handler->IsInitialized());
    EXPECT_EQ(handler->NegotiatedVersion(), std::optional<std::string>("2024-11-05"));
}

TEST_F(ProtocolHandlerTest, InitializeAdvertisesConfiguredCapabilities) {
    ProtocolHandlerOptions opts;
    opts.store = docs;
    opts.capabilities.tools = ToolsCapability{true};
    opts.capabilities.resources.reset();
    ProtocolHandler toolsOnly(opts);
    auto resp = toolsOnly.HandleRequest(request(Methods::Initialize, initializeParams(PROTOCOL_VERSION)), "S1");
    ASSERT_FALSE(resp->IsError());
    const JSONValue* caps = resp->result->Find("capabilities");
    ASSERT_NE(caps, nullptr);
    ASSERT_NE(caps->Find("tools"), nullptr);
    EXPECT_EQ(caps->Find("tools")->GetBool("listChanged"), std::optional<bool>(true));
    EXPECT_EQ(caps->Find("resources"), nullptr);
}

TEST_F(ProtocolHandlerTest, InitializedNotificationMarksClientReady) {
    initialize();
    EXPECT_FALSE(handler->IsClientReady());
    handler->HandleNotification(JSONRPCNotification("notifications/cancelled"), "S1");
    EXPECT_FALSE(handler->IsClientReady());
    handler->HandleNotification(JSONRPCNotification(Methods::Initialized), "S1");
    EXPECT_TRUE(handler->IsClientReady());
}

TEST_F(ProtocolHandlerTest, InitializeRejectsUnknownVersion) {
    auto resp = handler->HandleRequest(request(Methods::Initialize, initializeParams("1999-01-01")), "S1");
    EXPECT_EQ(resp->ErrorCode(), std::optional<int>(JSONRPCErrorCodes::InvalidParams));
    const JSONValue* data = resp->error->Find("data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->GetString("requested"), std::optional<std::string>("1999-01-01"));
    EXPECT_NE(data->Find("supported"), nullptr);
    EXPECT_FALSE(handler->IsInitialized());
}

TEST_F(ProtocolHandlerTest, RequestsBeforeInitializeAreRejectedWithSessionId) {
    auto resp = handler->HandleRequest(request(Methods::ListTools), "S42");
    EXPECT_EQ(resp->ErrorCode(), std::optional<int>(JSONRPCErrorCodes::NotInitialized));
    EXPECT_EQ(resp->error->Find("data")->GetString("sessionId"), std::optional<std::string>("S42"));

    // ping is always answered
    auto ping = handler->HandleRequest(request(Methods::Ping), "S42");
    EXPECT_FALSE(ping->IsError());
}

TEST_F(ProtocolHandlerTest, InternalHandshakeAcceptsOnlySupportedVersions) {
    EXPECT_FALSE(handler->HandshakeInternally("1.0"));
    EXPECT_FALSE(handler->IsInitialized());
    EXPECT_TRUE(handler->HandshakeInternally("2024-11-05"));
    EXPECT_TRUE(handler->IsInitialized());
    auto resp = handler->HandleRequest(request(Methods::ListTools), "S1");
    EXPECT_FALSE(resp->IsError());
}

TEST_F(ProtocolHandlerTest, ToolsListDescribesVaultTools) {
    initialize();
    auto resp = handler->HandleRequest(request(Methods::ListTools), "S1");
    ASSERT_FALSE(resp->IsError());
    const auto& tools = std::get<JSONValue::Array>(resp->result->Find("tools")->value);
    EXPECT_EQ(tools.size(), 7u);
    bool sawSearch = false;
    for (const auto& t : tools) {
        if (t->GetString("name") == std::optional<std::string>("vault.search")) {
            sawSearch = true;
            EXPECT_NE(t->Find("inputSchema"), nullptr);
        }
    }
    EXPECT_TRUE(sawSearch);
}

TEST_F(ProtocolHandlerTest, ToolsCallReturnsTextAndStructuredContent) {
    initialize();
    JSONValue::Object args;
    args["path"] = str("hello.md");
    JSONValue::Object p;
    p["name"] = str("vault.read");
    p["arguments"] = std::make_shared<JSONValue>(JSONValue{std::move(args)});
    auto resp = handler->HandleRequest(request(Methods::CallTool, JSONValue{std::move(p)}), "S1");
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(resp->result->GetBool("isError"), std::optional<bool>(false));
    const JSONValue* structured = resp->result->Find("structuredContent");
    ASSERT_NE(structured, nullptr);
    EXPECT_EQ(structured->GetString("content"), std::optional<std::string>("# Hello\nworld\n"));
    const auto& content = std::get<JSONValue::Array>(resp->result->Find("content")->value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0]->GetString("type"), std::optional<std::string>("text"));
}

TEST_F(ProtocolHandlerTest, ToolsCallErrors) {
    initialize();
    auto missingName = handler->HandleRequest(request(Methods::CallTool, JSONValue{JSONValue::Object{}}), "S1");
    EXPECT_EQ(missingName->ErrorCode(), std::optional<int>(JSONRPCErrorCodes::InvalidParams));

    JSONValue::Object p;
    p["name"] = str("vault.teleport");
    auto unknown = handler->HandleRequest(request(Methods::CallTool, JSONValue{std::move(p)}), "S1");
    EXPECT_EQ(unknown->ErrorCode(), std::optional<int>(JSONRPCErrorCodes::ToolNotFound));

    JSONValue::Object args;
    args["path"] = str("../etc/passwd");
    JSONValue::Object q;
    q["name"] = str("vault.read");
    q["arguments"] = std::make_shared<JSONValue>(JSONValue{std::move(args)});
    auto escape = handler->HandleRequest(request(Methods::CallTool, JSONValue{std::move(q)}), "S1");
    EXPECT_EQ(escape->ErrorCode(), std::optional<int>(JSONRPCErrorCodes::SecurityViolation));
}

TEST_F(ProtocolHandlerTest, ResourcesListAndRead) {
    initialize();
    auto list = handler->HandleRequest(request(Methods::ListResources), "S1");
    ASSERT_FALSE(list->IsError());
    EXPECT_EQ(std::get<JSONValue::Array>(list->result->Find("resources")->value).size(), 2u);

    JSONValue::Object p;
    p["uri"] = str("vault://info");
    auto info = handler->HandleRequest(request(Methods::ReadResource, JSONValue{std::move(p)}), "S1");
    ASSERT_FALSE(info->IsError());
    const auto& contents = std::get<JSONValue::Array>(info->result->Find("contents")->value);
    ASSERT_EQ(contents.size(), 1u);
    JSONValue body = ParseJSON(contents[0]->GetString("text").value());
    EXPECT_EQ(body.GetInt("documentCount"), std::optional<int64_t>(1));

    JSONValue::Object s;
    s["uri"] = str("vault://session-info");
    auto session = handler->HandleRequest(request(Methods::ReadResource, JSONValue{std::move(s)}), "S1");
    ASSERT_FALSE(session->IsError());

    JSONValue::Object m;
    m["uri"] = str("vault://missing");
    auto missing = handler->HandleRequest(request(Methods::ReadResource, JSONValue{std::move(m)}), "S1");
    EXPECT_EQ(missing->ErrorCode(), std::optional<int>(JSONRPCErrorCodes::ResourceNotFound));
}

TEST_F(ProtocolHandlerTest, UnknownMethodAfterInitialize) {
    initialize();
    auto resp = handler->HandleRequest(request("prompts/list"), "S1");
    EXPECT_EQ(resp->ErrorCode(), std::optional<int>(JSONRPCErrorCodes::MethodNotFound));
}
