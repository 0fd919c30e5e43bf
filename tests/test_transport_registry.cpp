//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_transport_registry.cpp
// Purpose: GoogleTests for session channels and the live-connection registry
//==========================================================================================================

#include <gtest/gtest.h>
#include "vaultmcp/Channel.h"
#include "vaultmcp/Protocol.h"
#include "vaultmcp/TransportRegistry.h"
#include <atomic>
#include <stdexcept>
#include <string>

using namespace vaultmcp;

namespace {

class EchoHandler : public IProtocolHandler {
public:
    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& req, const std::string& sessionId) override {
        if (req.method == "explode") {
            throw std::runtime_error("kaboom");
        }
        if (req.method == "null") {
            return nullptr;
        }
        JSONValue::Object o;
        o["session"] = std::make_shared<JSONValue>(sessionId);
        // Deliberately wrong id; the channel must restore the request id
        return CreateResultResponse(JSONRPCId{std::string("other")}, JSONValue{std::move(o)});
    }
    void HandleNotification(const JSONRPCNotification&, const std::string&) override { ++notes; }
    bool HandshakeInternally(const std::string& version) override { return version == PROTOCOL_VERSION; }
    bool IsInitialized() const override { return true; }
    std::optional<std::string> NegotiatedVersion() const override { return std::string(PROTOCOL_VERSION); }

    std::atomic<int> notes{0};
};

std::shared_ptr<SessionChannel> makeChannel(const std::string& sid) {
    return std::make_shared<SessionChannel>(sid, std::make_shared<EchoHandler>());
}

void wireToRegistry(const std::shared_ptr<SessionChannel>& ch, TransportRegistry& reg) {
    ch->SetCloseHandler([&reg](const std::string& sid, const IChannel* self) { reg.OnChannelClosed(sid, self); });
}

} // namespace

//////////////////////////////////////////// SessionChannel ////////////////////////////////////////////

TEST(SessionChannel, ForwardsRequestsAndRestoresId) {
    auto ch = makeChannel("S1");
    auto resp = ch->HandleRequest(JSONRPCRequest(JSONRPCId{static_cast<int64_t>(9)}, "tools/list"));
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(IdToString(resp->id), "9");
    EXPECT_EQ(resp->result->GetString("session"), std::optional<std::string>("S1"));
    EXPECT_TRUE(ch->HandshakeInternally(PROTOCOL_VERSION));
    EXPECT_FALSE(ch->HandshakeInternally("1.0"));
}

TEST(SessionChannel, CloseFiresHandlerOnce) {
    auto ch = makeChannel("S1");
    int closes = 0;
    ch->SetCloseHandler([&](const std::string& sid, const IChannel* self) {
        EXPECT_EQ(sid, "S1");
        EXPECT_EQ(self, ch.get());
        ++closes;
    });
    EXPECT_TRUE(ch->Close());
    EXPECT_FALSE(ch->Close());
    EXPECT_EQ(closes, 1);
    EXPECT_FALSE(ch->IsOpen());

    auto resp = ch->HandleRequest(JSONRPCRequest(JSONRPCId{static_cast<int64_t>(1)}, "tools/list"));
    EXPECT_EQ(resp->ErrorCode(), std::optional<int>(JSONRPCErrorCodes::NoActiveTransport));
    EXPECT_FALSE(ch->HandshakeInternally(PROTOCOL_VERSION));
}

TEST(SessionChannel, HandlerExceptionFailsChannel) {
    auto ch = makeChannel("S1");
    std::string reported;
    int closes = 0;
    ch->SetErrorHandler([&](const std::string&, const std::string& err) { reported = err; });
    ch->SetCloseHandler([&](const std::string&, const IChannel*) { ++closes; });

    auto resp = ch->HandleRequest(JSONRPCRequest(JSONRPCId{static_cast<int64_t>(2)}, "explode"));
    EXPECT_EQ(resp->ErrorCode(), std::optional<int>(JSONRPCErrorCodes::InternalError));
    EXPECT_EQ(reported, "kaboom");
    EXPECT_EQ(closes, 1);
    EXPECT_FALSE(ch->IsOpen());
}

TEST(SessionChannel, NullHandlerResponseBecomesInternalError) {
    auto ch = makeChannel("S1");
    auto resp = ch->HandleRequest(JSONRPCRequest(JSONRPCId{static_cast<int64_t>(3)}, "null"));
    EXPECT_EQ(resp->ErrorCode(), std::optional<int>(JSONRPCErrorCodes::InternalError));
    EXPECT_TRUE(ch->IsOpen());
}

TEST(SessionChannel, RequiresHandler) {
    EXPECT_THROW(SessionChannel("S1", nullptr), std::invalid_argument);
}

//////////////////////////////////////////// TransportRegistry ////////////////////////////////////////////

TEST(TransportRegistry, BindCountsOnlyNewEntries) {
    TransportRegistry reg;
    auto c1 = makeChannel("S1");
    reg.Bind("S1", c1);
    EXPECT_EQ(reg.LiveConnections(), 1u);
    EXPECT_EQ(reg.Get("S1"), c1);

    // An open channel cannot be replaced
    EXPECT_THROW(reg.Bind("S1", makeChannel("S1")), std::logic_error);

    // A closed one can, without changing the count
    c1->Close();
    auto c2 = makeChannel("S1");
    reg.Bind("S1", c2);
    EXPECT_EQ(reg.LiveConnections(), 1u);
    EXPECT_EQ(reg.Get("S1"), c2);
    EXPECT_THROW(reg.Bind("S2", nullptr), std::invalid_argument);
}

TEST(TransportRegistry, CloseHandlerRemovesOnlyMatchingInstance) {
    TransportRegistry reg;
    auto stale = makeChannel("S1");
    wireToRegistry(stale, reg);
    reg.Bind("S1", stale);
    reg.Unbind("S1");
    auto fresh = makeChannel("S1");
    wireToRegistry(fresh, reg);
    reg.Bind("S1", fresh);

    // Closing the stale channel must not unbind its replacement
    stale->Close();
    EXPECT_EQ(reg.Get("S1"), fresh);
    EXPECT_EQ(reg.LiveConnections(), 1u);

    fresh->Close();
    EXPECT_EQ(reg.Get("S1"), nullptr);
    EXPECT_EQ(reg.LiveConnections(), 0u);
}

TEST(TransportRegistry, UnbindAndDrainAll) {
    TransportRegistry reg;
    reg.Bind("A", makeChannel("A"));
    reg.Bind("B", makeChannel("B"));
    reg.Bind("C", makeChannel("C"));
    EXPECT_EQ(reg.SessionIds().size(), 3u);

    auto a = reg.Unbind("A");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(reg.Unbind("A"), nullptr);
    EXPECT_EQ(reg.LiveConnections(), 2u);

    auto drained = reg.DrainAll();
    EXPECT_EQ(drained.size(), 2u);
    EXPECT_EQ(reg.LiveConnections(), 0u);
    EXPECT_TRUE(reg.SessionIds().empty());
}
