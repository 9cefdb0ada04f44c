#include "bridge/server/WsUpgrader.h"

#include <gtest/gtest.h>

using namespace wsgate;
using wsgate::bridge::OriginPolicy;
using wsgate::bridge::WsUpgrader;

namespace
{
    HttpRequest MakeHandshake(const char* origin, const char* protocols)
    {
        HttpRequest req{bhttp::verb::get, "/websockify", 11};
        req.set(bhttp::field::host, "gw.example:8080");
        req.set(bhttp::field::connection, "Upgrade");
        req.set(bhttp::field::upgrade, "websocket");
        req.set(bhttp::field::sec_websocket_version, "13");
        req.set(bhttp::field::sec_websocket_key, "dGhlIHNhbXBsZSBub25jZQ==");
        if (origin)
            req.set(bhttp::field::origin, origin);
        if (protocols)
            req.set(bhttp::field::sec_websocket_protocol, protocols);
        return req;
    }
}

TEST(WsUpgrader, PlainRequestIsBadRequest)
{
    const WsUpgrader up(OriginPolicy::DevelopmentMode());

    HttpRequest req{bhttp::verb::get, "/", 11};
    req.set(bhttp::field::host, "gw.example:8080");

    const auto d = up.Evaluate(req);
    EXPECT_FALSE(d.accepted);
    EXPECT_EQ(d.status, bhttp::status::bad_request);
}

TEST(WsUpgrader, NegotiatesBinarySubprotocol)
{
    const WsUpgrader up(OriginPolicy::DevelopmentMode());

    const auto d = up.Evaluate(MakeHandshake(nullptr, "base64, binary"));
    EXPECT_TRUE(d.accepted);
    EXPECT_EQ(d.status, bhttp::status::switching_protocols);
    EXPECT_EQ(d.subprotocol, "binary");
}

TEST(WsUpgrader, NoSubprotocolWhenNotOffered)
{
    const WsUpgrader up(OriginPolicy::DevelopmentMode());

    EXPECT_TRUE(up.Evaluate(MakeHandshake(nullptr, nullptr)).subprotocol.empty());
    EXPECT_TRUE(up.Evaluate(MakeHandshake(nullptr, "base64")).subprotocol.empty());

    const auto d = up.Evaluate(MakeHandshake(nullptr, "chat"));
    EXPECT_TRUE(d.accepted);
    EXPECT_TRUE(d.subprotocol.empty());
}

TEST(WsUpgrader, RefusedOriginIsForbidden)
{
    const WsUpgrader up(OriginPolicy::AllowList({"https://app.example"}));

    const auto bad = up.Evaluate(MakeHandshake("https://evil.example", "binary"));
    EXPECT_FALSE(bad.accepted);
    EXPECT_EQ(bad.status, bhttp::status::forbidden);
    EXPECT_NE(bad.reason.find("https://evil.example"), std::string::npos);

    EXPECT_TRUE(up.Evaluate(MakeHandshake("https://app.example", "binary")).accepted);
}

TEST(WsUpgrader, OffersSubprotocolMatchesWholeTokens)
{
    EXPECT_TRUE(WsUpgrader::OffersSubprotocol("binary", "binary"));
    EXPECT_TRUE(WsUpgrader::OffersSubprotocol(" base64 ,\tbinary ", "binary"));
    EXPECT_FALSE(WsUpgrader::OffersSubprotocol("binaryx", "binary"));
    EXPECT_FALSE(WsUpgrader::OffersSubprotocol("", "binary"));
}
