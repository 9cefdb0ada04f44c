#include "app/ServerConfig.h"

#include "TestUtil.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

using wsgate::app::ParseServerConfig;
using wsgate::app::ServerConfig;
using wsgate::app::StartupConfigError;
using wsgate::test::Argv;
using wsgate::test::TempDir;

TEST(ServerConfig, MinimalInvocation)
{
    Argv a{"wsgate", ":8080", "localhost:5900"};
    const ServerConfig cfg = ParseServerConfig(a.argc(), a.argv());

    EXPECT_EQ(cfg.listenAddr, ":8080");
    EXPECT_EQ(cfg.targetAddr, "localhost:5900");
    EXPECT_FALSE(cfg.runOnce);
    EXPECT_FALSE(cfg.verbose);
    EXPECT_FALSE(cfg.StaticEnabled());
    EXPECT_FALSE(cfg.TlsEnabled());
    EXPECT_TRUE(cfg.allowedOrigins.empty());
    EXPECT_EQ(cfg.threads, std::max<size_t>(2, std::thread::hardware_concurrency()));
}

TEST(ServerConfig, AllOptions)
{
    TempDir web("cfg_web");
    Argv a{"wsgate", "-v", "-run-once", "-web", web.Path(),
           "-cert", "c.pem", "-key", "k.pem",
           "-origin", "https://a.example, https://b.example",
           "-threads", "3",
           "127.0.0.1:8080", "[::1]:5900"};

    const ServerConfig cfg = ParseServerConfig(a.argc(), a.argv());

    EXPECT_TRUE(cfg.verbose);
    EXPECT_TRUE(cfg.runOnce);
    EXPECT_EQ(cfg.webDir, web.Path());
    EXPECT_TRUE(cfg.TlsEnabled());
    ASSERT_EQ(cfg.allowedOrigins.size(), 2u);
    EXPECT_EQ(cfg.allowedOrigins[0], "https://a.example");
    EXPECT_EQ(cfg.allowedOrigins[1], "https://b.example");
    EXPECT_EQ(cfg.threads, 3u);
    EXPECT_TRUE(cfg.tlsWarning.empty());
}

TEST(ServerConfig, HelpSkipsValidation)
{
    Argv a{"wsgate", "-h"};
    const ServerConfig cfg = ParseServerConfig(a.argc(), a.argv());
    EXPECT_TRUE(cfg.showHelp);
}

TEST(ServerConfig, MissingPositionalsThrow)
{
    Argv a{"wsgate", ":8080"};
    EXPECT_THROW(ParseServerConfig(a.argc(), a.argv()), StartupConfigError);
}

TEST(ServerConfig, ExtraPositionalThrows)
{
    Argv a{"wsgate", ":1", ":2", ":3"};
    EXPECT_THROW(ParseServerConfig(a.argc(), a.argv()), StartupConfigError);
}

TEST(ServerConfig, BadAddressThrows)
{
    Argv a{"wsgate", "8080", "localhost:5900"};
    EXPECT_THROW(ParseServerConfig(a.argc(), a.argv()), StartupConfigError);

    Argv b{"wsgate", ":8080", "localhost:99999"};
    EXPECT_THROW(ParseServerConfig(b.argc(), b.argv()), StartupConfigError);
}

TEST(ServerConfig, WebMustBeADirectory)
{
    Argv a{"wsgate", "-web", "/nonexistent/wsgate/dir", ":1", ":2"};
    EXPECT_THROW(ParseServerConfig(a.argc(), a.argv()), StartupConfigError);
}

TEST(ServerConfig, CertWithoutKeyDisablesTls)
{
    Argv a{"wsgate", "-cert", "c.pem", ":1", ":2"};
    const ServerConfig cfg = ParseServerConfig(a.argc(), a.argv());

    EXPECT_FALSE(cfg.TlsEnabled());
    EXPECT_TRUE(cfg.certFile.empty());
    EXPECT_FALSE(cfg.tlsWarning.empty());
}

TEST(ServerConfig, InvalidThreadsThrows)
{
    Argv a{"wsgate", "-threads", "0", ":1", ":2"};
    EXPECT_THROW(ParseServerConfig(a.argc(), a.argv()), StartupConfigError);

    Argv b{"wsgate", "-threads", "two", ":1", ":2"};
    EXPECT_THROW(ParseServerConfig(b.argc(), b.argv()), StartupConfigError);

    Argv c{"wsgate", "-threads", "99999999999999999999", ":1", ":2"};
    EXPECT_THROW(ParseServerConfig(c.argc(), c.argv()), StartupConfigError);

    Argv d{"wsgate", "-threads", "257", ":1", ":2"};
    EXPECT_THROW(ParseServerConfig(d.argc(), d.argv()), StartupConfigError);
}

TEST(ServerConfig, EmptyOriginListThrows)
{
    Argv a{"wsgate", "-origin", " , ", ":1", ":2"};
    EXPECT_THROW(ParseServerConfig(a.argc(), a.argv()), StartupConfigError);
}

TEST(ServerConfig, UsageMentionsEveryFlag)
{
    const std::string usage = wsgate::app::UsageText("wsgate");
    for (const char* flag : {"-cert", "-key", "-web", "-run-once", "-origin", "-threads", "-v", "-h"})
        EXPECT_NE(usage.find(flag), std::string::npos) << flag;
}
