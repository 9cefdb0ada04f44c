#include "bridge/server/StaticFileResponder.h"

#include "TestUtil.h"

#include <gtest/gtest.h>

using namespace wsgate;
using wsgate::bridge::StaticFileResponder;
using wsgate::bridge::StaticResponse;
using wsgate::test::LogCapture;
using wsgate::test::TempDir;

namespace
{
    HttpRequest MakeRequest(bhttp::verb method, const std::string& target)
    {
        HttpRequest req{method, target, 11};
        req.set(bhttp::field::host, "localhost");
        return req;
    }

    bhttp::status StatusOf(const StaticResponse& r)
    {
        return std::visit([](const auto& msg) { return msg.result(); }, r);
    }

    class StaticFileResponderTest : public ::testing::Test
    {
    protected:
        StaticFileResponderTest()
            : dir_("static"),
              files_(dir_.Path(), logs_.Make())
        {
            dir_.WriteFile("index.html", "<html>hi</html>");
            dir_.WriteFile("app.js", "console.log(1);");
            dir_.WriteFile("sub/index.html", "<p>sub</p>");
            dir_.WriteFile("my file.txt", "spaced");
        }

        LogCapture logs_;
        TempDir dir_;
        StaticFileResponder files_;
    };
}

TEST_F(StaticFileResponderTest, RootServesIndex)
{
    const auto r = files_.Respond(MakeRequest(bhttp::verb::get, "/"));

    ASSERT_TRUE(std::holds_alternative<bhttp::response<bhttp::file_body>>(r));
    const auto& res = std::get<bhttp::response<bhttp::file_body>>(r);
    EXPECT_EQ(res.result(), bhttp::status::ok);
    EXPECT_EQ(res[bhttp::field::content_type], "text/html; charset=utf-8");
    EXPECT_EQ(res[bhttp::field::content_length], "15");
}

TEST_F(StaticFileResponderTest, FileWithQueryString)
{
    const auto r = files_.Respond(MakeRequest(bhttp::verb::get, "/app.js?v=3"));

    ASSERT_TRUE(std::holds_alternative<bhttp::response<bhttp::file_body>>(r));
    const auto& res = std::get<bhttp::response<bhttp::file_body>>(r);
    EXPECT_EQ(res[bhttp::field::content_type], "text/javascript; charset=utf-8");
}

TEST_F(StaticFileResponderTest, PercentEncodedName)
{
    EXPECT_EQ(StatusOf(files_.Respond(MakeRequest(bhttp::verb::get, "/my%20file.txt"))), bhttp::status::ok);
}

TEST_F(StaticFileResponderTest, DirectoryWithoutSlashRedirects)
{
    const auto r = files_.Respond(MakeRequest(bhttp::verb::get, "/sub"));

    ASSERT_TRUE(std::holds_alternative<bhttp::response<bhttp::string_body>>(r));
    const auto& res = std::get<bhttp::response<bhttp::string_body>>(r);
    EXPECT_EQ(res.result(), bhttp::status::moved_permanently);
    EXPECT_EQ(res[bhttp::field::location], "/sub/");
}

TEST_F(StaticFileResponderTest, DirectoryWithSlashServesIndex)
{
    EXPECT_EQ(StatusOf(files_.Respond(MakeRequest(bhttp::verb::get, "/sub/"))), bhttp::status::ok);
}

TEST_F(StaticFileResponderTest, MissingFileIsNotFound)
{
    const auto r = files_.Respond(MakeRequest(bhttp::verb::get, "/nope.html"));

    ASSERT_TRUE(std::holds_alternative<bhttp::response<bhttp::string_body>>(r));
    const auto& res = std::get<bhttp::response<bhttp::string_body>>(r);
    EXPECT_EQ(res.result(), bhttp::status::not_found);
    EXPECT_EQ(res.body(), "404 page not found\n");
}

TEST_F(StaticFileResponderTest, TraversalIsRejected)
{
    EXPECT_EQ(StatusOf(files_.Respond(MakeRequest(bhttp::verb::get, "/../etc/passwd"))), bhttp::status::bad_request);
    EXPECT_EQ(StatusOf(files_.Respond(MakeRequest(bhttp::verb::get, "/sub/%2e%2e/%2e%2e/x"))), bhttp::status::bad_request);
    EXPECT_EQ(StatusOf(files_.Respond(MakeRequest(bhttp::verb::get, "/bad%zz"))), bhttp::status::bad_request);
}

TEST_F(StaticFileResponderTest, OtherMethodsAreNotAllowed)
{
    const auto r = files_.Respond(MakeRequest(bhttp::verb::post, "/"));

    ASSERT_TRUE(std::holds_alternative<bhttp::response<bhttp::string_body>>(r));
    const auto& res = std::get<bhttp::response<bhttp::string_body>>(r);
    EXPECT_EQ(res.result(), bhttp::status::method_not_allowed);
    EXPECT_EQ(res[bhttp::field::allow], "GET, HEAD");
}

TEST_F(StaticFileResponderTest, HeadHasLengthButNoBody)
{
    const auto r = files_.Respond(MakeRequest(bhttp::verb::head, "/app.js"));

    ASSERT_TRUE(std::holds_alternative<bhttp::response<bhttp::empty_body>>(r));
    const auto& res = std::get<bhttp::response<bhttp::empty_body>>(r);
    EXPECT_EQ(res.result(), bhttp::status::ok);
    EXPECT_EQ(res[bhttp::field::content_length], "15");
}

TEST(StaticFileResponderHelpers, MimeTypes)
{
    EXPECT_EQ(StaticFileResponder::MimeType("/a/b.HTML"), "text/html; charset=utf-8");
    EXPECT_EQ(StaticFileResponder::MimeType("/x.png"), "image/png");
    EXPECT_EQ(StaticFileResponder::MimeType("/x.wasm"), "application/wasm");
    EXPECT_EQ(StaticFileResponder::MimeType("/noext"), "application/octet-stream");
}

TEST(StaticFileResponderHelpers, SafePaths)
{
    EXPECT_TRUE(StaticFileResponder::IsSafePath("/"));
    EXPECT_TRUE(StaticFileResponder::IsSafePath("/a/b..c/d"));
    EXPECT_FALSE(StaticFileResponder::IsSafePath(""));
    EXPECT_FALSE(StaticFileResponder::IsSafePath("relative"));
    EXPECT_FALSE(StaticFileResponder::IsSafePath("/a/.."));
    EXPECT_FALSE(StaticFileResponder::IsSafePath("/a\\b"));
}
