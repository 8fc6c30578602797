#include <gtest/gtest.h>
#include "../../src/network/http/beast_client.hpp"
#include "../../src/network/http/cookie_jar.hpp"
#include "test_helpers.hpp"

using namespace Ferret::Network::Http;
using Ferret::Testing::run_awaitable;

TEST(BeastClientTest, RejectsNonHttpUrl) {
    BeastClient     client;
    Ferret::Request request;
    request.url = "ftp://example.com/file";

    auto res = run_awaitable(client.get(request));
    EXPECT_EQ(res.error_type, ErrorType::InvalidUrl);
    EXPECT_EQ(res.status_code, 0);
    EXPECT_FALSE(res.success);
}

TEST(BeastClientTest, RejectsUnsupportedProxy) {
    BeastClient     client;
    Ferret::Request request;
    request.url   = "http://127.0.0.1:1/";
    request.proxy = "socks5://127.0.0.1:1080";

    auto res = run_awaitable(client.get(request));
    EXPECT_EQ(res.error_type, ErrorType::Proxy);
    EXPECT_NE(res.error.find("socks5"), std::string::npos);
}

TEST(BeastClientTest, RefusedConnectionIsReported) {
    BeastClient client;
    client.set_connect_timeout(std::chrono::milliseconds(1000));
    Ferret::Request request;
    request.url     = "http://127.0.0.1:1/";
    request.timeout = std::chrono::milliseconds(2000);

    auto res = run_awaitable(client.get(request));
    EXPECT_TRUE(is_transport_error(res.error_type)) << to_string(res.error_type);
    EXPECT_FALSE(res.error.empty());
}

TEST(CookieJarTest, StoresSetCookiePairs) {
    CookieJar jar;
    jar.store("a.test", {"sid=abc; Path=/; HttpOnly", " theme = dark ", "novalue", "=orphan"});

    auto cookies = jar.cookies_for("a.test");
    EXPECT_EQ(cookies.size(), 2u);
    EXPECT_EQ(cookies["sid"], "abc");
    EXPECT_EQ(cookies["theme"], "dark");
    EXPECT_TRUE(jar.cookies_for("b.test").empty());
}

TEST(CookieJarTest, LaterValuesReplaceEarlierOnes) {
    CookieJar jar;
    jar.store("a.test", {"sid=1"});
    jar.store("a.test", {"sid=2"});
    jar.set("b.test", "k", "v");

    EXPECT_EQ(jar.cookies_for("a.test").at("sid"), "2");
    EXPECT_EQ(jar.domain_count(), 2u);

    jar.clear();
    EXPECT_EQ(jar.domain_count(), 0u);
}
