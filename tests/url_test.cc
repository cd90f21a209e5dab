#include "utils/url.h"
#include <gtest/gtest.h>

using namespace bridge::utils;

TEST(UrlTest, ParsesHttpsWithPathAndQuery) {
    auto url = Url::parse("https://api.example.com/v1/sse?token=x#frag");

    EXPECT_EQ(url.scheme, "https");
    EXPECT_EQ(url.host, "api.example.com");
    EXPECT_EQ(url.port, "443");
    EXPECT_FALSE(url.explicit_port);
    EXPECT_EQ(url.target, "/v1/sse?token=x");
    EXPECT_TRUE(url.is_tls());
    EXPECT_EQ(url.origin(), "https://api.example.com");
}

TEST(UrlTest, KeepsExplicitPortInOrigin) {
    auto url = Url::parse("http://localhost:8080/sse");

    EXPECT_EQ(url.port, "8080");
    EXPECT_TRUE(url.explicit_port);
    EXPECT_EQ(url.host_header(), "localhost:8080");
    EXPECT_EQ(url.origin(), "http://localhost:8080");
    EXPECT_EQ(url.str(), "http://localhost:8080/sse");
}

TEST(UrlTest, DefaultPortWrittenExplicitlyIsNormalized) {
    auto url = Url::parse("HTTP://Example.COM:80");

    EXPECT_EQ(url.scheme, "http");
    EXPECT_EQ(url.host, "example.com");
    EXPECT_EQ(url.target, "/");
    EXPECT_EQ(url.origin(), "http://example.com");
}

TEST(UrlTest, ParsesBracketedIpv6) {
    auto url = Url::parse("http://[::1]:9000/events");

    EXPECT_EQ(url.host, "::1");
    EXPECT_EQ(url.port, "9000");
    EXPECT_EQ(url.host_header(), "[::1]:9000");
    EXPECT_EQ(url.target, "/events");
}

TEST(UrlTest, QueryWithoutPathGetsRootPath) {
    auto url = Url::parse("http://host?x=1");
    EXPECT_EQ(url.target, "/?x=1");
}

TEST(UrlTest, RejectsMalformedUrls) {
    EXPECT_THROW(Url::parse("example.com/sse"), UrlError);
    EXPECT_THROW(Url::parse("ftp://example.com/"), UrlError);
    EXPECT_THROW(Url::parse("http:///path"), UrlError);
    EXPECT_THROW(Url::parse("http://user:pw@host/"), UrlError);
    EXPECT_THROW(Url::parse("http://host:99999/"), UrlError);
    EXPECT_THROW(Url::parse("http://host:abc/"), UrlError);
    EXPECT_THROW(Url::parse("http://[::1/"), UrlError);
}

TEST(UrlTest, HasHttpScheme) {
    EXPECT_TRUE(has_http_scheme("http://a"));
    EXPECT_TRUE(has_http_scheme("HTTPS://a"));
    EXPECT_FALSE(has_http_scheme("/messages"));
    EXPECT_FALSE(has_http_scheme("ws://a"));
    EXPECT_FALSE(has_http_scheme(""));
}

TEST(UrlTest, DerivePostUrlReplacesTrailingSuffix) {
    EXPECT_EQ(derive_post_url("https://host/sse"), "https://host/mcp");
    EXPECT_EQ(derive_post_url("https://host/api/sse"), "https://host/api/mcp");
    EXPECT_EQ(derive_post_url("https://host/events"), "https://host/events");
    EXPECT_EQ(derive_post_url("https://host/sse/x"), "https://host/sse/x");
    EXPECT_EQ(derive_post_url("https://host/stream", "/stream", "/rpc"), "https://host/rpc");
}
