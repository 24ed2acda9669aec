#include "core/Response.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(ResponseTest, BuildsStatusLineHeadersAndBody) {
    Response res(404, "Not Found");
    std::string raw = res.build();

    EXPECT_EQ(raw.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_NE(raw.find("Content-Length: 9\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Content-Type: text/plain\r\n"), std::string::npos);
    EXPECT_EQ(raw.substr(raw.size() - 13), "\r\n\r\nNot Found");
}

TEST(ResponseTest, HeadFormKeepsLengthButDropsBody) {
    Response res(200, "hello");
    std::string raw = res.build(false);

    EXPECT_NE(raw.find("Content-Length: 5\r\n"), std::string::npos);
    EXPECT_EQ(raw.substr(raw.size() - 4), "\r\n\r\n");
}

TEST(ResponseTest, ExplicitContentLengthWins) {
    Response res(200, "");
    res.headers["Content-Length"] = "4096";
    std::string raw = res.build(false);

    EXPECT_NE(raw.find("Content-Length: 4096\r\n"), std::string::npos);
    EXPECT_EQ(raw.find("Content-Length: 0"), std::string::npos);
}

TEST(ResponseTest, ReasonPhrases) {
    EXPECT_STREQ(Response::reasonPhrase(200), "OK");
    EXPECT_STREQ(Response::reasonPhrase(431), "Request Header Fields Too Large");
    EXPECT_STREQ(Response::reasonPhrase(499), "Client Closed Request");
    EXPECT_STREQ(Response::reasonPhrase(502), "Bad Gateway");
    EXPECT_STREQ(Response::reasonPhrase(504), "Gateway Timeout");
    EXPECT_STREQ(Response::reasonPhrase(599), "Error");
}
