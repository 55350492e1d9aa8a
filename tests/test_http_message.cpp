#include <gtest/gtest.h>

#include "net/http_message.hpp"

using namespace kuberde;
using namespace kuberde::net;

// --- HttpRequestTest ---

TEST(HttpRequestTest, ParseHead) {
  auto parsed = HttpRequest::parse_head(
      "GET /connect/user-alice-ws?service=ssh&x=a%20b HTTP/1.1\r\n"
      "Host: Files.User-Alice-WS.example.com:8443\r\n"
      "Connection: keep-alive, Upgrade\r\n"
      "Upgrade: kuberde-tunnel\r\n"
      "Authorization: Bearer  abc.def.ghi \r\n"
      "Cookie: theme=dark; kuberde_session=s3cr3t\r\n"
      "Content-Length: 12\r\n"
      "\r\n");
  ASSERT_TRUE(parsed.ok());
  const auto& req = *parsed.value;

  EXPECT_EQ(req.method, "GET");
  EXPECT_EQ(req.path, "/connect/user-alice-ws");
  EXPECT_EQ(req.query_param("service").value_or(""), "ssh");
  EXPECT_EQ(req.query_param("x").value_or(""), "a b");
  EXPECT_FALSE(req.query_param("missing").has_value());
  EXPECT_EQ(req.header("UPGRADE"), "kuberde-tunnel");
  EXPECT_TRUE(req.is_upgrade());
  EXPECT_EQ(req.host(), "files.user-alice-ws.example.com");
  EXPECT_EQ(req.bearer_token(), "abc.def.ghi");
  EXPECT_EQ(req.cookie("kuberde_session").value_or(""), "s3cr3t");
  EXPECT_FALSE(req.cookie("other").has_value());
  EXPECT_EQ(req.content_length(), 12u);
}

TEST(HttpRequestTest, RejectsMalformedHeads) {
  EXPECT_FALSE(HttpRequest::parse_head("GET /\r\n\r\n").ok());
  EXPECT_FALSE(HttpRequest::parse_head("GET / SPDY/3\r\n\r\n").ok());
  EXPECT_FALSE(HttpRequest::parse_head("no line ending").ok());
}

TEST(HttpRequestTest, HostVariants) {
  HttpRequest req;
  req.headers["host"] = "[::1]:8080";
  EXPECT_EQ(req.host(), "[::1]");
  req.headers["host"] = "relay";
  EXPECT_EQ(req.host(), "relay");
}

TEST(HttpRequestTest, NotAnUpgradeWithoutUpgradeHeader) {
  HttpRequest req;
  req.headers["connection"] = "Upgrade";
  EXPECT_FALSE(req.is_upgrade());
  req.headers["authorization"] = "Basic Zm9vOmJhcg==";
  EXPECT_EQ(req.bearer_token(), "");
}

TEST(HttpRequestTest, FormBody) {
  HttpRequest req;
  req.body = "grant_type=client_credentials&client_id=agent+a&scope";
  auto form = req.form();
  EXPECT_EQ(form["grant_type"], "client_credentials");
  EXPECT_EQ(form["client_id"], "agent a");
  EXPECT_EQ(form["scope"], "");
}

// --- HttpReplyTest ---

TEST(HttpReplyTest, Serialize) {
  auto reply = HttpReply::text(200, "ok");
  auto wire = reply.serialize();
  EXPECT_EQ(wire.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
  EXPECT_NE(wire.find("Content-Length: 2\r\n"), std::string::npos);
  EXPECT_NE(wire.find("Connection: close\r\n\r\nok"), std::string::npos);
}

TEST(HttpReplyTest, ErrorMapsStatus) {
  auto reply = HttpReply::error(Status::failure(ErrorCode::AgentUnavailable, "agent offline"));
  EXPECT_EQ(reply.status, 502);
  auto body = json::parse(reply.body);
  EXPECT_EQ(body["error"].get<std::string>(), to_string(ErrorCode::AgentUnavailable));
  EXPECT_EQ(body["message"].get<std::string>(), "agent offline");
}

TEST(HttpReplyTest, Redirect) {
  auto reply = HttpReply::redirect("/auth/login");
  EXPECT_EQ(reply.status, 302);
  EXPECT_EQ(reply.headers["Location"], "/auth/login");
}

// --- HttpHelpersTest ---

TEST(HttpHelpersTest, StatusLine) {
  EXPECT_EQ(parse_status_line("HTTP/1.1 101 Switching Protocols").value_or(0), 101);
  EXPECT_FALSE(parse_status_line("SSH-2.0-OpenSSH").has_value());
}

TEST(HttpHelpersTest, HeaderLines) {
  auto headers = parse_header_lines("Content-Type: application/json\r\nX-Empty:\r\n\r\nBody: ignored\r\n");
  EXPECT_EQ(headers["content-type"], "application/json");
  EXPECT_EQ(headers.count("x-empty"), 1u);
  EXPECT_EQ(headers.count("body"), 0u);
}

TEST(HttpHelpersTest, UrlCoding) {
  EXPECT_EQ(url_encode("a b/c~"), "a%20b%2Fc~");
  EXPECT_EQ(url_decode("a%20b%2fc+d"), "a b/c d");
  EXPECT_EQ(url_decode("100%"), "100%");
  EXPECT_EQ(form_encode({{"b", "2"}, {"a", "x y"}}), "a=x%20y&b=2");
}

TEST(HttpHelpersTest, Chunked) {
  EXPECT_EQ(decode_chunked("5\r\nhello\r\n6;ext=1\r\n world\r\n0\r\n\r\n").value_or(""), "hello world");
  EXPECT_FALSE(decode_chunked("5\r\nhel").has_value());
  EXPECT_FALSE(decode_chunked("zz\r\n").has_value());
}
