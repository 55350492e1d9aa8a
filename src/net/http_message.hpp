#pragma once

#include <map>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace kuberde::net {

// Parsed inbound HTTP/1.1 request (server side). Header names are lowercased.
struct HttpRequest {
  std::string method;
  std::string target;  // raw request target, e.g. /mgmt/routes?workload=x
  std::string path;    // decoded path without query
  std::string version = "HTTP/1.1";
  std::map<std::string, std::string> query;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string remote_address;

  std::string header(const std::string& name) const;

  std::optional<std::string> query_param(const std::string& name) const;

  std::optional<std::string> cookie(const std::string& name) const;

  // application/x-www-form-urlencoded body
  std::map<std::string, std::string> form() const;

  // Token from "Authorization: Bearer <token>", empty when absent
  std::string bearer_token() const;

  bool is_upgrade() const;

  // Host header without the port
  std::string host() const;

  size_t content_length() const;

  // Parses the request line and headers of a head terminated by CRLFCRLF
  static Result<HttpRequest> parse_head(const std::string& head);
};

// Outbound HTTP/1.1 response built by server handlers
struct HttpReply {
  int status = 200;
  std::map<std::string, std::string> headers;
  std::string body;

  static HttpReply json_body(int status, const json& body);

  static HttpReply text(int status, std::string body);

  static HttpReply redirect(const std::string& location);

  static HttpReply no_content();

  // JSON {"error": code, "message": msg} with the status mapped from the code
  static HttpReply error(const Status& status);

  HttpReply& set_header(const std::string& name, const std::string& value) {
    headers[name] = value;
    return *this;
  }

  // Serialized with Content-Length and Connection: close
  std::string serialize() const;
};

// Status line of an HTTP/1.x response head ("HTTP/1.1 101 Switching Protocols" -> 101)
std::optional<int> parse_status_line(const std::string& line);

// Lowercased header map of a response head (status line excluded)
std::map<std::string, std::string> parse_header_lines(const std::string& head);

const char* status_text(int status);

std::string url_encode(const std::string& value);

std::string url_decode(const std::string& value);

// a=1&b=2 -> {a:1, b:2}
std::map<std::string, std::string> parse_query(const std::string& query);

std::string form_encode(const std::map<std::string, std::string>& fields);

// Decodes a complete Transfer-Encoding: chunked body
std::optional<std::string> decode_chunked(const std::string& body);

std::string to_lower(std::string s);

}  // namespace kuberde::net
