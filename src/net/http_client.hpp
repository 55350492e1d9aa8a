#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace kuberde::net {

// HTTP response. Header names are lowercased.
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string error;

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }

  std::string header(const std::string& name) const;
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{30000};

  // Retries on connection errors and 429/5xx; 0 = single attempt
  int max_retries = 0;
  std::chrono::milliseconds retry_delay{500};
};

// TLS settings for https:// URLs
struct TlsOptions {
  std::string ca_file;  // empty = system default verify paths
  bool insecure_skip_verify = false;
};

// Async HTTP client using ASIO
class HttpClient {
 public:
  explicit HttpClient(asio::io_context& io_ctx, const TlsOptions& tls = {});

  ~HttpClient();

  // Async request with callback, invoked on the io_context
  void request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback);

  // Async request returning future. Do not wait on it from the io_context thread.
  std::future<HttpResponse> request(const std::string& url, const HttpOptions& options);

  // Convenience methods
  std::future<HttpResponse> get(const std::string& url, const std::map<std::string, std::string>& headers = {});

  std::future<HttpResponse> post(const std::string& url, const std::string& body, const std::map<std::string, std::string>& headers = {});

  // POST application/x-www-form-urlencoded
  std::future<HttpResponse> post_form(const std::string& url, const std::map<std::string, std::string>& fields,
                                      const std::map<std::string, std::string>& headers = {});

 private:
  class Impl;

  std::shared_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https" || scheme == "wss";
  }

  std::string port_or_default() const;

  // host[:port] for the Host header
  std::string authority() const;

  static std::optional<ParsedUrl> parse(const std::string& url);
};

}  // namespace kuberde::net
