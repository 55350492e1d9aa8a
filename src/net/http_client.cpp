#include "net/http_client.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <regex>
#include <sstream>
#include <thread>

#include "net/http_message.hpp"

namespace kuberde::net {

std::string HttpResponse::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? "" : it->second;
}

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  // Simple regex-based URL parser; ws/wss are accepted for tunnel endpoints
  static const std::regex url_regex(R"(^(https?|wss?):\/\/([^:\/\s\?]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::string ParsedUrl::authority() const {
  return port.empty() ? host : host + ":" + port;
}

namespace {

std::string build_request(const ParsedUrl& url, const HttpOptions& options) {
  std::ostringstream req;
  req << options.method << " " << url.path << url.query << " HTTP/1.1\r\n";
  req << "Host: " << url.authority() << "\r\n";
  req << "Connection: close\r\n";

  for (const auto& [key, value] : options.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!options.body.empty() || options.method == "POST" || options.method == "PUT" || options.method == "PATCH") {
    req << "Content-Length: " << options.body.size() << "\r\n";
  }

  req << "\r\n";
  req << options.body;
  return req.str();
}

// SSL connections may return various errors on close; treat them as EOF
bool is_eof_error(const asio::error_code& ec) {
  return ec == asio::error::eof || ec.category() == asio::error::get_ssl_category() || ec == asio::ssl::error::stream_truncated;
}

bool has_complete_body(const HttpResponse& response) {
  auto content_length = response.header("content-length");
  if (content_length.empty()) return false;
  try {
    return response.body.size() >= std::stoull(content_length);
  } catch (const std::exception&) {
    // Invalid Content-Length, read until EOF
    return false;
  }
}

void finish_body(HttpResponse& response) {
  if (to_lower(response.header("transfer-encoding")).find("chunked") == std::string::npos) return;
  auto decoded = decode_chunked(response.body);
  if (decoded) {
    response.body = std::move(*decoded);
  } else {
    response.error = "Malformed chunked body";
  }
}

}  // namespace

// HTTP Client implementation
class HttpClient::Impl : public std::enable_shared_from_this<HttpClient::Impl> {
 public:
  Impl(asio::io_context& io_ctx, const TlsOptions& tls) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client) {
    if (tls.insecure_skip_verify) {
      ssl_ctx_.set_verify_mode(asio::ssl::verify_none);
      return;
    }
    if (!tls.ca_file.empty()) {
      asio::error_code ec;
      ssl_ctx_.load_verify_file(tls.ca_file, ec);
      if (ec) {
        spdlog::warn("HttpClient: failed to load CA file {}: {}, falling back to system paths", tls.ca_file, ec.message());
        ssl_ctx_.set_default_verify_paths();
      }
    } else {
      ssl_ctx_.set_default_verify_paths();
    }
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  void request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      HttpResponse response;
      response.error = "Invalid URL: " + url;
      asio::post(io_ctx_, [callback, response]() { callback(response); });
      return;
    }

    if (parsed->is_https()) {
      auto socket = std::make_shared<asio::ssl::stream<asio::ip::tcp::socket>>(io_ctx_, ssl_ctx_);
      // Set SNI hostname
      SSL_set_tlsext_host_name(socket->native_handle(), parsed->host.c_str());
      start(socket, *parsed, options, std::move(callback));
    } else {
      auto socket = std::make_shared<asio::ip::tcp::socket>(io_ctx_);
      start(socket, *parsed, options, std::move(callback));
    }
  }

 private:
  static asio::ip::tcp::socket& lowest(asio::ip::tcp::socket& socket) {
    return socket;
  }

  static asio::ip::tcp::socket& lowest(asio::ssl::stream<asio::ip::tcp::socket>& socket) {
    return socket.next_layer();
  }

  template <typename Socket>
  static void close_socket(const std::shared_ptr<Socket>& socket) {
    asio::error_code ignored;
    lowest(*socket).close(ignored);
  }

  static void handshake(asio::ip::tcp::socket&, std::function<void(const asio::error_code&)> next) {
    next(asio::error_code());
  }

  static void handshake(asio::ssl::stream<asio::ip::tcp::socket>& socket, std::function<void(const asio::error_code&)> next) {
    socket.async_handshake(asio::ssl::stream_base::client, std::move(next));
  }

  template <typename Socket>
  void start(std::shared_ptr<Socket> socket, const ParsedUrl& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto self = shared_from_this();
    auto response = std::make_shared<HttpResponse>();
    auto request_str = std::make_shared<std::string>(build_request(url, options));
    auto buffer = std::make_shared<asio::streambuf>();
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(io_ctx_);
    auto timed_out = std::make_shared<bool>(false);
    auto done = std::make_shared<bool>(false);

    // Timeout timer: when it fires, mark timed out and close the socket
    auto timer = std::make_shared<asio::steady_timer>(io_ctx_);
    timer->expires_after(options.timeout);
    timer->async_wait([socket, resolver, timed_out](const asio::error_code& ec) {
      if (!ec) {
        *timed_out = true;
        resolver->cancel();
        close_socket(socket);
      }
    });

    // Wrap callback to cancel timer, check timeout and fire only once
    auto guarded_callback = [timer, timed_out, done, callback](HttpResponse resp) {
      if (*done) return;
      *done = true;
      timer->cancel();
      if (*timed_out) {
        resp.error = "Request timed out";
        resp.status_code = 0;
      }
      callback(std::move(resp));
    };

    resolver->async_resolve(
        url.host, url.port_or_default(),
        [self, socket, resolver, request_str, response, buffer, guarded_callback](const asio::error_code& ec,
                                                                                  asio::ip::tcp::resolver::results_type results) {
          if (ec) {
            response->error = "DNS resolution failed: " + ec.message();
            guarded_callback(*response);
            return;
          }

          asio::async_connect(lowest(*socket), results, [self, socket, request_str, response, buffer, guarded_callback](const asio::error_code& ec,
                                                                                                                     const asio::ip::tcp::endpoint&) {
            if (ec) {
              response->error = "Connection failed: " + ec.message();
              guarded_callback(*response);
              return;
            }

            handshake(*socket, [self, socket, request_str, response, buffer, guarded_callback](const asio::error_code& ec) {
              if (ec) {
                response->error = "SSL handshake failed: " + ec.message();
                guarded_callback(*response);
                return;
              }

              asio::async_write(*socket, asio::buffer(*request_str),
                                [self, socket, request_str, response, buffer, guarded_callback](const asio::error_code& ec, size_t) {
                                  if (ec) {
                                    response->error = "Write failed: " + ec.message();
                                    guarded_callback(*response);
                                    return;
                                  }

                                  self->read_response(socket, response, buffer, guarded_callback);
                                });
            });
          });
        });
  }

  template <typename Socket>
  void read_response(std::shared_ptr<Socket> socket, std::shared_ptr<HttpResponse> response, std::shared_ptr<asio::streambuf> buffer,
                     std::function<void(HttpResponse)> callback) {
    auto self = shared_from_this();
    asio::async_read_until(*socket, *buffer, "\r\n\r\n", [self, socket, response, buffer, callback](const asio::error_code& ec, size_t header_bytes) {
      if (ec) {
        response->error = "Read headers failed: " + ec.message();
        callback(*response);
        return;
      }

      std::string data(asio::buffers_begin(buffer->data()), asio::buffers_begin(buffer->data()) + header_bytes);
      buffer->consume(header_bytes);

      auto line_end = data.find("\r\n");
      auto status = parse_status_line(data.substr(0, line_end));
      if (!status) {
        response->error = "Invalid HTTP response: cannot parse status line";
        callback(*response);
        return;
      }
      response->status_code = *status;
      response->headers = parse_header_lines(data.substr(line_end + 2));

      self->read_body(socket, response, buffer, callback);
    });
  }

  template <typename Socket>
  void read_body(std::shared_ptr<Socket> socket, std::shared_ptr<HttpResponse> response, std::shared_ptr<asio::streambuf> buffer,
                 std::function<void(HttpResponse)> callback) {
    // First, add any remaining data in buffer to body
    if (buffer->size() > 0) {
      response->body.append(asio::buffers_begin(buffer->data()), asio::buffers_end(buffer->data()));
      buffer->consume(buffer->size());
    }

    if (has_complete_body(*response) || response->status_code == 204 || response->status_code == 304) {
      close_socket(socket);
      callback(*response);
      return;
    }

    // Continue reading until EOF or we have all data
    auto self = shared_from_this();
    asio::async_read(*socket, *buffer, asio::transfer_at_least(1), [self, socket, response, buffer, callback](const asio::error_code& ec, size_t) {
      if (ec && !is_eof_error(ec)) {
        response->error = "Read body failed: " + ec.message();
        callback(*response);
        return;
      }

      if (ec) {
        if (buffer->size() > 0) {
          response->body.append(asio::buffers_begin(buffer->data()), asio::buffers_end(buffer->data()));
          buffer->consume(buffer->size());
        }
        finish_body(*response);
        callback(*response);
        return;
      }

      self->read_body(socket, response, buffer, callback);
    });
  }

  asio::io_context& io_ctx_;
  asio::ssl::context ssl_ctx_;
};

HttpClient::HttpClient(asio::io_context& io_ctx, const TlsOptions& tls) : impl_(std::make_shared<Impl>(io_ctx, tls)) {}

HttpClient::~HttpClient() = default;

void HttpClient::request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
  impl_->request(url, options, std::move(callback));
}

std::future<HttpResponse> HttpClient::request(const std::string& url, const HttpOptions& options) {
  if (options.max_retries <= 0) {
    auto promise = std::make_shared<std::promise<HttpResponse>>();
    auto future = promise->get_future();

    impl_->request(url, options, [promise](HttpResponse response) {
      promise->set_value(std::move(response));
    });

    return future;
  }

  // With retry: std::async drives the retry loop
  auto impl = impl_;
  return std::async(std::launch::async, [impl, url, options]() -> HttpResponse {
    auto is_retryable = [](const HttpResponse& resp) -> bool {
      // Connection/timeout errors (status_code == 0 means no HTTP response received)
      if (resp.status_code == 0) return true;
      if (resp.status_code == 429) return true;
      return resp.status_code == 502 || resp.status_code == 503 || resp.status_code == 504;
    };

    HttpResponse last_response;
    int max_attempts = 1 + options.max_retries;

    for (int attempt = 0; attempt < max_attempts; ++attempt) {
      auto promise = std::make_shared<std::promise<HttpResponse>>();
      auto future = promise->get_future();

      impl->request(url, options, [promise](HttpResponse response) {
        promise->set_value(std::move(response));
      });

      last_response = future.get();

      if (last_response.ok() || !is_retryable(last_response)) {
        return last_response;
      }

      // Last attempt, no sleep
      if (attempt + 1 >= max_attempts) {
        break;
      }

      spdlog::warn("HTTP {} {} failed (status={}, error={}), retrying {}/{}...", options.method, url, last_response.status_code, last_response.error,
                   attempt + 1, options.max_retries);
      std::this_thread::sleep_for(options.retry_delay);
    }

    return last_response;
  });
}

std::future<HttpResponse> HttpClient::get(const std::string& url, const std::map<std::string, std::string>& headers) {
  HttpOptions options;
  options.method = "GET";
  options.headers = headers;
  return request(url, options);
}

std::future<HttpResponse> HttpClient::post(const std::string& url, const std::string& body, const std::map<std::string, std::string>& headers) {
  HttpOptions options;
  options.method = "POST";
  options.body = body;
  options.headers = headers;
  return request(url, options);
}

std::future<HttpResponse> HttpClient::post_form(const std::string& url, const std::map<std::string, std::string>& fields,
                                                const std::map<std::string, std::string>& headers) {
  HttpOptions options;
  options.method = "POST";
  options.body = form_encode(fields);
  options.headers = headers;
  options.headers["Content-Type"] = "application/x-www-form-urlencoded";
  return request(url, options);
}

}  // namespace kuberde::net
