#pragma once

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "core/types.hpp"
#include "mux/stream.hpp"

namespace kuberde::tunnel {

constexpr const char* kUpgradeProtocol = "kuberde-mux";
constexpr const char* kAuthCommand = "AUTH";

// Agent -> relay tunnel request: GET {path}?id={identity} with bearer credential
std::string build_upgrade_request(const std::string& host, const std::string& path_and_query, const std::string& token);

// Relay -> agent reply that switches the connection to mux framing
std::string build_upgrade_response();

// Control line sent on an agent-opened stream to swap the session credential
std::string format_auth_line(const std::string& token);

// "AUTH <token>" -> token
Result<std::string> parse_auth_line(const std::string& line);

struct PreambleOptions {
  size_t max_bytes = 256;
  std::chrono::milliseconds timeout{5000};
};

// selector: the line without '\n'; leftover: payload bytes read past the newline
using PreambleHandler = std::function<void(Result<std::string> selector, std::string leftover)>;

/**
 * Reads a newline-terminated preamble from a stream.
 *
 * Fails with Timeout when the deadline passes and InvalidArgument when the line exceeds
 * max_bytes; in both cases the stream is reset. The handler runs exactly once.
 */
void read_preamble(const std::shared_ptr<mux::MuxStream>& stream, const asio::any_io_executor& executor, const PreambleOptions& options,
                   PreambleHandler handler);

// Result of a client-side upgrade: the raw socket plus bytes read past the 101 head
struct UpgradedConnection {
  std::shared_ptr<asio::ip::tcp::socket> socket;
  std::string leftover;
};

using UpgradeHandler = std::function<void(Result<UpgradedConnection>)>;

/**
 * Dials url (http:// or ws://), sends an Upgrade request for kuberde-mux with the bearer
 * token and waits for 101. Non-101 replies map to ErrorCode via their HTTP status.
 */
void async_upgrade(asio::io_context& io_ctx, const std::string& url, const std::string& token, std::chrono::milliseconds timeout,
                   UpgradeHandler handler);

}  // namespace kuberde::tunnel
