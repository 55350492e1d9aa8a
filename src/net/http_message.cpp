#include "net/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace kuberde::net {

namespace {

std::string trim(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

bool iequals_token(const std::string& header_value, const std::string& token) {
  // Comma separated, case-insensitive: "keep-alive, Upgrade"
  std::stringstream ss(header_value);
  std::string part;
  while (std::getline(ss, part, ',')) {
    if (to_lower(trim(part)) == token) return true;
  }
  return false;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// ============================================================
// HttpRequest
// ============================================================

std::string HttpRequest::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? "" : it->second;
}

std::optional<std::string> HttpRequest::query_param(const std::string& name) const {
  auto it = query.find(name);
  if (it == query.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> HttpRequest::cookie(const std::string& name) const {
  std::string cookies = header("cookie");
  std::stringstream ss(cookies);
  std::string pair;
  while (std::getline(ss, pair, ';')) {
    auto eq = pair.find('=');
    if (eq == std::string::npos) continue;
    if (trim(pair.substr(0, eq)) == name) {
      return trim(pair.substr(eq + 1));
    }
  }
  return std::nullopt;
}

std::map<std::string, std::string> HttpRequest::form() const {
  return parse_query(body);
}

std::string HttpRequest::bearer_token() const {
  std::string auth = header("authorization");
  if (auth.size() > 7 && to_lower(auth.substr(0, 7)) == "bearer ") {
    return trim(auth.substr(7));
  }
  return "";
}

bool HttpRequest::is_upgrade() const {
  return iequals_token(header("connection"), "upgrade") && !header("upgrade").empty();
}

std::string HttpRequest::host() const {
  std::string h = to_lower(header("host"));
  if (!h.empty() && h.front() == '[') {
    auto close = h.find(']');
    return close == std::string::npos ? h : h.substr(0, close + 1);
  }
  auto colon = h.find(':');
  return colon == std::string::npos ? h : h.substr(0, colon);
}

size_t HttpRequest::content_length() const {
  std::string value = header("content-length");
  if (value.empty()) return 0;
  try {
    return static_cast<size_t>(std::stoull(value));
  } catch (const std::exception&) {
    return 0;
  }
}

Result<HttpRequest> HttpRequest::parse_head(const std::string& head) {
  HttpRequest req;

  auto line_end = head.find("\r\n");
  if (line_end == std::string::npos) {
    return Result<HttpRequest>::failure(ErrorCode::InvalidArgument, "missing request line");
  }

  std::istringstream request_line(head.substr(0, line_end));
  if (!(request_line >> req.method >> req.target >> req.version)) {
    return Result<HttpRequest>::failure(ErrorCode::InvalidArgument, "malformed request line");
  }
  if (req.version.compare(0, 5, "HTTP/") != 0) {
    return Result<HttpRequest>::failure(ErrorCode::InvalidArgument, "unsupported protocol " + req.version);
  }

  auto qmark = req.target.find('?');
  req.path = url_decode(req.target.substr(0, qmark));
  if (qmark != std::string::npos) {
    req.query = parse_query(req.target.substr(qmark + 1));
  }

  req.headers = parse_header_lines(head.substr(line_end + 2));
  return Result<HttpRequest>::success(std::move(req));
}

// ============================================================
// HttpReply
// ============================================================

HttpReply HttpReply::json_body(int status, const json& body) {
  HttpReply reply;
  reply.status = status;
  reply.headers["Content-Type"] = "application/json";
  reply.body = body.dump();
  return reply;
}

HttpReply HttpReply::text(int status, std::string body) {
  HttpReply reply;
  reply.status = status;
  reply.headers["Content-Type"] = "text/plain; charset=utf-8";
  reply.body = std::move(body);
  return reply;
}

HttpReply HttpReply::redirect(const std::string& location) {
  HttpReply reply;
  reply.status = 302;
  reply.headers["Location"] = location;
  return reply;
}

HttpReply HttpReply::no_content() {
  HttpReply reply;
  reply.status = 204;
  return reply;
}

HttpReply HttpReply::error(const Status& status) {
  return json_body(http_status_for(status.code), json{{"error", to_string(status.code)}, {"message", status.message}});
}

std::string HttpReply::serialize() const {
  std::ostringstream out;
  out << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n";
  for (const auto& [key, value] : headers) {
    out << key << ": " << value << "\r\n";
  }
  out << "Content-Length: " << body.size() << "\r\n";
  out << "Connection: close\r\n\r\n";
  out << body;
  return out.str();
}

// ============================================================
// Helpers
// ============================================================

std::optional<int> parse_status_line(const std::string& line) {
  std::istringstream in(line);
  std::string version;
  int status = 0;
  if (!(in >> version >> status)) return std::nullopt;
  if (version.compare(0, 5, "HTTP/") != 0) return std::nullopt;
  return status;
}

std::map<std::string, std::string> parse_header_lines(const std::string& head) {
  std::map<std::string, std::string> headers;
  std::istringstream in(head);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) break;
    auto colon = line.find(':');
    if (colon == std::string::npos) continue;
    headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }
  return headers;
}

const char* status_text(int status) {
  switch (status) {
    case 101:
      return "Switching Protocols";
    case 200:
      return "OK";
    case 201:
      return "Created";
    case 202:
      return "Accepted";
    case 204:
      return "No Content";
    case 302:
      return "Found";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 409:
      return "Conflict";
    case 413:
      return "Payload Too Large";
    case 431:
      return "Request Header Fields Too Large";
    case 500:
      return "Internal Server Error";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    case 504:
      return "Gateway Timeout";
    default:
      return "Unknown";
  }
}

std::string url_encode(const std::string& value) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += kHex[c >> 4];
      out += kHex[c & 0x0F];
    }
  }
  return out;
}

std::string url_decode(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '%' && i + 2 < value.size()) {
      int hi = hex_value(value[i + 1]);
      int lo = hex_value(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
        continue;
      }
    }
    out += (c == '+') ? ' ' : c;
  }
  return out;
}

std::map<std::string, std::string> parse_query(const std::string& query) {
  std::map<std::string, std::string> params;
  std::stringstream ss(query);
  std::string pair;
  while (std::getline(ss, pair, '&')) {
    if (pair.empty()) continue;
    auto eq = pair.find('=');
    if (eq == std::string::npos) {
      params[url_decode(pair)] = "";
    } else {
      params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
    }
  }
  return params;
}

std::string form_encode(const std::map<std::string, std::string>& fields) {
  std::string out;
  for (const auto& [key, value] : fields) {
    if (!out.empty()) out += '&';
    out += url_encode(key) + "=" + url_encode(value);
  }
  return out;
}

std::optional<std::string> decode_chunked(const std::string& body) {
  std::string out;
  size_t pos = 0;
  while (pos < body.size()) {
    auto line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos) return std::nullopt;

    std::string size_line = body.substr(pos, line_end - pos);
    auto semi = size_line.find(';');
    if (semi != std::string::npos) size_line.resize(semi);

    size_t size = 0;
    try {
      size = std::stoul(trim(size_line), nullptr, 16);
    } catch (const std::exception&) {
      return std::nullopt;
    }

    pos = line_end + 2;
    if (size == 0) return out;
    if (pos + size > body.size()) return std::nullopt;

    out.append(body, pos, size);
    pos += size + 2;  // chunk data + CRLF
  }
  return std::nullopt;
}

}  // namespace kuberde::net
