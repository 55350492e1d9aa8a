#include "core/encoding.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <stdexcept>
#include <vector>

namespace kuberde {

namespace {

const char kBase64UrlTable[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

int base64url_value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '-' || c == '+') return 62;
  if (c == '_' || c == '/') return 63;
  return -1;
}

}  // namespace

std::string base64url_encode(const std::string& data) {
  std::string out;
  out.reserve((data.size() + 2) / 3 * 4);

  const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    uint32_t triple = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
    out += kBase64UrlTable[(triple >> 18) & 0x3F];
    out += kBase64UrlTable[(triple >> 12) & 0x3F];
    out += kBase64UrlTable[(triple >> 6) & 0x3F];
    out += kBase64UrlTable[triple & 0x3F];
  }

  // 剩余 1 或 2 个字节，不补 '='
  if (i < data.size()) {
    uint32_t triple = bytes[i] << 16;
    if (i + 1 < data.size()) {
      triple |= bytes[i + 1] << 8;
    }
    out += kBase64UrlTable[(triple >> 18) & 0x3F];
    out += kBase64UrlTable[(triple >> 12) & 0x3F];
    if (i + 1 < data.size()) {
      out += kBase64UrlTable[(triple >> 6) & 0x3F];
    }
  }
  return out;
}

std::optional<std::string> base64url_decode(const std::string& data) {
  std::string input = data;
  while (!input.empty() && input.back() == '=') {
    input.pop_back();
  }
  if (input.size() % 4 == 1) return std::nullopt;

  std::string out;
  out.reserve(input.size() * 3 / 4);

  uint32_t buffer = 0;
  int bits = 0;
  for (char c : input) {
    int v = base64url_value(c);
    if (v < 0) return std::nullopt;
    buffer = (buffer << 6) | static_cast<uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out += static_cast<char>((buffer >> bits) & 0xFF);
    }
  }
  return out;
}

std::array<uint8_t, 32> sha256(const std::string& data) {
  std::array<uint8_t, 32> digest{};
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest.data());
  return digest;
}

std::string sha256_hex(const std::string& data) {
  auto digest = sha256(data);
  return hex_encode(digest.data(), digest.size());
}

std::string hex_encode(const uint8_t* data, size_t len) {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out += kHex[data[i] >> 4];
    out += kHex[data[i] & 0x0F];
  }
  return out;
}

std::string random_token(size_t num_bytes) {
  std::vector<unsigned char> buf(num_bytes);
  if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return base64url_encode(std::string(buf.begin(), buf.end()));
}

}  // namespace kuberde
