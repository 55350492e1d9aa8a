#include "core/identity.hpp"

#include <cctype>

#include "core/encoding.hpp"

namespace kuberde {

namespace {
const std::string kIdentityPrefix = "user-";
}

std::string make_identity(const std::string& owner, const std::string& workload) {
  return kIdentityPrefix + owner + "-" + workload;
}

std::string make_service_identity(const std::string& workload_identity, const std::string& service) {
  return workload_identity + "-" + service;
}

std::optional<std::string> identity_owner(const std::string& identity) {
  if (identity.compare(0, kIdentityPrefix.size(), kIdentityPrefix) != 0) {
    return std::nullopt;
  }
  auto rest = identity.substr(kIdentityPrefix.size());
  auto dash = rest.find('-');
  if (dash == std::string::npos || dash == 0 || dash + 1 >= rest.size()) {
    return std::nullopt;
  }
  return rest.substr(0, dash);
}

std::string strip_service_suffix(const std::string& identity, const std::string& service) {
  if (service.empty()) return identity;
  std::string suffix = "-" + service;
  if (identity.size() > suffix.size() && identity.compare(identity.size() - suffix.size(), suffix.size(), suffix) == 0) {
    return identity.substr(0, identity.size() - suffix.size());
  }
  return identity;
}

bool is_valid_identity(const std::string& identity) {
  if (!identity_owner(identity)) return false;
  for (char c : identity) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    if (!ok) return false;
  }
  return identity.back() != '-';
}

std::string sanitize_name(const std::string& name, size_t max_len) {
  if (max_len == 0) max_len = 50;

  std::string out;
  out.reserve(name.size());
  for (char raw : name) {
    char c = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
    bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    if (ok) {
      out += c;
    } else if (!out.empty() && out.back() != '-') {
      out += '-';
    }
  }

  while (!out.empty() && out.back() == '-') {
    out.pop_back();
  }
  if (out.size() > max_len) {
    out.resize(max_len);
    while (!out.empty() && out.back() == '-') {
      out.pop_back();
    }
  }
  if (out.empty()) {
    out = "default";
  }
  return out;
}

std::string short_hash(const std::string& input) {
  auto digest = sha256(input);
  return hex_encode(digest.data(), 4);
}

uint16_t hash_to_port(const std::string& input, uint16_t min, uint16_t max) {
  if (max <= min) return min;
  auto digest = sha256(input);
  uint32_t value = (uint32_t(digest[0]) << 24) | (uint32_t(digest[1]) << 16) | (uint32_t(digest[2]) << 8) | uint32_t(digest[3]);
  uint32_t range = uint32_t(max) - uint32_t(min) + 1;
  return static_cast<uint16_t>(min + value % range);
}

}  // namespace kuberde
