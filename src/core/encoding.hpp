#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace kuberde {

// Base64URL without padding (RFC 4648 §5), as used by JWS and PKCE
std::string base64url_encode(const std::string& data);

std::optional<std::string> base64url_decode(const std::string& data);

// Raw SHA-256 digest
std::array<uint8_t, 32> sha256(const std::string& data);

std::string sha256_hex(const std::string& data);

std::string hex_encode(const uint8_t* data, size_t len);

// Cryptographically random bytes, base64url encoded
std::string random_token(size_t num_bytes = 32);

}  // namespace kuberde
