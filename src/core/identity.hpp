#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace kuberde {

// AgentIdentity helpers. Format: user-{owner}-{workloadName}[-{serviceName}]

std::string make_identity(const std::string& owner, const std::string& workload);

std::string make_service_identity(const std::string& workload_identity, const std::string& service);

// Owner embedded in an identity ("user-alice-ws" -> "alice"); nullopt when the identity is malformed
std::optional<std::string> identity_owner(const std::string& identity);

// Drops a trailing "-{service}" from a per-service identity; returns the input unchanged otherwise
std::string strip_service_suffix(const std::string& identity, const std::string& service);

bool is_valid_identity(const std::string& identity);

// Lowercase DNS-safe name: invalid runs become '-', trimmed, at most max_len characters
std::string sanitize_name(const std::string& name, size_t max_len = 50);

// First 4 bytes of SHA-256 as 8 hex characters
std::string short_hash(const std::string& input);

// Deterministic value in [min, max] derived from SHA-256 of the input
uint16_t hash_to_port(const std::string& input, uint16_t min, uint16_t max);

}  // namespace kuberde
