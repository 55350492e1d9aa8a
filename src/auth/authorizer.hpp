#pragma once

#include <string>
#include <vector>

#include "auth/jwt.hpp"
#include "core/types.hpp"

namespace kuberde::auth {

// Ownership rules shared by the management API, user connect and browser access
class Authorizer {
 public:
  explicit Authorizer(std::vector<std::string> admin_roles = {"admin", "system"}) : admin_roles_(std::move(admin_roles)) {}

  bool is_admin(const Claims& claims) const;

  Status require_admin(const Claims& claims) const;

  // Administrative role, or the identity's embedded owner equals the subject's username
  Status authorize(const Claims& claims, const std::string& identity) const;

  // Session admission: a credential bound to an agent_id may only claim that identity
  Status authorize_agent(const Claims& claims, const std::string& identity) const;

 private:
  std::vector<std::string> admin_roles_;
};

}  // namespace kuberde::auth
