#include "auth/authorizer.hpp"

#include "core/identity.hpp"

namespace kuberde::auth {

bool Authorizer::is_admin(const Claims& claims) const {
  for (const auto& role : admin_roles_) {
    if (claims.has_role(role)) return true;
  }
  return false;
}

Status Authorizer::require_admin(const Claims& claims) const {
  if (is_admin(claims)) return Status::success();
  return Status::failure(ErrorCode::Forbidden, claims.name() + " is not an administrator");
}

Status Authorizer::authorize(const Claims& claims, const std::string& identity) const {
  if (is_admin(claims)) return Status::success();

  auto owner = identity_owner(identity);
  if (!owner) {
    return Status::failure(ErrorCode::Forbidden, "malformed identity '" + identity + "'");
  }
  if (*owner == sanitize_name(claims.name()) || *owner == claims.name()) {
    return Status::success();
  }
  return Status::failure(ErrorCode::Forbidden, claims.name() + " does not own " + identity);
}

Status Authorizer::authorize_agent(const Claims& claims, const std::string& identity) const {
  if (!claims.agent_id.empty()) {
    if (claims.agent_id == identity) return Status::success();
    return Status::failure(ErrorCode::Forbidden, "credential is bound to " + claims.agent_id);
  }
  return authorize(claims, identity);
}

}  // namespace kuberde::auth
