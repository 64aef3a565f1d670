#include "authorizer.hpp"

#include <utility>

namespace iam {

static AuthorizationResult denied(std::string error = {}) {
  AuthorizationResult r;
  r.decision = Decision::Denied;
  r.error = std::move(error);
  return r;
}

AuthorizationResult aggregate(const std::vector<PolicySource>& policies, std::string_view action) {
  bool permitted = false;
  for (const auto& source : policies) {
    std::string err;
    auto document = normalize(source, &err);
    if (!document) return denied(err);

    auto r = evaluate(*document, action);
    if (r == PermissionResult::Denied) return denied();
    if (r == PermissionResult::Permitted) permitted = true;
  }
  if (!permitted) return denied();

  AuthorizationResult r;
  r.decision = Decision::Permitted;
  return r;
}

AuthorizationResult authorize(const auth::Principal& principal, std::string_view action) {
  std::string err;
  auto policies = principal.attached_policies(&err);
  if (!policies) return denied(err.empty() ? "policy lookup failed" : err);
  return aggregate(*policies, action);
}

} // namespace iam
