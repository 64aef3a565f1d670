#pragma once

#include "policy.hpp"
#include "principal.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace iam {

enum class Decision { Permitted, Denied };

struct AuthorizationResult {
  Decision decision = Decision::Denied;
  // Set when the policies could not be collected or parsed; decision is
  // Denied in that case.
  std::string error;

  bool permitted() const { return decision == Decision::Permitted; }
};

// Explicit deny in any document wins; otherwise at least one Permitted is
// required. Neutral everywhere (or no policies at all) is a deny.
AuthorizationResult aggregate(const std::vector<PolicySource>& policies, std::string_view action);

AuthorizationResult authorize(const auth::Principal& principal, std::string_view action);

} // namespace iam
