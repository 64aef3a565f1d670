#pragma once

#include "directory.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace iam {

enum class PermissionResult { Permitted, Denied, Neutral };

enum class Effect { Allow, Deny };

enum class MatcherKind { Action, NotAction };

struct ActionMatcher {
  MatcherKind kind = MatcherKind::Action;
  std::vector<std::string> patterns;
};

// Resource, NotResource and Condition are not evaluated: a statement
// applies to every resource under every condition.
struct PolicyStatement {
  Effect effect = Effect::Deny;
  ActionMatcher actions;
};

struct PolicyDocument {
  std::vector<PolicyStatement> statements;
};

// The shapes a policy arrives in from the directory: a managed policy with
// versions, an inline policy record, or bare JSON text.
using PolicySource = std::variant<directory::ManagedPolicy, directory::InlinePolicy, std::string>;

// Full-string, case-sensitive match where '*' matches any run of characters,
// including none. No other character is special.
bool wildcard_match(std::string_view pattern, std::string_view value);

bool statement_concerns(const PolicyStatement& statement, std::string_view action);

PermissionResult evaluate(const PolicyStatement& statement, std::string_view action);

// Statements are visited in document order; the first Denied ends evaluation.
PermissionResult evaluate(const PolicyDocument& document, std::string_view action);

std::optional<PolicyDocument> parse_policy_document(std::string_view json_text, std::string* err);

// Picks the default version of a managed policy, then parses.
std::optional<PolicyDocument> normalize(const PolicySource& source, std::string* err);

std::ostream& operator<<(std::ostream& os, PermissionResult r);

} // namespace iam
