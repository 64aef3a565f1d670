#include "policy.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace iam {

using json = nlohmann::json;

bool wildcard_match(std::string_view pattern, std::string_view value) {
  size_t p = 0;
  size_t v = 0;
  size_t star = std::string_view::npos;
  size_t resume = 0;

  while (v < value.size()) {
    if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      resume = v;
    } else if (p < pattern.size() && pattern[p] == value[v]) {
      ++p;
      ++v;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      v = ++resume;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

static bool any_pattern_matches(const ActionMatcher& m, std::string_view action) {
  for (const auto& pattern : m.patterns) {
    if (wildcard_match(pattern, action)) return true;
  }
  return false;
}

bool statement_concerns(const PolicyStatement& statement, std::string_view action) {
  const bool matched = any_pattern_matches(statement.actions, action);
  return statement.actions.kind == MatcherKind::NotAction ? !matched : matched;
}

PermissionResult evaluate(const PolicyStatement& statement, std::string_view action) {
  if (!statement_concerns(statement, action)) return PermissionResult::Neutral;
  return statement.effect == Effect::Allow ? PermissionResult::Permitted : PermissionResult::Denied;
}

PermissionResult evaluate(const PolicyDocument& document, std::string_view action) {
  bool permitted = false;
  for (const auto& statement : document.statements) {
    auto r = evaluate(statement, action);
    if (r == PermissionResult::Denied) return r;
    if (r == PermissionResult::Permitted) permitted = true;
  }
  return permitted ? PermissionResult::Permitted : PermissionResult::Neutral;
}

static bool read_patterns(const json& element, std::vector<std::string>* out) {
  if (element.is_string()) {
    out->push_back(element.get<std::string>());
    return true;
  }
  if (!element.is_array()) return false;
  for (const auto& item : element) {
    if (!item.is_string()) return false;
    out->push_back(item.get<std::string>());
  }
  return true;
}

static std::optional<PolicyStatement> parse_statement(const json& j, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "Statement entry is not an object";
    return std::nullopt;
  }

  PolicyStatement st;
  auto effect = j.find("Effect");
  if (effect == j.end() || !effect->is_string()) {
    if (err) *err = "Statement is missing Effect";
    return std::nullopt;
  }
  const auto effect_s = effect->get<std::string>();
  if (effect_s == "Allow") {
    st.effect = Effect::Allow;
  } else if (effect_s == "Deny") {
    st.effect = Effect::Deny;
  } else {
    if (err) *err = "Unknown Effect: " + effect_s;
    return std::nullopt;
  }

  // NotAction takes precedence when both are present.
  auto not_action = j.find("NotAction");
  auto action = j.find("Action");
  const json* element = nullptr;
  if (not_action != j.end()) {
    st.actions.kind = MatcherKind::NotAction;
    element = &*not_action;
  } else if (action != j.end()) {
    st.actions.kind = MatcherKind::Action;
    element = &*action;
  } else {
    if (err) *err = "Statement has neither Action nor NotAction";
    return std::nullopt;
  }
  if (!read_patterns(*element, &st.actions.patterns)) {
    if (err) *err = "Action must be a string or a list of strings";
    return std::nullopt;
  }
  return st;
}

std::optional<PolicyDocument> parse_policy_document(std::string_view json_text, std::string* err) {
  json j = json::parse(json_text.begin(), json_text.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "Policy document is not a JSON object";
    return std::nullopt;
  }

  auto statements = j.find("Statement");
  if (statements == j.end()) {
    if (err) *err = "Policy document has no Statement";
    return std::nullopt;
  }

  PolicyDocument doc;
  if (statements->is_object()) {
    auto st = parse_statement(*statements, err);
    if (!st) return std::nullopt;
    doc.statements.push_back(std::move(*st));
    return doc;
  }
  if (!statements->is_array()) {
    if (err) *err = "Statement must be an object or a list";
    return std::nullopt;
  }
  for (const auto& s : *statements) {
    auto st = parse_statement(s, err);
    if (!st) return std::nullopt;
    doc.statements.push_back(std::move(*st));
  }
  return doc;
}

namespace {

struct Normalizer {
  std::string* err;

  std::optional<PolicyDocument> operator()(const directory::ManagedPolicy& p) const {
    for (const auto& v : p.versions) {
      if (v.is_default) return parse_policy_document(v.document, err);
    }
    if (err) *err = "Managed policy " + p.arn + " has no default version";
    return std::nullopt;
  }

  std::optional<PolicyDocument> operator()(const directory::InlinePolicy& p) const {
    return parse_policy_document(p.document, err);
  }

  std::optional<PolicyDocument> operator()(const std::string& text) const {
    return parse_policy_document(text, err);
  }
};

} // namespace

std::optional<PolicyDocument> normalize(const PolicySource& source, std::string* err) {
  return std::visit(Normalizer{err}, source);
}

std::ostream& operator<<(std::ostream& os, PermissionResult r) {
  switch (r) {
    case PermissionResult::Permitted: return os << "Permitted";
    case PermissionResult::Denied:    return os << "Denied";
    case PermissionResult::Neutral:   return os << "Neutral";
    default:                          return os << "Unknown";
  }
}

} // namespace iam
