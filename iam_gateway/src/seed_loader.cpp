#include "seed_loader.hpp"
#include "directory_json.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace directory {

using json = nlohmann::json;

namespace {

std::vector<InlinePolicy> inline_policies(const json& entry) {
  std::vector<InlinePolicy> out;
  if (!entry.contains("policies")) return out;
  for (const auto& p : entry.at("policies")) {
    out.push_back(InlinePolicy{p.at("name").get<std::string>(), document_text(p.at("document"))});
  }
  return out;
}

std::vector<std::string> string_list(const json& entry, const char* key) {
  if (!entry.contains(key)) return {};
  return entry.at(key).get<std::vector<std::string>>();
}

const json& section(const json& root, const char* key) {
  static const json empty = json::array();
  auto it = root.find(key);
  if (it == root.end()) return empty;
  return *it;
}

bool apply(Directory& dir, const json& root, std::string* err) {
  for (const auto& p : section(root, "policies")) {
    if (!dir.put_managed_policy(p.get<ManagedPolicy>(), err)) return false;
  }

  for (const auto& g : section(root, "groups")) {
    auto group = g.get<Group>();
    if (!dir.put_group(group, err)) return false;
    for (const auto& policy : inline_policies(g)) {
      if (!dir.put_group_policy(group.name, policy, err)) return false;
    }
    for (const auto& arn : string_list(g, "attached")) {
      if (!dir.attach_group_policy(group.name, arn, err)) return false;
    }
  }

  for (const auto& r : section(root, "roles")) {
    auto role = r.get<Role>();
    if (!dir.put_role(role, err)) return false;
    for (const auto& policy : inline_policies(r)) {
      if (!dir.put_role_policy(role.name, policy, err)) return false;
    }
    for (const auto& arn : string_list(r, "attached")) {
      if (!dir.attach_role_policy(role.name, arn, err)) return false;
    }
  }

  for (const auto& u : section(root, "users")) {
    auto user = u.get<User>();
    if (!dir.put_user(user, err)) return false;
    for (const auto& policy : inline_policies(u)) {
      if (!dir.put_user_policy(user.name, policy, err)) return false;
    }
    for (const auto& arn : string_list(u, "attached")) {
      if (!dir.attach_user_policy(user.name, arn, err)) return false;
    }
    for (const auto& group : string_list(u, "groups")) {
      if (!dir.add_user_to_group(group, user.name, err)) return false;
    }
  }

  for (const auto& s : section(root, "sessions")) {
    if (!dir.put_assumed_role_session(s.get<AssumedRoleSession>(), err)) return false;
  }
  return true;
}

} // namespace

bool load_seed(Directory& dir, std::string_view json_text, std::string* err) {
  json root = json::parse(json_text.begin(), json_text.end(), nullptr, false);
  if (root.is_discarded() || !root.is_object()) {
    if (err) *err = "Seed is not a JSON object";
    return false;
  }
  try {
    return apply(dir, root, err);
  } catch (const json::exception& e) {
    if (err) *err = std::string("Invalid seed: ") + e.what();
    return false;
  }
}

bool load_seed_file(Directory& dir, const std::string& path, std::string* err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (err) *err = "Cannot open seed file " + path;
    return false;
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  return load_seed(dir, oss.str(), err);
}

} // namespace directory
