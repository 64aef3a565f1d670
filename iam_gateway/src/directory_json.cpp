#include "directory_json.hpp"

namespace directory {

using json = nlohmann::json;

void to_json(json& j, const AccessKey& k) {
  j = json{{"id", k.id}, {"secret", k.secret}, {"status", k.status}};
}

void from_json(const json& j, AccessKey& k) {
  j.at("id").get_to(k.id);
  j.at("secret").get_to(k.secret);
  k.status = j.value("status", std::string("Active"));
}

void to_json(json& j, const User& u) {
  j = json{{"name", u.name}, {"path", u.path}, {"access_keys", u.access_keys}};
}

void from_json(const json& j, User& u) {
  j.at("name").get_to(u.name);
  u.path = j.value("path", std::string("/"));
  u.access_keys.clear();
  if (j.contains("access_keys")) j.at("access_keys").get_to(u.access_keys);
}

void to_json(json& j, const Group& g) {
  j = json{{"name", g.name}, {"path", g.path}};
}

void from_json(const json& j, Group& g) {
  j.at("name").get_to(g.name);
  g.path = j.value("path", std::string("/"));
}

void to_json(json& j, const Role& r) {
  j = json{{"name", r.name}, {"path", r.path}};
}

void from_json(const json& j, Role& r) {
  j.at("name").get_to(r.name);
  r.path = j.value("path", std::string("/"));
}

void to_json(json& j, const PolicyVersion& v) {
  j = json{{"version_id", v.version_id}, {"document", v.document}, {"is_default", v.is_default}};
}

void from_json(const json& j, PolicyVersion& v) {
  j.at("version_id").get_to(v.version_id);
  v.document = document_text(j.at("document"));
  v.is_default = j.value("is_default", false);
}

void to_json(json& j, const ManagedPolicy& p) {
  j = json{{"arn", p.arn}, {"name", p.name}, {"versions", p.versions}};
}

void from_json(const json& j, ManagedPolicy& p) {
  j.at("arn").get_to(p.arn);
  p.name = j.value("name", std::string());
  j.at("versions").get_to(p.versions);
}

void to_json(json& j, const AssumedRoleSession& s) {
  j = json{{"access_key_id", s.access_key_id},
           {"secret", s.secret},
           {"session_token", s.session_token},
           {"role_arn", s.role_arn},
           {"session_name", s.session_name}};
}

void from_json(const json& j, AssumedRoleSession& s) {
  j.at("access_key_id").get_to(s.access_key_id);
  j.at("secret").get_to(s.secret);
  j.at("session_token").get_to(s.session_token);
  j.at("role_arn").get_to(s.role_arn);
  j.at("session_name").get_to(s.session_name);
}

std::string document_text(const json& j) {
  if (j.is_string()) return j.get<std::string>();
  return j.dump();
}

} // namespace directory
