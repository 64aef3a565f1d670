#include "principal.hpp"

#include <utility>

namespace auth {

namespace {

Resolution fail(ResolutionError e, std::string detail = {}) {
  Resolution r;
  r.error = e;
  r.detail = std::move(detail);
  return r;
}

std::string role_name_from_arn(std::string_view role_arn) {
  size_t slash = role_arn.rfind('/');
  if (slash == std::string_view::npos) return std::string(role_arn);
  return std::string(role_arn.substr(slash + 1));
}

// Appends the inline policies (fetched one by one) and attached managed
// policies of one principal or group.
template <typename ListInline, typename GetInline, typename ListAttached>
bool collect(std::vector<iam::PolicySource>* out,
             ListInline&& list_inline,
             GetInline&& get_inline,
             ListAttached&& list_attached,
             std::string* err) {
  std::string e;
  auto names = list_inline(&e);
  if (!e.empty()) {
    if (err) *err = std::move(e);
    return false;
  }
  for (const auto& name : names) {
    auto doc = get_inline(name, &e);
    if (!e.empty()) {
      if (err) *err = std::move(e);
      return false;
    }
    out->emplace_back(std::move(doc));
  }

  auto attached = list_attached(&e);
  if (!e.empty()) {
    if (err) *err = std::move(e);
    return false;
  }
  for (auto& p : attached) out->emplace_back(std::move(p));
  return true;
}

} // namespace

std::ostream& operator<<(std::ostream& os, ResolutionError e) {
  switch (e) {
    case ResolutionError::InvalidId:      return os << "InvalidId";
    case ResolutionError::InvalidToken:   return os << "InvalidToken";
    case ResolutionError::DirectoryError: return os << "DirectoryError";
    default:                              return os << "Unknown";
  }
}

// ---- IamUser ----

IamUser::IamUser(const directory::IdentityDirectory& dir,
                 std::string account_id,
                 directory::User user,
                 directory::AccessKey key)
    : dir_(dir), account_id_(std::move(account_id)), user_(std::move(user)), key_(std::move(key)) {}

std::string IamUser::arn() const {
  return "arn:aws:iam::" + account_id_ + ":user/" + user_.name;
}

Credentials IamUser::credentials() const {
  return Credentials{key_.id, key_.secret, {}};
}

std::optional<std::vector<iam::PolicySource>> IamUser::attached_policies(std::string* err) const {
  std::vector<iam::PolicySource> out;
  const std::string& user = user_.name;

  bool ok = collect(&out,
    [&](std::string* e) { return dir_.list_user_policies(user, e); },
    [&](const std::string& name, std::string* e) { return dir_.get_user_policy(user, name, e); },
    [&](std::string* e) { return dir_.list_attached_user_policies(user, e); },
    err);
  if (!ok) return std::nullopt;

  std::string e;
  auto groups = dir_.groups_for_user(user, &e);
  if (!e.empty()) {
    if (err) *err = std::move(e);
    return std::nullopt;
  }
  for (const auto& group : groups) {
    ok = collect(&out,
      [&](std::string* ge) { return dir_.list_group_policies(group.name, ge); },
      [&](const std::string& name, std::string* ge) { return dir_.get_group_policy(group.name, name, ge); },
      [&](std::string* ge) { return dir_.list_attached_group_policies(group.name, ge); },
      err);
    if (!ok) return std::nullopt;
  }
  return out;
}

// ---- AssumedRole ----

AssumedRole::AssumedRole(const directory::IdentityDirectory& dir,
                         std::string account_id,
                         directory::AssumedRoleSession session)
    : dir_(dir),
      account_id_(std::move(account_id)),
      session_(std::move(session)),
      role_name_(role_name_from_arn(session_.role_arn)) {}

std::string AssumedRole::arn() const {
  return "arn:aws:sts::" + account_id_ + ":assumed-role/" + role_name_ + "/" + session_.session_name;
}

Credentials AssumedRole::credentials() const {
  return Credentials{session_.access_key_id, session_.secret, session_.session_token};
}

std::optional<std::vector<iam::PolicySource>> AssumedRole::attached_policies(std::string* err) const {
  std::vector<iam::PolicySource> out;
  bool ok = collect(&out,
    [&](std::string* e) { return dir_.list_role_policies(role_name_, e); },
    [&](const std::string& name, std::string* e) { return dir_.get_role_policy(role_name_, name, e); },
    [&](std::string* e) { return dir_.list_attached_role_policies(role_name_, e); },
    err);
  if (!ok) return std::nullopt;
  return out;
}

// ---- PrincipalResolver ----

PrincipalResolver::PrincipalResolver(const directory::IdentityDirectory& identities,
                                     const directory::SessionDirectory& sessions,
                                     std::string account_id)
    : identities_(identities), sessions_(sessions), account_id_(std::move(account_id)) {}

Resolution PrincipalResolver::resolve(std::string_view access_key_id, const Headers& headers) const {
  if (access_key_id.substr(0, kLongTermKeyPrefix.size()) == kLongTermKeyPrefix ||
      !header_present(headers, kSecurityTokenHeader)) {
    return resolve_user(access_key_id, headers);
  }
  return resolve_assumed_role(access_key_id, headers);
}

Resolution PrincipalResolver::resolve_user(std::string_view access_key_id, const Headers& headers) const {
  std::string err;
  auto users = identities_.list_users(&err);
  if (!err.empty()) return fail(ResolutionError::DirectoryError, err);

  for (auto& user : users) {
    for (const auto& key : user.access_keys) {
      if (key.id != access_key_id || key.status != "Active") continue;
      if (header_present(headers, kSecurityTokenHeader)) {
        return fail(ResolutionError::InvalidToken, "long-term access key used with a session token");
      }
      Resolution r;
      directory::AccessKey matched = key;
      r.principal = std::make_unique<IamUser>(identities_, account_id_, std::move(user), std::move(matched));
      return r;
    }
  }
  return fail(ResolutionError::InvalidId);
}

Resolution PrincipalResolver::resolve_assumed_role(std::string_view access_key_id, const Headers& headers) const {
  std::string err;
  auto sessions = sessions_.active_assumed_roles(&err);
  if (!err.empty()) return fail(ResolutionError::DirectoryError, err);

  for (auto& session : sessions) {
    if (session.access_key_id != access_key_id) continue;
    auto token = header_get(headers, kSecurityTokenHeader);
    if (!token || *token != session.session_token) {
      return fail(ResolutionError::InvalidToken, "session token does not match");
    }
    Resolution r;
    r.principal = std::make_unique<AssumedRole>(identities_, account_id_, std::move(session));
    return r;
  }
  return fail(ResolutionError::InvalidId);
}

} // namespace auth
