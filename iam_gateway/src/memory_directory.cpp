#include "memory_directory.hpp"

#include <utility>

namespace directory {

namespace {

std::string no_such_entity(std::string_view kind, std::string_view name) {
  std::string msg = "NoSuchEntity: ";
  msg.append(kind.data(), kind.size());
  msg += " ";
  msg.append(name.data(), name.size());
  msg += " cannot be found";
  return msg;
}

template <typename Map>
std::vector<std::string> keys_of(const Map& m) {
  std::vector<std::string> out;
  out.reserve(m.size());
  for (const auto& kv : m) out.push_back(kv.first);
  return out;
}

} // namespace

MemoryDirectory::MemoryDirectory() : state_(std::make_shared<const State>()) {}

MemoryDirectory::MemoryDirectory(Pinned, std::shared_ptr<const State> state) : state_(std::move(state)) {}

std::shared_ptr<const MemoryDirectory::State> MemoryDirectory::current() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

template <typename Fn>
bool MemoryDirectory::mutate(Fn&& fn, std::string* err) {
  std::lock_guard<std::mutex> lk(mu_);
  auto next = std::make_shared<State>(*state_);
  if (!fn(*next, err)) return false;
  state_ = std::move(next);
  return true;
}

std::unique_ptr<DirectoryView> MemoryDirectory::snapshot() const {
  return std::make_unique<MemoryDirectory>(Pinned{}, current());
}

std::vector<ManagedPolicy> MemoryDirectory::resolve_attached(const State& st,
                                                             const std::set<std::string, std::less<>>& arns,
                                                             std::string* err) {
  std::vector<ManagedPolicy> out;
  for (const auto& arn : arns) {
    auto it = st.managed.find(arn);
    if (it == st.managed.end()) {
      if (err) *err = no_such_entity("Policy", arn);
      return {};
    }
    out.push_back(it->second);
  }
  return out;
}

// ---- users ----

std::vector<User> MemoryDirectory::list_users(std::string*) const {
  auto st = current();
  std::vector<User> out;
  out.reserve(st->users.size());
  for (const auto& kv : st->users) out.push_back(kv.second);
  return out;
}

std::vector<std::string> MemoryDirectory::list_user_policies(std::string_view user, std::string* err) const {
  auto st = current();
  if (st->users.find(user) == st->users.end()) {
    if (err) *err = no_such_entity("User", user);
    return {};
  }
  auto it = st->user_policies.find(user);
  if (it == st->user_policies.end()) return {};
  return keys_of(it->second.inline_policies);
}

std::string MemoryDirectory::get_user_policy(std::string_view user, std::string_view name, std::string* err) const {
  auto st = current();
  auto it = st->user_policies.find(user);
  if (it != st->user_policies.end()) {
    auto pit = it->second.inline_policies.find(name);
    if (pit != it->second.inline_policies.end()) return pit->second;
  }
  if (err) *err = no_such_entity("UserPolicy", name);
  return {};
}

std::vector<ManagedPolicy> MemoryDirectory::list_attached_user_policies(std::string_view user, std::string* err) const {
  auto st = current();
  if (st->users.find(user) == st->users.end()) {
    if (err) *err = no_such_entity("User", user);
    return {};
  }
  auto it = st->user_policies.find(user);
  if (it == st->user_policies.end()) return {};
  return resolve_attached(*st, it->second.attached, err);
}

// ---- groups ----

std::vector<Group> MemoryDirectory::groups_for_user(std::string_view user, std::string* err) const {
  auto st = current();
  if (st->users.find(user) == st->users.end()) {
    if (err) *err = no_such_entity("User", user);
    return {};
  }
  std::vector<Group> out;
  for (const auto& kv : st->group_members) {
    if (kv.second.count(user) == 0) continue;
    auto git = st->groups.find(kv.first);
    if (git != st->groups.end()) out.push_back(git->second);
  }
  return out;
}

std::vector<std::string> MemoryDirectory::list_group_policies(std::string_view group, std::string* err) const {
  auto st = current();
  if (st->groups.find(group) == st->groups.end()) {
    if (err) *err = no_such_entity("Group", group);
    return {};
  }
  auto it = st->group_policies.find(group);
  if (it == st->group_policies.end()) return {};
  return keys_of(it->second.inline_policies);
}

std::string MemoryDirectory::get_group_policy(std::string_view group, std::string_view name, std::string* err) const {
  auto st = current();
  auto it = st->group_policies.find(group);
  if (it != st->group_policies.end()) {
    auto pit = it->second.inline_policies.find(name);
    if (pit != it->second.inline_policies.end()) return pit->second;
  }
  if (err) *err = no_such_entity("GroupPolicy", name);
  return {};
}

std::vector<ManagedPolicy> MemoryDirectory::list_attached_group_policies(std::string_view group, std::string* err) const {
  auto st = current();
  if (st->groups.find(group) == st->groups.end()) {
    if (err) *err = no_such_entity("Group", group);
    return {};
  }
  auto it = st->group_policies.find(group);
  if (it == st->group_policies.end()) return {};
  return resolve_attached(*st, it->second.attached, err);
}

// ---- roles ----

std::vector<std::string> MemoryDirectory::list_role_policies(std::string_view role, std::string* err) const {
  auto st = current();
  if (st->roles.find(role) == st->roles.end()) {
    if (err) *err = no_such_entity("Role", role);
    return {};
  }
  auto it = st->role_policies.find(role);
  if (it == st->role_policies.end()) return {};
  return keys_of(it->second.inline_policies);
}

InlinePolicy MemoryDirectory::get_role_policy(std::string_view role, std::string_view name, std::string* err) const {
  auto st = current();
  auto it = st->role_policies.find(role);
  if (it != st->role_policies.end()) {
    auto pit = it->second.inline_policies.find(name);
    if (pit != it->second.inline_policies.end()) return InlinePolicy{pit->first, pit->second};
  }
  if (err) *err = no_such_entity("RolePolicy", name);
  return {};
}

std::vector<ManagedPolicy> MemoryDirectory::list_attached_role_policies(std::string_view role, std::string* err) const {
  auto st = current();
  if (st->roles.find(role) == st->roles.end()) {
    if (err) *err = no_such_entity("Role", role);
    return {};
  }
  auto it = st->role_policies.find(role);
  if (it == st->role_policies.end()) return {};
  return resolve_attached(*st, it->second.attached, err);
}

std::vector<AssumedRoleSession> MemoryDirectory::active_assumed_roles(std::string*) const {
  auto st = current();
  std::vector<AssumedRoleSession> out;
  out.reserve(st->sessions.size());
  for (const auto& kv : st->sessions) out.push_back(kv.second);
  return out;
}

// ---- writes ----

bool MemoryDirectory::put_user(const User& user, std::string* err) {
  return mutate([&](State& st, std::string*) {
    st.users[user.name] = user;
    return true;
  }, err);
}

bool MemoryDirectory::add_access_key(std::string_view user, const AccessKey& key, std::string* err) {
  return mutate([&](State& st, std::string* e) {
    auto it = st.users.find(user);
    if (it == st.users.end()) {
      if (e) *e = no_such_entity("User", user);
      return false;
    }
    it->second.access_keys.push_back(key);
    return true;
  }, err);
}

bool MemoryDirectory::put_user_policy(std::string_view user, const InlinePolicy& policy, std::string* err) {
  return mutate([&](State& st, std::string* e) {
    if (st.users.find(user) == st.users.end()) {
      if (e) *e = no_such_entity("User", user);
      return false;
    }
    st.user_policies[std::string(user)].inline_policies[policy.name] = policy.document;
    return true;
  }, err);
}

bool MemoryDirectory::attach_user_policy(std::string_view user, std::string_view policy_arn, std::string* err) {
  return mutate([&](State& st, std::string* e) {
    if (st.users.find(user) == st.users.end()) {
      if (e) *e = no_such_entity("User", user);
      return false;
    }
    if (st.managed.find(policy_arn) == st.managed.end()) {
      if (e) *e = no_such_entity("Policy", policy_arn);
      return false;
    }
    st.user_policies[std::string(user)].attached.emplace(policy_arn);
    return true;
  }, err);
}

bool MemoryDirectory::put_group(const Group& group, std::string* err) {
  return mutate([&](State& st, std::string*) {
    st.groups[group.name] = group;
    return true;
  }, err);
}

bool MemoryDirectory::add_user_to_group(std::string_view group, std::string_view user, std::string* err) {
  return mutate([&](State& st, std::string* e) {
    if (st.groups.find(group) == st.groups.end()) {
      if (e) *e = no_such_entity("Group", group);
      return false;
    }
    if (st.users.find(user) == st.users.end()) {
      if (e) *e = no_such_entity("User", user);
      return false;
    }
    st.group_members[std::string(group)].emplace(user);
    return true;
  }, err);
}

bool MemoryDirectory::put_group_policy(std::string_view group, const InlinePolicy& policy, std::string* err) {
  return mutate([&](State& st, std::string* e) {
    if (st.groups.find(group) == st.groups.end()) {
      if (e) *e = no_such_entity("Group", group);
      return false;
    }
    st.group_policies[std::string(group)].inline_policies[policy.name] = policy.document;
    return true;
  }, err);
}

bool MemoryDirectory::attach_group_policy(std::string_view group, std::string_view policy_arn, std::string* err) {
  return mutate([&](State& st, std::string* e) {
    if (st.groups.find(group) == st.groups.end()) {
      if (e) *e = no_such_entity("Group", group);
      return false;
    }
    if (st.managed.find(policy_arn) == st.managed.end()) {
      if (e) *e = no_such_entity("Policy", policy_arn);
      return false;
    }
    st.group_policies[std::string(group)].attached.emplace(policy_arn);
    return true;
  }, err);
}

bool MemoryDirectory::put_role(const Role& role, std::string* err) {
  return mutate([&](State& st, std::string*) {
    st.roles[role.name] = role;
    return true;
  }, err);
}

bool MemoryDirectory::put_role_policy(std::string_view role, const InlinePolicy& policy, std::string* err) {
  return mutate([&](State& st, std::string* e) {
    if (st.roles.find(role) == st.roles.end()) {
      if (e) *e = no_such_entity("Role", role);
      return false;
    }
    st.role_policies[std::string(role)].inline_policies[policy.name] = policy.document;
    return true;
  }, err);
}

bool MemoryDirectory::attach_role_policy(std::string_view role, std::string_view policy_arn, std::string* err) {
  return mutate([&](State& st, std::string* e) {
    if (st.roles.find(role) == st.roles.end()) {
      if (e) *e = no_such_entity("Role", role);
      return false;
    }
    if (st.managed.find(policy_arn) == st.managed.end()) {
      if (e) *e = no_such_entity("Policy", policy_arn);
      return false;
    }
    st.role_policies[std::string(role)].attached.emplace(policy_arn);
    return true;
  }, err);
}

bool MemoryDirectory::put_managed_policy(const ManagedPolicy& policy, std::string* err) {
  return mutate([&](State& st, std::string*) {
    st.managed[policy.arn] = policy;
    return true;
  }, err);
}

bool MemoryDirectory::put_assumed_role_session(const AssumedRoleSession& session, std::string* err) {
  return mutate([&](State& st, std::string*) {
    st.sessions[session.access_key_id] = session;
    return true;
  }, err);
}

} // namespace directory
