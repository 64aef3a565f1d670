#include "rocks_directory.hpp"
#include "directory_json.hpp"
#include "metrics.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace directory {

namespace {

using Clock = std::chrono::steady_clock;

void observe_rocksdb(server::Metrics* metrics,
                     std::string_view op,
                     const rocksdb::Status& st,
                     std::size_t bytes,
                     Clock::time_point start) {
  if (!metrics) return;
  auto end = Clock::now();
  double ms = std::chrono::duration<double, std::milli>(end - start).count();
  bool ok = st.ok() || st.IsNotFound();
  metrics->ObserveRocksdb(op, ok, bytes, ms);
}

bool contains_nul(std::string_view s) {
  return s.find('\0') != std::string_view::npos;
}

std::string record_key(std::string_view tag, std::string_view name) {
  std::string k(tag);
  k.push_back('\0');
  k.append(name.data(), name.size());
  return k;
}

std::string child_prefix(std::string_view tag, std::string_view owner) {
  std::string k = record_key(tag, owner);
  k.push_back('\0');
  return k;
}

std::string child_key(std::string_view tag, std::string_view owner, std::string_view name) {
  std::string k = child_prefix(tag, owner);
  k.append(name.data(), name.size());
  return k;
}

std::string no_such_entity(std::string_view kind, std::string_view name) {
  std::string msg = "NoSuchEntity: ";
  msg.append(kind.data(), kind.size());
  msg += " ";
  msg.append(name.data(), name.size());
  msg += " cannot be found";
  return msg;
}

bool invalid_name(std::string_view a, std::string_view b, std::string* err) {
  if (contains_nul(a) || contains_nul(b)) {
    if (err) *err = "Invalid name";
    return true;
  }
  return false;
}

} // namespace

struct RocksDirectory::PinnedSnapshot {
  rocksdb::DB* db;
  const rocksdb::Snapshot* snapshot;

  explicit PinnedSnapshot(rocksdb::DB* d) : db(d), snapshot(d->GetSnapshot()) {}
  ~PinnedSnapshot() { db->ReleaseSnapshot(snapshot); }
  PinnedSnapshot(const PinnedSnapshot&) = delete;
  PinnedSnapshot& operator=(const PinnedSnapshot&) = delete;
};

RocksDirectory::RocksDirectory(rocksdb::DB* db,
                               rocksdb::WriteOptions write_opts,
                               server::Metrics* metrics)
    : db_(db), wo_(write_opts), metrics_(metrics) {}

RocksDirectory::RocksDirectory(rocksdb::DB* db, server::Metrics* metrics,
                               std::shared_ptr<const PinnedSnapshot> pinned)
    : db_(db), metrics_(metrics), pinned_(std::move(pinned)) {}

std::unique_ptr<DirectoryView> RocksDirectory::snapshot() const {
  return std::make_unique<RocksDirectory>(db_, metrics_, std::make_shared<const PinnedSnapshot>(db_));
}

rocksdb::ReadOptions RocksDirectory::read_options() const {
  rocksdb::ReadOptions ro;
  if (pinned_) ro.snapshot = pinned_->snapshot;
  return ro;
}

bool RocksDirectory::get(const std::string& key, std::string* value, bool* found, std::string* err) const {
  auto start = Clock::now();
  auto st = db_->Get(read_options(), key, value);
  observe_rocksdb(metrics_, "get", st, value->size(), start);
  *found = st.ok();
  if (st.ok() || st.IsNotFound()) return true;
  if (err) *err = st.ToString();
  return false;
}

bool RocksDirectory::exists(const std::string& key, std::string_view what, std::string_view name,
                            std::string* err) const {
  std::string value;
  bool found = false;
  if (!get(key, &value, &found, err)) return false;
  if (!found) {
    if (err) *err = no_such_entity(what, name);
    return false;
  }
  return true;
}

bool RocksDirectory::put(const std::string& key, std::string_view value, std::string* err) {
  auto start = Clock::now();
  auto st = db_->Put(wo_, key, rocksdb::Slice(value.data(), value.size()));
  observe_rocksdb(metrics_, "put", st, value.size(), start);
  if (!st.ok()) {
    if (err) *err = st.ToString();
    return false;
  }
  return true;
}

bool RocksDirectory::scan(const std::string& prefix,
                          const std::function<bool(std::string_view, std::string_view)>& fn,
                          std::string* err) const {
  auto start = Clock::now();
  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(read_options()));
  bool ok = true;
  for (it->Seek(prefix); it->Valid(); it->Next()) {
    auto k = it->key();
    std::string_view ks(k.data(), k.size());
    if (ks.rfind(prefix, 0) != 0) break;
    auto v = it->value();
    if (!fn(ks.substr(prefix.size()), std::string_view(v.data(), v.size()))) {
      ok = false;
      break;
    }
  }
  auto st = it->status();
  observe_rocksdb(metrics_, "iter", st, 0, start);
  if (!st.ok()) {
    if (err) *err = st.ToString();
    return false;
  }
  return ok;
}

std::vector<std::string> RocksDirectory::list_names(const std::string& prefix, std::string* err) const {
  std::vector<std::string> out;
  scan(prefix, [&](std::string_view name, std::string_view) {
    out.emplace_back(name);
    return true;
  }, err);
  return out;
}

std::vector<ManagedPolicy> RocksDirectory::list_attached(const std::string& prefix, std::string* err) const {
  std::vector<ManagedPolicy> out;
  for (const auto& arn : list_names(prefix, err)) {
    std::string value;
    bool found = false;
    if (!get(record_key("P", arn), &value, &found, err)) return {};
    if (!found) {
      if (err) *err = no_such_entity("Policy", arn);
      return {};
    }
    auto policy = decode_record<ManagedPolicy>(value, err);
    if (!policy) return {};
    out.push_back(std::move(*policy));
  }
  return out;
}

// ---- users ----

std::vector<User> RocksDirectory::list_users(std::string* err) const {
  std::vector<User> out;
  scan(record_key("U", ""), [&](std::string_view, std::string_view value) {
    auto user = decode_record<User>(value, err);
    if (!user) return false;
    out.push_back(std::move(*user));
    return true;
  }, err);
  return out;
}

std::vector<std::string> RocksDirectory::list_user_policies(std::string_view user, std::string* err) const {
  if (!exists(record_key("U", user), "User", user, err)) return {};
  return list_names(child_prefix("UP", user), err);
}

std::string RocksDirectory::get_user_policy(std::string_view user, std::string_view name, std::string* err) const {
  std::string value;
  bool found = false;
  if (!get(child_key("UP", user, name), &value, &found, err)) return {};
  if (!found) {
    if (err) *err = no_such_entity("UserPolicy", name);
    return {};
  }
  return value;
}

std::vector<ManagedPolicy> RocksDirectory::list_attached_user_policies(std::string_view user, std::string* err) const {
  if (!exists(record_key("U", user), "User", user, err)) return {};
  return list_attached(child_prefix("UA", user), err);
}

// ---- groups ----

std::vector<Group> RocksDirectory::groups_for_user(std::string_view user, std::string* err) const {
  if (!exists(record_key("U", user), "User", user, err)) return {};
  std::vector<Group> out;
  for (const auto& name : list_names(child_prefix("UG", user), err)) {
    std::string value;
    bool found = false;
    if (!get(record_key("G", name), &value, &found, err)) return {};
    if (!found) continue;
    auto group = decode_record<Group>(value, err);
    if (!group) return {};
    out.push_back(std::move(*group));
  }
  return out;
}

std::vector<std::string> RocksDirectory::list_group_policies(std::string_view group, std::string* err) const {
  if (!exists(record_key("G", group), "Group", group, err)) return {};
  return list_names(child_prefix("GP", group), err);
}

std::string RocksDirectory::get_group_policy(std::string_view group, std::string_view name, std::string* err) const {
  std::string value;
  bool found = false;
  if (!get(child_key("GP", group, name), &value, &found, err)) return {};
  if (!found) {
    if (err) *err = no_such_entity("GroupPolicy", name);
    return {};
  }
  return value;
}

std::vector<ManagedPolicy> RocksDirectory::list_attached_group_policies(std::string_view group, std::string* err) const {
  if (!exists(record_key("G", group), "Group", group, err)) return {};
  return list_attached(child_prefix("GA", group), err);
}

// ---- roles ----

std::vector<std::string> RocksDirectory::list_role_policies(std::string_view role, std::string* err) const {
  if (!exists(record_key("R", role), "Role", role, err)) return {};
  return list_names(child_prefix("RP", role), err);
}

InlinePolicy RocksDirectory::get_role_policy(std::string_view role, std::string_view name, std::string* err) const {
  std::string value;
  bool found = false;
  if (!get(child_key("RP", role, name), &value, &found, err)) return {};
  if (!found) {
    if (err) *err = no_such_entity("RolePolicy", name);
    return {};
  }
  return InlinePolicy{std::string(name), std::move(value)};
}

std::vector<ManagedPolicy> RocksDirectory::list_attached_role_policies(std::string_view role, std::string* err) const {
  if (!exists(record_key("R", role), "Role", role, err)) return {};
  return list_attached(child_prefix("RA", role), err);
}

std::vector<AssumedRoleSession> RocksDirectory::active_assumed_roles(std::string* err) const {
  std::vector<AssumedRoleSession> out;
  scan(record_key("S", ""), [&](std::string_view, std::string_view value) {
    auto session = decode_record<AssumedRoleSession>(value, err);
    if (!session) return false;
    out.push_back(std::move(*session));
    return true;
  }, err);
  return out;
}

// ---- writes ----

bool RocksDirectory::put_user(const User& user, std::string* err) {
  if (invalid_name(user.name, "", err)) return false;
  return put(record_key("U", user.name), encode_record(user), err);
}

bool RocksDirectory::add_access_key(std::string_view user, const AccessKey& key, std::string* err) {
  std::string value;
  bool found = false;
  const std::string k = record_key("U", user);
  if (!get(k, &value, &found, err)) return false;
  if (!found) {
    if (err) *err = no_such_entity("User", user);
    return false;
  }
  auto rec = decode_record<User>(value, err);
  if (!rec) return false;
  rec->access_keys.push_back(key);
  return put(k, encode_record(*rec), err);
}

bool RocksDirectory::put_user_policy(std::string_view user, const InlinePolicy& policy, std::string* err) {
  if (invalid_name(user, policy.name, err)) return false;
  if (!exists(record_key("U", user), "User", user, err)) return false;
  return put(child_key("UP", user, policy.name), policy.document, err);
}

bool RocksDirectory::attach_user_policy(std::string_view user, std::string_view policy_arn, std::string* err) {
  if (invalid_name(user, policy_arn, err)) return false;
  if (!exists(record_key("U", user), "User", user, err)) return false;
  if (!exists(record_key("P", policy_arn), "Policy", policy_arn, err)) return false;
  return put(child_key("UA", user, policy_arn), "", err);
}

bool RocksDirectory::put_group(const Group& group, std::string* err) {
  if (invalid_name(group.name, "", err)) return false;
  return put(record_key("G", group.name), encode_record(group), err);
}

bool RocksDirectory::add_user_to_group(std::string_view group, std::string_view user, std::string* err) {
  if (invalid_name(group, user, err)) return false;
  if (!exists(record_key("G", group), "Group", group, err)) return false;
  if (!exists(record_key("U", user), "User", user, err)) return false;
  return put(child_key("UG", user, group), "", err);
}

bool RocksDirectory::put_group_policy(std::string_view group, const InlinePolicy& policy, std::string* err) {
  if (invalid_name(group, policy.name, err)) return false;
  if (!exists(record_key("G", group), "Group", group, err)) return false;
  return put(child_key("GP", group, policy.name), policy.document, err);
}

bool RocksDirectory::attach_group_policy(std::string_view group, std::string_view policy_arn, std::string* err) {
  if (invalid_name(group, policy_arn, err)) return false;
  if (!exists(record_key("G", group), "Group", group, err)) return false;
  if (!exists(record_key("P", policy_arn), "Policy", policy_arn, err)) return false;
  return put(child_key("GA", group, policy_arn), "", err);
}

bool RocksDirectory::put_role(const Role& role, std::string* err) {
  if (invalid_name(role.name, "", err)) return false;
  return put(record_key("R", role.name), encode_record(role), err);
}

bool RocksDirectory::put_role_policy(std::string_view role, const InlinePolicy& policy, std::string* err) {
  if (invalid_name(role, policy.name, err)) return false;
  if (!exists(record_key("R", role), "Role", role, err)) return false;
  return put(child_key("RP", role, policy.name), policy.document, err);
}

bool RocksDirectory::attach_role_policy(std::string_view role, std::string_view policy_arn, std::string* err) {
  if (invalid_name(role, policy_arn, err)) return false;
  if (!exists(record_key("R", role), "Role", role, err)) return false;
  if (!exists(record_key("P", policy_arn), "Policy", policy_arn, err)) return false;
  return put(child_key("RA", role, policy_arn), "", err);
}

bool RocksDirectory::put_managed_policy(const ManagedPolicy& policy, std::string* err) {
  if (invalid_name(policy.arn, "", err)) return false;
  return put(record_key("P", policy.arn), encode_record(policy), err);
}

bool RocksDirectory::put_assumed_role_session(const AssumedRoleSession& session, std::string* err) {
  if (invalid_name(session.access_key_id, "", err)) return false;
  return put(record_key("S", session.access_key_id), encode_record(session), err);
}

} // namespace directory
