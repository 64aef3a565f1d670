#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace directory {

struct AccessKey {
  std::string id;
  std::string secret;
  std::string status = "Active"; // "Active" | "Inactive"
};

struct User {
  std::string name;
  std::string path = "/";
  std::vector<AccessKey> access_keys;
};

struct Group {
  std::string name;
  std::string path = "/";
};

struct Role {
  std::string name;
  std::string path = "/";
};

struct PolicyVersion {
  std::string version_id; // "v1", "v2", ...
  std::string document;   // JSON text
  bool is_default = false;
};

struct ManagedPolicy {
  std::string arn;
  std::string name;
  std::vector<PolicyVersion> versions;
};

struct InlinePolicy {
  std::string name;
  std::string document; // JSON text
};

struct AssumedRoleSession {
  std::string access_key_id;
  std::string secret;
  std::string session_token;
  std::string role_arn;     // arn:aws:iam::<account>:role/<name>
  std::string session_name;
};

// Read side of the IAM backend. Calls report failures by setting *err to a
// non-empty message; the returned value is then unspecified.
class IdentityDirectory {
public:
  virtual ~IdentityDirectory() = default;

  virtual std::vector<User> list_users(std::string* err) const = 0;

  virtual std::vector<std::string> list_user_policies(std::string_view user, std::string* err) const = 0;
  virtual std::string get_user_policy(std::string_view user, std::string_view name, std::string* err) const = 0;
  virtual std::vector<ManagedPolicy> list_attached_user_policies(std::string_view user, std::string* err) const = 0;

  virtual std::vector<Group> groups_for_user(std::string_view user, std::string* err) const = 0;
  virtual std::vector<std::string> list_group_policies(std::string_view group, std::string* err) const = 0;
  virtual std::string get_group_policy(std::string_view group, std::string_view name, std::string* err) const = 0;
  virtual std::vector<ManagedPolicy> list_attached_group_policies(std::string_view group, std::string* err) const = 0;

  virtual std::vector<std::string> list_role_policies(std::string_view role, std::string* err) const = 0;
  virtual InlinePolicy get_role_policy(std::string_view role, std::string_view name, std::string* err) const = 0;
  virtual std::vector<ManagedPolicy> list_attached_role_policies(std::string_view role, std::string* err) const = 0;
};

class SessionDirectory {
public:
  virtual ~SessionDirectory() = default;

  virtual std::vector<AssumedRoleSession> active_assumed_roles(std::string* err) const = 0;
};

// Both read sides of one backend.
class DirectoryView : public IdentityDirectory, public SessionDirectory {
public:
  // Both read sides pinned to the current state; used for the duration of
  // one request so that sessions, users and policies agree.
  virtual std::unique_ptr<DirectoryView> snapshot() const = 0;
};

// Backends implement the read view plus the write operations used by the
// seed loader. Writes return false and set *err on failure.
class Directory : public DirectoryView {
public:
  virtual bool put_user(const User& user, std::string* err) = 0;
  virtual bool add_access_key(std::string_view user, const AccessKey& key, std::string* err) = 0;
  virtual bool put_user_policy(std::string_view user, const InlinePolicy& policy, std::string* err) = 0;
  virtual bool attach_user_policy(std::string_view user, std::string_view policy_arn, std::string* err) = 0;

  virtual bool put_group(const Group& group, std::string* err) = 0;
  virtual bool add_user_to_group(std::string_view group, std::string_view user, std::string* err) = 0;
  virtual bool put_group_policy(std::string_view group, const InlinePolicy& policy, std::string* err) = 0;
  virtual bool attach_group_policy(std::string_view group, std::string_view policy_arn, std::string* err) = 0;

  virtual bool put_role(const Role& role, std::string* err) = 0;
  virtual bool put_role_policy(std::string_view role, const InlinePolicy& policy, std::string* err) = 0;
  virtual bool attach_role_policy(std::string_view role, std::string_view policy_arn, std::string* err) = 0;

  virtual bool put_managed_policy(const ManagedPolicy& policy, std::string* err) = 0;
  virtual bool put_assumed_role_session(const AssumedRoleSession& session, std::string* err) = 0;
};

} // namespace directory
