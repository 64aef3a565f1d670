#pragma once

#include "directory.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <rocksdb/db.h>

namespace server {
class Metrics;
} // namespace server

namespace directory {

// IAM records persisted in RocksDB. Key layout (\0 separates components):
//   U\0user            user record (JSON, with access keys)
//   UP\0user\0name     inline user policy document
//   UA\0user\0arn      attached managed policy marker
//   UG\0user\0group    group membership marker
//   G\0group, GP\0..., GA\0...   groups and their policies
//   R\0role,  RP\0..., RA\0...   roles and their policies
//   P\0arn             managed policy (JSON, with versions)
//   S\0akid            assumed-role session (JSON)
class RocksDirectory final : public Directory {
public:
  explicit RocksDirectory(rocksdb::DB* db,
                          rocksdb::WriteOptions write_opts = rocksdb::WriteOptions{},
                          server::Metrics* metrics = nullptr);

  // Read view over a rocksdb::Snapshot, released when the view is destroyed.
  std::unique_ptr<DirectoryView> snapshot() const override;

  std::vector<User> list_users(std::string* err) const override;

  std::vector<std::string> list_user_policies(std::string_view user, std::string* err) const override;
  std::string get_user_policy(std::string_view user, std::string_view name, std::string* err) const override;
  std::vector<ManagedPolicy> list_attached_user_policies(std::string_view user, std::string* err) const override;

  std::vector<Group> groups_for_user(std::string_view user, std::string* err) const override;
  std::vector<std::string> list_group_policies(std::string_view group, std::string* err) const override;
  std::string get_group_policy(std::string_view group, std::string_view name, std::string* err) const override;
  std::vector<ManagedPolicy> list_attached_group_policies(std::string_view group, std::string* err) const override;

  std::vector<std::string> list_role_policies(std::string_view role, std::string* err) const override;
  InlinePolicy get_role_policy(std::string_view role, std::string_view name, std::string* err) const override;
  std::vector<ManagedPolicy> list_attached_role_policies(std::string_view role, std::string* err) const override;

  std::vector<AssumedRoleSession> active_assumed_roles(std::string* err) const override;

  bool put_user(const User& user, std::string* err) override;
  bool add_access_key(std::string_view user, const AccessKey& key, std::string* err) override;
  bool put_user_policy(std::string_view user, const InlinePolicy& policy, std::string* err) override;
  bool attach_user_policy(std::string_view user, std::string_view policy_arn, std::string* err) override;

  bool put_group(const Group& group, std::string* err) override;
  bool add_user_to_group(std::string_view group, std::string_view user, std::string* err) override;
  bool put_group_policy(std::string_view group, const InlinePolicy& policy, std::string* err) override;
  bool attach_group_policy(std::string_view group, std::string_view policy_arn, std::string* err) override;

  bool put_role(const Role& role, std::string* err) override;
  bool put_role_policy(std::string_view role, const InlinePolicy& policy, std::string* err) override;
  bool attach_role_policy(std::string_view role, std::string_view policy_arn, std::string* err) override;

  bool put_managed_policy(const ManagedPolicy& policy, std::string* err) override;
  bool put_assumed_role_session(const AssumedRoleSession& session, std::string* err) override;

  // Held by snapshot views; defined in the implementation file only.
  struct PinnedSnapshot;

  RocksDirectory(rocksdb::DB* db, server::Metrics* metrics, std::shared_ptr<const PinnedSnapshot> pinned);

private:
  rocksdb::ReadOptions read_options() const;

  // Returns false with *err set on a RocksDB error; *found tells whether the key exists.
  bool get(const std::string& key, std::string* value, bool* found, std::string* err) const;
  bool exists(const std::string& key, std::string_view what, std::string_view name, std::string* err) const;
  bool put(const std::string& key, std::string_view value, std::string* err);

  // Calls fn(suffix, value) for every key under prefix; suffix excludes the prefix.
  bool scan(const std::string& prefix,
            const std::function<bool(std::string_view, std::string_view)>& fn,
            std::string* err) const;

  std::vector<std::string> list_names(const std::string& prefix, std::string* err) const;
  std::vector<ManagedPolicy> list_attached(const std::string& prefix, std::string* err) const;

  rocksdb::DB* db_;
  rocksdb::WriteOptions wo_;
  server::Metrics* metrics_;
  std::shared_ptr<const PinnedSnapshot> pinned_;
};

} // namespace directory
