#pragma once

#include "directory.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace directory {

// In-process backend. Writers copy the state and swap it in, so a snapshot is
// just a pointer to an immutable state.
class MemoryDirectory final : public Directory {
public:
  MemoryDirectory();

  // Tag for the pinned-view constructor; only MemoryDirectory can make one.
  class Pinned {
    friend class MemoryDirectory;
    explicit Pinned() = default;
  };

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

private:
  using PolicyMap = std::map<std::string, std::string, std::less<>>;

  struct Attachments {
    PolicyMap inline_policies;           // name -> document
    std::set<std::string, std::less<>> attached; // managed policy arns
  };

  struct State {
    std::map<std::string, User, std::less<>> users;
    std::map<std::string, Attachments, std::less<>> user_policies;
    std::map<std::string, Group, std::less<>> groups;
    std::map<std::string, Attachments, std::less<>> group_policies;
    std::map<std::string, std::set<std::string, std::less<>>, std::less<>> group_members;
    std::map<std::string, Role, std::less<>> roles;
    std::map<std::string, Attachments, std::less<>> role_policies;
    std::map<std::string, ManagedPolicy, std::less<>> managed;
    std::map<std::string, AssumedRoleSession, std::less<>> sessions; // by access key id
  };

  std::shared_ptr<const State> current() const;

  template <typename Fn>
  bool mutate(Fn&& fn, std::string* err);

  static std::vector<ManagedPolicy> resolve_attached(const State& st,
                                                     const std::set<std::string, std::less<>>& arns,
                                                     std::string* err);

  mutable std::mutex mu_;
  std::shared_ptr<const State> state_;

public:
  MemoryDirectory(Pinned, std::shared_ptr<const State> state);
};

} // namespace directory
