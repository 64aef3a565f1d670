#pragma once

#include "memory_directory.hpp"
#include "signature_verifier.hpp"
#include "sigv4.hpp"
#include "util.hpp"

#include <cassert>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace test_support {

inline std::string allow(const std::string& action) {
  return R"({"Version":"2012-10-17","Statement":[{"Effect":"Allow","Action":")" + action +
         R"(","Resource":"*"}]})";
}

inline std::string deny(const std::string& action) {
  return R"({"Version":"2012-10-17","Statement":[{"Effect":"Deny","Action":")" + action +
         R"(","Resource":"*"}]})";
}

// Signs as a client would and hands back the request as the server sees it.
inline auth::InboundRequest signed_request(const std::string& method,
                                           const std::string& target,
                                           const std::string& body,
                                           auth::Headers headers,
                                           const auth::Credentials& creds,
                                           const std::string& service,
                                           auth::SignerFlavor flavor = auth::SignerFlavor::Generic) {
  auth::SigningRequest req{method, target, body, std::move(headers), ""};
  req.headers.emplace_back("Host", "iam.amazonaws.com");
  auth::sign_request(req, creds, service, "us-east-1", flavor, util::unix_now_seconds());
  return auth::InboundRequest{req.method, req.target, req.body, req.headers};
}

inline auth::InboundRequest signed_query(const std::string& service,
                                         const std::string& action,
                                         const auth::Credentials& creds) {
  return signed_request("POST", "/", "Action=" + action + "&Version=2010-05-08",
                        {{"Content-Type", "application/x-www-form-urlencoded; charset=utf-8"}},
                        creds, service);
}

inline directory::AccessKey key(const std::string& id, const std::string& secret) {
  directory::AccessKey k;
  k.id = id;
  k.secret = secret;
  return k;
}

inline directory::ManagedPolicy managed(const std::string& arn, const std::string& document) {
  directory::ManagedPolicy p;
  p.arn = arn;
  p.name = arn.substr(arn.rfind('/') + 1);
  p.versions.push_back(directory::PolicyVersion{"v1", document, true});
  return p;
}

inline void add_user(directory::Directory& dir, const std::string& name, const directory::AccessKey& k) {
  std::string err;
  directory::User u;
  u.name = name;
  u.access_keys.push_back(k);
  bool ok = dir.put_user(u, &err);
  assert(ok);
  (void)ok;
}

struct ReadCounter {
  int user_scans = 0;
  int policy_reads = 0;
  int live_session_scans = 0;
  int snapshot_session_scans = 0;
  bool fail_user_scan = false;
  bool fail_policy_reads = false;
};

// Wraps a directory, counting reads and optionally failing them. Snapshots
// share the counter with the view they came from.
class CountingDirectory final : public directory::DirectoryView {
public:
  CountingDirectory(const directory::DirectoryView& inner, ReadCounter* counter)
      : inner_(&inner), counter_(counter) {}

  CountingDirectory(std::unique_ptr<directory::DirectoryView> pinned, ReadCounter* counter)
      : owned_(std::move(pinned)), inner_(owned_.get()), counter_(counter) {}

  std::unique_ptr<directory::DirectoryView> snapshot() const override {
    return std::make_unique<CountingDirectory>(inner_->snapshot(), counter_);
  }

  std::vector<directory::User> list_users(std::string* err) const override {
    ++counter_->user_scans;
    if (counter_->fail_user_scan) {
      if (err) *err = "IO error: user scan failed";
      return {};
    }
    return inner_->list_users(err);
  }

  std::vector<std::string> list_user_policies(std::string_view user, std::string* err) const override {
    if (!read_policy(err)) return {};
    return inner_->list_user_policies(user, err);
  }
  std::string get_user_policy(std::string_view user, std::string_view name, std::string* err) const override {
    if (!read_policy(err)) return {};
    return inner_->get_user_policy(user, name, err);
  }
  std::vector<directory::ManagedPolicy> list_attached_user_policies(std::string_view user, std::string* err) const override {
    if (!read_policy(err)) return {};
    return inner_->list_attached_user_policies(user, err);
  }
  std::vector<directory::Group> groups_for_user(std::string_view user, std::string* err) const override {
    if (!read_policy(err)) return {};
    return inner_->groups_for_user(user, err);
  }
  std::vector<std::string> list_group_policies(std::string_view group, std::string* err) const override {
    if (!read_policy(err)) return {};
    return inner_->list_group_policies(group, err);
  }
  std::string get_group_policy(std::string_view group, std::string_view name, std::string* err) const override {
    if (!read_policy(err)) return {};
    return inner_->get_group_policy(group, name, err);
  }
  std::vector<directory::ManagedPolicy> list_attached_group_policies(std::string_view group, std::string* err) const override {
    if (!read_policy(err)) return {};
    return inner_->list_attached_group_policies(group, err);
  }
  std::vector<std::string> list_role_policies(std::string_view role, std::string* err) const override {
    if (!read_policy(err)) return {};
    return inner_->list_role_policies(role, err);
  }
  directory::InlinePolicy get_role_policy(std::string_view role, std::string_view name, std::string* err) const override {
    if (!read_policy(err)) return {};
    return inner_->get_role_policy(role, name, err);
  }
  std::vector<directory::ManagedPolicy> list_attached_role_policies(std::string_view role, std::string* err) const override {
    if (!read_policy(err)) return {};
    return inner_->list_attached_role_policies(role, err);
  }

  std::vector<directory::AssumedRoleSession> active_assumed_roles(std::string* err) const override {
    ++(owned_ ? counter_->snapshot_session_scans : counter_->live_session_scans);
    return inner_->active_assumed_roles(err);
  }

private:
  bool read_policy(std::string* err) const {
    ++counter_->policy_reads;
    if (counter_->fail_policy_reads) {
      if (err) *err = "IO error: policy read failed";
      return false;
    }
    return true;
  }

  std::unique_ptr<directory::DirectoryView> owned_;
  const directory::DirectoryView* inner_;
  ReadCounter* counter_;
};

} // namespace test_support
