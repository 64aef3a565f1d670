#include "authenticator.hpp"
#include "metrics.hpp"
#include "rocks_directory.hpp"
#include "seed_loader.hpp"
#include "test_support.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using test_support::allow;

static std::string make_tmp_dir() {
  std::string tmpl = "/tmp/iamgw_test_XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  char* dir = mkdtemp(buf.data());
  if (!dir) return "/tmp/iamgw_test_fallback";
  return std::string(dir);
}

int main() {
  std::string path = make_tmp_dir();
  std::filesystem::create_directories(path);

  rocksdb::Options opts;
  opts.create_if_missing = true;
  rocksdb::DB* raw = nullptr;
  auto st = rocksdb::DB::Open(opts, path, &raw);
  assert(st.ok());
  std::unique_ptr<rocksdb::DB> db(raw);

  server::Metrics metrics;
  directory::RocksDirectory dir(db.get(), rocksdb::WriteOptions{}, &metrics);
  std::string err;

  const std::string arn = "arn:aws:iam::123456789012:policy/Read";
  assert(dir.put_managed_policy(test_support::managed(arn, allow("iam:Get*")), &err));
  test_support::add_user(dir, "alice", test_support::key("AKIAALICE0000000001", "s1"));
  test_support::add_user(dir, "al", test_support::key("AKIAAL0000000000001", "s2"));
  assert(dir.add_access_key("alice", test_support::key("AKIAALICE0000000002", "s3"), &err));
  assert(dir.put_user_policy("alice", directory::InlinePolicy{"s3", allow("s3:*")}, &err));
  assert(dir.attach_user_policy("alice", arn, &err));
  assert(dir.put_group(directory::Group{"ops", "/"}, &err));
  assert(dir.put_group_policy("ops", directory::InlinePolicy{"ec2", allow("ec2:*")}, &err));
  assert(dir.add_user_to_group("ops", "alice", &err));
  assert(dir.put_role(directory::Role{"builder", "/"}, &err));
  assert(dir.put_role_policy("builder", directory::InlinePolicy{"b", allow("s3:PutObject")}, &err));
  assert(dir.attach_role_policy("builder", arn, &err));

  // Prefix scans stay within one principal: "al" must not see "alice".
  auto users = dir.list_users(&err);
  assert(err.empty());
  assert(users.size() == 2);
  assert(dir.list_user_policies("al", &err).empty());
  assert(dir.list_user_policies("alice", &err).size() == 1);
  assert(dir.get_user_policy("alice", "s3", &err) == allow("s3:*"));
  auto attached = dir.list_attached_user_policies("alice", &err);
  assert(attached.size() == 1);
  assert(attached[0].arn == arn);
  assert(attached[0].versions.size() == 1);
  auto groups = dir.groups_for_user("alice", &err);
  assert(groups.size() == 1);
  assert(groups[0].name == "ops");
  assert(dir.get_group_policy("ops", "ec2", &err) == allow("ec2:*"));
  assert(dir.get_role_policy("builder", "b", &err).document == allow("s3:PutObject"));
  assert(dir.list_attached_role_policies("builder", &err).size() == 1);

  // Missing entities and unknown attachments.
  err.clear();
  dir.list_user_policies("nobody", &err);
  assert(err.find("NoSuchEntity") != std::string::npos);
  err.clear();
  assert(!dir.attach_user_policy("alice", "arn:aws:iam::123456789012:policy/Missing", &err));
  assert(err.find("NoSuchEntity") != std::string::npos);
  err.clear();
  assert(!dir.put_user_policy("nobody", directory::InlinePolicy{"p", allow("*")}, &err));
  err.clear();
  assert(!dir.add_user_to_group("nogroup", "alice", &err));
  err.clear();

  // Snapshots do not see later writes.
  auto snap = dir.snapshot();
  test_support::add_user(dir, "bob", test_support::key("AKIABOB000000000001", "s4"));
  assert(snap->list_users(&err).size() == 2);
  assert(dir.list_users(&err).size() == 3);

  // Sessions and the full pipeline over RocksDB.
  directory::AssumedRoleSession s;
  s.access_key_id = "ASIABUILDER00000001";
  s.secret = "session-secret";
  s.session_token = "tok";
  s.role_arn = "arn:aws:iam::123456789012:role/builder";
  s.session_name = "ci";
  assert(dir.put_assumed_role_session(s, &err));
  assert(dir.active_assumed_roles(&err).size() == 1);
  err.clear();
  assert(snap->active_assumed_roles(&err).empty());
  assert(err.empty());

  auth::RequestAuthenticator authn(dir, auth::Flavor::Generic);
  auto req = test_support::signed_query("iam", "GetUser", auth::Credentials{"AKIAALICE0000000002", "s3", ""});
  auto out = authn.authenticate_and_authorize(req.method, req.target, req.body, req.headers);
  assert(out.ok());
  auto role_req = test_support::signed_query("s3", "PutObject", auth::Credentials{s.access_key_id, s.secret, s.session_token});
  out = authn.authenticate_and_authorize(role_req.method, role_req.target, role_req.body, role_req.headers);
  assert(out.ok());
  assert(out.principal_arn == "arn:aws:sts::123456789012:assumed-role/builder/ci");

  // Corrupt records surface as errors rather than empty results.
  assert(db->Put(rocksdb::WriteOptions{}, std::string("U\0zed", 5), "{not json").ok());
  err.clear();
  dir.list_users(&err);
  assert(err.find("Corrupt record") != std::string::npos);

  const std::string rendered = metrics.RenderPrometheus();
  assert(rendered.find("iamgw_rocksdb_ops_total{op=\"put\"}") != std::string::npos);
  assert(rendered.find("iamgw_rocksdb_ops_total{op=\"iter\"} 0") == std::string::npos);

  snap.reset();
  db.reset();
  std::filesystem::remove_all(path);

  std::cout << "test_rocks_directory passed\n";
  return 0;
}
