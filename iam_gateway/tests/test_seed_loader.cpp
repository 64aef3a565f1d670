#include "memory_directory.hpp"
#include "principal.hpp"
#include "authorizer.hpp"
#include "seed_loader.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

static const char* kSeed = R"({
  "policies": [
    {"arn": "arn:aws:iam::123456789012:policy/ReadOnly", "name": "ReadOnly",
     "versions": [
       {"version_id": "v1", "document": {"Statement": [{"Effect": "Deny", "Action": "*"}]}},
       {"version_id": "v2", "is_default": true,
        "document": "{\"Statement\":[{\"Effect\":\"Allow\",\"Action\":[\"iam:Get*\",\"iam:List*\"]}]}"}
     ]}
  ],
  "groups": [
    {"name": "ops", "policies": [{"name": "ec2", "document": {"Statement": {"Effect": "Allow", "Action": "ec2:*"}}}]}
  ],
  "roles": [
    {"name": "deployer", "attached": ["arn:aws:iam::123456789012:policy/ReadOnly"]}
  ],
  "users": [
    {"name": "alice",
     "access_keys": [{"id": "AKIAALICE0000000001", "secret": "s1"},
                     {"id": "AKIAALICE0000000002", "secret": "s2", "status": "Inactive"}],
     "policies": [{"name": "s3", "document": {"Statement": [{"Effect": "Allow", "Action": "s3:*"}]}}],
     "attached": ["arn:aws:iam::123456789012:policy/ReadOnly"],
     "groups": ["ops"]}
  ],
  "sessions": [
    {"access_key_id": "ASIADEPLOY000000001", "secret": "s3", "session_token": "t1",
     "role_arn": "arn:aws:iam::123456789012:role/deployer", "session_name": "release"}
  ]
})";

int main() {
  directory::MemoryDirectory dir;
  std::string err;
  bool loaded = directory::load_seed(dir, kSeed, &err);
  if (!loaded) std::cerr << err << "\n";
  assert(loaded);

  auto users = dir.list_users(&err);
  assert(users.size() == 1);
  assert(users[0].access_keys.size() == 2);
  assert(users[0].access_keys[1].status == "Inactive");
  assert(dir.groups_for_user("alice", &err).size() == 1);
  assert(dir.list_attached_role_policies("deployer", &err).size() == 1);

  auth::PrincipalResolver resolver(dir, dir);
  auto alice = resolver.resolve("AKIAALICE0000000001", {});
  assert(alice.ok());
  assert(iam::authorize(*alice.principal, "iam:GetUser").permitted());
  assert(iam::authorize(*alice.principal, "ec2:RunInstances").permitted());
  assert(iam::authorize(*alice.principal, "s3:GetObject").permitted());
  assert(!iam::authorize(*alice.principal, "iam:DeleteUser").permitted());
  assert(!resolver.resolve("AKIAALICE0000000002", {}).ok());

  auto session = resolver.resolve("ASIADEPLOY000000001", {{"X-Amz-Security-Token", "t1"}});
  assert(session.ok());
  assert(session.principal->arn() == "arn:aws:sts::123456789012:assumed-role/deployer/release");
  assert(iam::authorize(*session.principal, "iam:ListRoles").permitted());

  // Malformed seeds.
  directory::MemoryDirectory empty;
  err.clear();
  assert(!directory::load_seed(empty, "[1, 2]", &err));
  assert(!err.empty());
  err.clear();
  assert(!directory::load_seed(empty, R"({"users": [{"access_keys": []}]})", &err));
  assert(err.find("Invalid seed") != std::string::npos);
  err.clear();
  assert(!directory::load_seed(empty, R"({"users": [{"name": "bob", "attached": ["arn:aws:iam::1:policy/Missing"]}]})", &err));
  assert(err.find("NoSuchEntity") != std::string::npos);
  err.clear();
  assert(!directory::load_seed(empty, R"({"users": [{"name": "carol", "groups": ["nope"]}]})", &err));
  assert(!err.empty());

  // From a file.
  const std::string path = "/tmp/iamgw_seed_test.json";
  {
    std::ofstream out(path);
    out << kSeed;
  }
  directory::MemoryDirectory from_file;
  assert(directory::load_seed_file(from_file, path, &err));
  assert(from_file.list_users(&err).size() == 1);
  std::remove(path.c_str());
  assert(!directory::load_seed_file(from_file, "/nonexistent/seed.json", &err));

  std::cout << "test_seed_loader passed\n";
  return 0;
}
