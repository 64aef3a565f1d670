#include "authorizer.hpp"
#include "policy.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using iam::PermissionResult;
using test_support::allow;
using test_support::deny;

static PermissionResult eval(const std::string& doc, const std::string& action) {
  std::string err;
  auto parsed = iam::parse_policy_document(doc, &err);
  assert(parsed);
  return iam::evaluate(*parsed, action);
}

int main() {
  // Wildcards: '*' only, full-string, case-sensitive.
  assert(iam::wildcard_match("*", ""));
  assert(iam::wildcard_match("*", "iam:ListUsers"));
  assert(iam::wildcard_match("iam:*", "iam:ListUsers"));
  assert(iam::wildcard_match("iam:List*", "iam:ListUsers"));
  assert(iam::wildcard_match("s3:Get*", "s3:GetObject"));
  assert(iam::wildcard_match("s3:Get*", "s3:Get"));
  assert(!iam::wildcard_match("s3:Get*", "s3:PutObject"));
  assert(iam::wildcard_match("*:Get*Policy", "iam:GetUserPolicy"));
  assert(iam::wildcard_match("a*b*c", "abc"));
  assert(iam::wildcard_match("a*b*c", "axxbyyc"));
  assert(!iam::wildcard_match("a*b*c", "axxbyy"));
  assert(!iam::wildcard_match("iam:*", "s3:GetObject"));
  assert(!iam::wildcard_match("iam:listusers", "iam:ListUsers"));
  assert(!iam::wildcard_match("iam:List", "iam:ListUsers"));
  assert(!iam::wildcard_match("iam:?istUsers", "iam:ListUsers"));
  assert(iam::wildcard_match("iam:?istUsers", "iam:?istUsers"));
  assert(!iam::wildcard_match("s3:Get.bject", "s3:GetObject"));

  // A document that does not mention the action stays neutral.
  assert(eval(allow("s3:*"), "iam:ListUsers") == PermissionResult::Neutral);
  assert(eval(deny("s3:*"), "iam:ListUsers") == PermissionResult::Neutral);
  assert(eval(allow("iam:*"), "iam:ListUsers") == PermissionResult::Permitted);
  assert(eval(deny("iam:List*"), "iam:ListUsers") == PermissionResult::Denied);

  // NotAction concerns every action the patterns do not match.
  const std::string not_action =
      R"({"Statement":{"Effect":"Allow","NotAction":["iam:Delete*","iam:Put*"]}})";
  assert(eval(not_action, "iam:ListUsers") == PermissionResult::Permitted);
  assert(eval(not_action, "iam:DeleteUser") == PermissionResult::Neutral);

  // Within one document a Deny wins regardless of position.
  const std::string allow_then_deny =
      R"({"Statement":[{"Effect":"Allow","Action":"*"},{"Effect":"Deny","Action":"iam:DeleteUser"}]})";
  const std::string deny_then_allow =
      R"({"Statement":[{"Effect":"Deny","Action":"iam:DeleteUser"},{"Effect":"Allow","Action":"*"}]})";
  assert(eval(allow_then_deny, "iam:DeleteUser") == PermissionResult::Denied);
  assert(eval(deny_then_allow, "iam:DeleteUser") == PermissionResult::Denied);
  assert(eval(allow_then_deny, "iam:ListUsers") == PermissionResult::Permitted);

  // Parse errors.
  std::string err;
  assert(!iam::parse_policy_document("not json", &err));
  assert(!err.empty());
  err.clear();
  assert(!iam::parse_policy_document(R"({"Version":"2012-10-17"})", &err));
  assert(err.find("Statement") != std::string::npos);
  assert(!iam::parse_policy_document(R"({"Statement":[{"Action":"*"}]})", &err));
  assert(!iam::parse_policy_document(R"({"Statement":[{"Effect":"Maybe","Action":"*"}]})", &err));
  assert(!iam::parse_policy_document(R"({"Statement":[{"Effect":"Allow"}]})", &err));
  assert(!iam::parse_policy_document(R"({"Statement":[{"Effect":"Allow","Action":[1]}]})", &err));

  // Normalisation: managed policies use their default version.
  directory::ManagedPolicy mp;
  mp.arn = "arn:aws:iam::123456789012:policy/Versions";
  mp.versions.push_back(directory::PolicyVersion{"v1", deny("*"), false});
  mp.versions.push_back(directory::PolicyVersion{"v2", allow("iam:ListUsers"), true});
  auto doc = iam::normalize(iam::PolicySource{mp}, &err);
  assert(doc);
  assert(iam::evaluate(*doc, "iam:ListUsers") == PermissionResult::Permitted);

  directory::ManagedPolicy no_default = mp;
  no_default.versions[1].is_default = false;
  err.clear();
  assert(!iam::normalize(iam::PolicySource{no_default}, &err));
  assert(err.find("default version") != std::string::npos);

  auto inline_doc = iam::normalize(iam::PolicySource{directory::InlinePolicy{"p", allow("s3:*")}}, &err);
  assert(inline_doc);
  assert(iam::evaluate(*inline_doc, "s3:GetObject") == PermissionResult::Permitted);

  // Aggregation: deny wins across documents in either order; default deny.
  std::vector<iam::PolicySource> none;
  assert(!iam::aggregate(none, "iam:ListUsers").permitted());

  std::vector<iam::PolicySource> neutral_only{std::string(allow("s3:*"))};
  assert(!iam::aggregate(neutral_only, "iam:ListUsers").permitted());

  std::vector<iam::PolicySource> allow_deny{std::string(allow("*")), std::string(deny("iam:ListUsers"))};
  std::vector<iam::PolicySource> deny_allow{std::string(deny("iam:ListUsers")), std::string(allow("*"))};
  assert(!iam::aggregate(allow_deny, "iam:ListUsers").permitted());
  assert(!iam::aggregate(deny_allow, "iam:ListUsers").permitted());
  assert(iam::aggregate(allow_deny, "iam:GetUser").permitted());

  std::vector<iam::PolicySource> broken{std::string(allow("*")), std::string("{")};
  auto result = iam::aggregate(broken, "iam:GetUser");
  assert(!result.permitted());
  assert(!result.error.empty());

  std::cout << "test_policy passed\n";
  return 0;
}
