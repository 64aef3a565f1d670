#include "authenticator.hpp"
#include "authorizer.hpp"
#include "memory_directory.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <string>

using auth::Flavor;
using auth::OutcomeKind;
using auth::ResolutionError;
using auth::SignerFlavor;
using auth::Stage;
using test_support::allow;
using test_support::deny;

static const auth::Credentials kUser{"AKIAUSER00000000001", "user-secret", ""};
static const auth::Credentials kSession{"ASIASESSION00000001", "session-secret", "token-1"};
static const std::string kUserArn = "arn:aws:iam::123456789012:user/u";

static void seed(directory::MemoryDirectory& dir) {
  std::string err;
  test_support::add_user(dir, "u", test_support::key(kUser.access_key, kUser.secret_key));
  assert(dir.put_user_policy("u", directory::InlinePolicy{"list", allow("s3:ListBucket")}, &err));

  // Group grants everything; the user's attached policy denies one action.
  assert(dir.put_managed_policy(test_support::managed("arn:aws:iam::123456789012:policy/NoDelete",
                                                      deny("s3:DeleteObject")), &err));
  assert(dir.attach_user_policy("u", "arn:aws:iam::123456789012:policy/NoDelete", &err));
  assert(dir.put_group(directory::Group{"admins", "/"}, &err));
  assert(dir.put_group_policy("admins", directory::InlinePolicy{"all", allow("*")}, &err));

  assert(dir.put_role(directory::Role{"reader", "/"}, &err));
  assert(dir.put_role_policy("reader", directory::InlinePolicy{"read", allow("sts:GetCallerIdentity")}, &err));
  directory::AssumedRoleSession s;
  s.access_key_id = kSession.access_key;
  s.secret = kSession.secret_key;
  s.session_token = kSession.session_token;
  s.role_arn = "arn:aws:iam::123456789012:role/reader";
  s.session_name = "batch";
  assert(dir.put_assumed_role_session(s, &err));
}

static auth::InboundRequest storage_request(const std::string& method,
                                            const std::string& target,
                                            const std::string& body,
                                            const auth::Credentials& creds) {
  return test_support::signed_request(method, target, body, {}, creds, "s3", SignerFlavor::Object);
}

int main() {
  directory::MemoryDirectory dir;
  seed(dir);
  auth::RequestAuthenticator storage(dir, Flavor::ResourceScoped);
  auth::RequestAuthenticator generic(dir, Flavor::Generic);

  // Scenario 1: inline Allow on the requested action.
  {
    auto req = storage_request("GET", "/?Action=ListBucket&BucketName=photos", "", kUser);
    auto out = storage.authenticate_and_authorize(req.method, req.target, req.body, req.headers);
    assert(out.ok());
    assert(out.action == "s3:ListBucket");
    assert(out.principal_arn == kUserArn);
    assert(out.error.http_status == 0);
  }

  // Scenario 2: nothing allows the action.
  {
    auto req = storage_request("GET", "/?Action=DeleteBucket&BucketName=photos", "", kUser);
    auto staged = storage.run(req, auth::RequestAuthenticator::request_params(req));
    assert(staged.failed_at == Stage::EvaluatingPolicy);
    const auto& out = staged.outcome;
    assert(out.kind == OutcomeKind::AccessDenied);
    assert(out.principal_arn == kUserArn);
    assert(out.action == "s3:DeleteBucket");
    assert(out.resource && *out.resource == "photos");
    assert(out.error.http_status == 403);
    assert(out.error.code == "AccessDenied");
    assert(out.error.message == "Access Denied");
    assert(out.error.bucket == "photos");

    auto generic_req = test_support::signed_query("iam", "DeleteUser", kUser);
    auto generic_out = generic.authenticate_and_authorize(generic_req.method, generic_req.target,
                                                          generic_req.body, generic_req.headers);
    assert(generic_out.kind == OutcomeKind::AccessDenied);
    assert(generic_out.error.message == "User: " + kUserArn + " is not authorized to perform: iam:DeleteUser");
  }

  // Scenario 3: tampered body fails the signature before any policy read.
  {
    test_support::ReadCounter counter;
    test_support::CountingDirectory counting(dir, &counter);
    auth::RequestAuthenticator counted(counting, Flavor::Generic);

    auto req = test_support::signed_query("s3", "ListBucket", kUser);
    req.body = "Action=ListBucket&Version=2010-05-09";
    auto staged = counted.run(req, auth::RequestAuthenticator::request_params(req));
    assert(staged.outcome.kind == OutcomeKind::SignatureMismatch);
    assert(staged.failed_at == Stage::VerifyingSignature);
    assert(staged.outcome.error.http_status == 403);
    assert(staged.outcome.error.code == "SignatureDoesNotMatch");
    assert(counter.user_scans == 1);
    assert(counter.policy_reads == 0);

    auto good = test_support::signed_query("s3", "ListBucket", kUser);
    auto ok = counted.run(good, auth::RequestAuthenticator::request_params(good));
    assert(ok.outcome.ok());
    assert(counter.policy_reads > 0);
  }

  // Scenario 3 on the object store: the signed payload hash no longer
  // matches the body, so the request stops at the signature.
  {
    test_support::ReadCounter counter;
    test_support::CountingDirectory counting(dir, &counter);
    auth::RequestAuthenticator counted(counting, Flavor::ResourceScoped);

    auto req = storage_request("PUT", "/?Action=PutObject&BucketName=photos", "original", kUser);
    req.body = "TAMPERED";
    auto staged = counted.run(req, auth::RequestAuthenticator::request_params(req));
    assert(staged.outcome.kind == OutcomeKind::SignatureMismatch);
    assert(staged.failed_at == Stage::VerifyingSignature);
    assert(staged.outcome.error.http_status == 403);
    assert(staged.outcome.error.code == "SignatureDoesNotMatch");
    assert(staged.outcome.error.bucket == "photos");
    assert(counter.policy_reads == 0);

    // UNSIGNED-PAYLOAD leaves the body out of the signature.
    auto streamed = test_support::signed_request("PUT", "/?Action=PutObject&BucketName=photos", "chunk-1",
                                                 {{"x-amz-content-sha256", "UNSIGNED-PAYLOAD"}},
                                                 kUser, "s3", SignerFlavor::Object);
    streamed.body = "chunk-2";
    auto unsigned_out = counted.run(streamed, auth::RequestAuthenticator::request_params(streamed));
    assert(unsigned_out.failed_at == Stage::EvaluatingPolicy);
    assert(unsigned_out.outcome.kind == OutcomeKind::AccessDenied);
  }

  // Assumed-role sessions are read from the same snapshot as the policies.
  {
    test_support::ReadCounter counter;
    test_support::CountingDirectory counting(dir, &counter);
    auth::RequestAuthenticator counted(counting, Flavor::Generic);

    auto req = test_support::signed_query("sts", "GetCallerIdentity", kSession);
    auto out = counted.authenticate_and_authorize(req.method, req.target, req.body, req.headers);
    assert(out.ok());
    assert(out.principal_arn == "arn:aws:sts::123456789012:assumed-role/reader/batch");
    assert(counter.snapshot_session_scans == 1);
    assert(counter.live_session_scans == 0);

    // A session written after the snapshot is not visible to it.
    auto view = dir.snapshot();
    directory::AssumedRoleSession late;
    late.access_key_id = "ASIALATE00000000001";
    late.secret = "late-secret";
    late.session_token = "token-late";
    late.role_arn = "arn:aws:iam::123456789012:role/reader";
    late.session_name = "late";
    std::string err;
    assert(dir.put_assumed_role_session(late, &err));
    auth::PrincipalResolver pinned(*view, *view);
    auto unseen = pinned.resolve(late.access_key_id, {{"X-Amz-Security-Token", "token-late"}});
    assert(!unseen.ok());
    assert(unseen.error == ResolutionError::InvalidId);
    auth::PrincipalResolver live(dir, dir);
    assert(live.resolve(late.access_key_id, {{"X-Amz-Security-Token", "token-late"}}).ok());
  }

  // Scenario 4: group-inherited Allow * loses to the user's attached Deny.
  {
    std::string err;
    assert(dir.add_user_to_group("admins", "u", &err));
    auth::PrincipalResolver resolver(dir, dir);
    auto user = resolver.resolve(kUser.access_key, {});
    assert(user.ok());
    assert(!iam::authorize(*user.principal, "s3:DeleteObject").permitted());
    assert(iam::authorize(*user.principal, "s3:PutObject").permitted());

    auto req = storage_request("DELETE", "/?Action=DeleteObject&BucketName=photos", "", kUser);
    auto out = storage.authenticate_and_authorize(req.method, req.target, req.body, req.headers);
    assert(out.kind == OutcomeKind::AccessDenied);
  }

  // Credential failures in both vocabularies.
  {
    const auth::Credentials unknown{"AKIAUNKNOWN00000001", "x", ""};
    auto iam_req = test_support::signed_query("iam", "ListUsers", unknown);
    auto out = generic.authenticate_and_authorize(iam_req.method, iam_req.target, iam_req.body, iam_req.headers);
    assert(out.kind == OutcomeKind::CredentialResolutionFailed);
    assert(out.reason == ResolutionError::InvalidId);
    assert(out.error.http_status == 403);
    assert(out.error.code == "InvalidClientTokenId");
    assert(out.error.message == "The security token included in the request is invalid.");

    auto ec2_req = test_support::signed_query("ec2", "DescribeInstances", unknown);
    out = generic.authenticate_and_authorize(ec2_req.method, ec2_req.target, ec2_req.body, ec2_req.headers);
    assert(out.error.http_status == 401);
    assert(out.error.code == "AuthFailure");

    auto s3_req = storage_request("GET", "/?Action=GetObject&BucketName=photos", "", unknown);
    out = storage.authenticate_and_authorize(s3_req.method, s3_req.target, s3_req.body, s3_req.headers);
    assert(out.error.http_status == 403);
    assert(out.error.code == "InvalidAccessKeyId");
    assert(out.error.bucket == "photos");
    assert(out.error.shape == auth::ErrorShape::Object);

    const auth::Credentials stolen{kSession.access_key, kSession.secret_key, "token-2"};
    auto token_req = storage_request("GET", "/?Action=GetObject", "", stolen);
    out = storage.authenticate_and_authorize(token_req.method, token_req.target, token_req.body, token_req.headers);
    assert(out.reason == ResolutionError::InvalidToken);
    assert(out.error.http_status == 400);
    assert(out.error.code == "InvalidToken");
    assert(out.error.bucket.empty());
  }

  // Assumed-role sessions authenticate with their token.
  {
    auto req = test_support::signed_query("sts", "GetCallerIdentity", kSession);
    auto out = generic.authenticate_and_authorize(req.method, req.target, req.body, req.headers);
    assert(out.ok());
    assert(out.principal_arn == "arn:aws:sts::123456789012:assumed-role/reader/batch");
  }

  // Parsing failures.
  {
    auto req = test_support::signed_query("iam", "ListUsers", kUser);
    auto stripped = req;
    stripped.headers.clear();
    auto staged = generic.run(stripped, auth::RequestAuthenticator::request_params(stripped));
    assert(staged.failed_at == Stage::Parsing);
    assert(staged.outcome.kind == OutcomeKind::MalformedAuthorization);
    assert(staged.outcome.error.http_status == 400);
    assert(staged.outcome.error.code == "IncompleteSignature");

    auto s3_staged = storage.run(stripped, {});
    assert(s3_staged.outcome.error.code == "AuthorizationHeaderMalformed");

    auto no_action = test_support::signed_request("POST", "/", "Version=2010-05-08",
                                                  {{"Content-Type", "application/x-www-form-urlencoded"}},
                                                  kUser, "iam");
    auto out = generic.authenticate_and_authorize(no_action.method, no_action.target, no_action.body,
                                                  no_action.headers);
    assert(out.kind == OutcomeKind::MissingAction);
    assert(out.error.http_status == 400);
    assert(out.error.code == "MissingAction");
  }

  // Directory failures.
  {
    test_support::ReadCounter counter;
    test_support::CountingDirectory counting(dir, &counter);
    auth::RequestAuthenticator failing(counting, Flavor::Generic);
    auth::RequestAuthenticator failing_storage(counting, Flavor::ResourceScoped);

    counter.fail_user_scan = true;
    auto req = test_support::signed_query("iam", "ListUsers", kUser);
    auto staged = failing.run(req, auth::RequestAuthenticator::request_params(req));
    assert(staged.failed_at == Stage::ResolvingPrincipal);
    assert(staged.outcome.kind == OutcomeKind::InternalFailure);
    assert(staged.outcome.error.http_status == 500);
    assert(staged.outcome.error.code == "InternalFailure");
    assert(failing_storage.run(req, auth::RequestAuthenticator::request_params(req)).outcome.error.code ==
           "InternalError");

    counter.fail_user_scan = false;
    counter.fail_policy_reads = true;
    auto listed = test_support::signed_query("s3", "ListBucket", kUser);
    auto denied = failing.run(listed, auth::RequestAuthenticator::request_params(listed));
    assert(denied.outcome.kind == OutcomeKind::AccessDenied);
    assert(!denied.outcome.detail.empty());
  }

  // A configured account id shows up in rendered errors.
  {
    auth::RequestAuthenticator other(dir, Flavor::Generic, "210987654321");
    auto req = test_support::signed_query("iam", "DeleteUser", kUser);
    auto out = other.authenticate_and_authorize(req.method, req.target, req.body, req.headers);
    assert(out.error.message.find("arn:aws:iam::210987654321:user/u") != std::string::npos);
  }

  std::cout << "test_authenticator passed\n";
  return 0;
}
