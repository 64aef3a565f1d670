#include "authenticator.hpp"
#include "authorizer.hpp"

#include <iostream>
#include <utility>

namespace auth {

std::ostream& operator<<(std::ostream& os, Stage s) {
  switch (s) {
    case Stage::Parsing:            return os << "Parsing";
    case Stage::ResolvingPrincipal: return os << "ResolvingPrincipal";
    case Stage::VerifyingSignature: return os << "VerifyingSignature";
    case Stage::EvaluatingPolicy:   return os << "EvaluatingPolicy";
    case Stage::Done:               return os << "Done";
    default:                        return os << "Unknown";
  }
}

RequestAuthenticator::RequestAuthenticator(const directory::DirectoryView& dir,
                                           Flavor flavor,
                                           std::string account_id)
    : directory_(dir),
      flavor_(flavor),
      errors_(make_error_flavor(flavor)),
      verifier_(errors_->signer()),
      account_id_(std::move(account_id)) {}

util::Params RequestAuthenticator::request_params(const InboundRequest& req) {
  util::Params params;
  size_t q = req.target.find('?');
  if (q != std::string::npos) {
    params = util::parse_query(std::string_view(req.target).substr(q + 1));
  }
  auto content_type = header_get(req.headers, "Content-Type");
  if (content_type && content_type->find("application/x-www-form-urlencoded") != std::string::npos) {
    auto form = util::parse_query(req.body, /*plus_as_space=*/true);
    params.insert(params.end(), form.begin(), form.end());
  }
  return params;
}

AuthOutcome RequestAuthenticator::authenticate_and_authorize(std::string_view method,
                                                             std::string_view target,
                                                             std::string_view body,
                                                             const Headers& headers) const {
  InboundRequest req{std::string(method), std::string(target), std::string(body), headers};
  return run(req, request_params(req)).outcome;
}

StagedOutcome RequestAuthenticator::finish(AuthOutcome outcome, Stage stage) const {
  if (outcome.kind == OutcomeKind::InternalFailure) {
    std::cerr << "auth: internal failure at " << stage << ": " << outcome.detail << "\n";
  }
  outcome.error = errors_->render(outcome);
  return StagedOutcome{std::move(outcome), stage};
}

StagedOutcome RequestAuthenticator::run(const InboundRequest& req, const util::Params& params) const {
  AuthOutcome out;
  out.resource = util::param_get(params, "BucketName");

  // Parsing
  auto auth_value = header_get(req.headers, "Authorization");
  auto auth = auth_value ? parse_authorization(*auth_value) : std::nullopt;
  if (!auth) {
    out.kind = OutcomeKind::MalformedAuthorization;
    out.detail = auth_value ? "unparseable Authorization header" : "missing Authorization header";
    return finish(std::move(out), Stage::Parsing);
  }
  out.service = auth->scope.service;
  auto action_name = util::param_get(params, "Action");
  if (!action_name || action_name->empty()) {
    out.kind = OutcomeKind::MissingAction;
    return finish(std::move(out), Stage::Parsing);
  }
  out.action = auth->scope.service + ":" + *action_name;

  // Sessions, users and policies are all read from one snapshot.
  auto view = directory_.snapshot();
  PrincipalResolver resolver(*view, *view, account_id_);

  // ResolvingPrincipal
  auto resolution = resolver.resolve(auth->scope.access_key, req.headers);
  if (!resolution.ok()) {
    if (resolution.error == ResolutionError::DirectoryError) {
      out.kind = OutcomeKind::InternalFailure;
    } else {
      out.kind = OutcomeKind::CredentialResolutionFailed;
      out.reason = resolution.error;
    }
    out.detail = std::move(resolution.detail);
    return finish(std::move(out), Stage::ResolvingPrincipal);
  }
  const Principal& principal = *resolution.principal;
  out.principal_arn = principal.arn();

  // VerifyingSignature
  auto verified = verifier_.verify(req, *auth, principal);
  if (verified.status == VerifyStatus::MissingTimestamp) {
    out.kind = OutcomeKind::MalformedAuthorization;
    out.detail = "X-Amz-Date is not among the signed headers";
    return finish(std::move(out), Stage::VerifyingSignature);
  }
  if (!verified.ok()) {
    out.kind = OutcomeKind::SignatureMismatch;
    return finish(std::move(out), Stage::VerifyingSignature);
  }

  // EvaluatingPolicy
  auto decision = iam::authorize(principal, out.action);
  if (!decision.permitted()) {
    out.kind = OutcomeKind::AccessDenied;
    out.detail = decision.error;
    if (!decision.error.empty()) {
      std::cerr << "auth: denying " << out.action << " for " << out.principal_arn
                << ": " << decision.error << "\n";
    }
    return finish(std::move(out), Stage::EvaluatingPolicy);
  }

  out.kind = OutcomeKind::Success;
  return finish(std::move(out), Stage::Done);
}

} // namespace auth
