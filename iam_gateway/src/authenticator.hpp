#pragma once

#include "directory.hpp"
#include "error_flavor.hpp"
#include "signature_verifier.hpp"
#include "util.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace auth {

enum class Stage {
  Parsing,
  ResolvingPrincipal,
  VerifyingSignature,
  EvaluatingPolicy,
  Done
};

std::ostream& operator<<(std::ostream& os, Stage s);

struct StagedOutcome {
  AuthOutcome outcome;
  Stage failed_at = Stage::Done; // Done on success
};

// Runs parse -> resolve -> verify -> authorize for one request. The first
// failing stage ends processing; its outcome is rendered by the flavor.
// Stateless between calls and safe to share between worker threads.
class RequestAuthenticator {
public:
  RequestAuthenticator(const directory::DirectoryView& dir,
                       Flavor flavor,
                       std::string account_id = std::string(kDefaultAccountId));

  // Parameters come from the query string and, for form-encoded bodies,
  // from the body.
  AuthOutcome authenticate_and_authorize(std::string_view method,
                                         std::string_view target,
                                         std::string_view body,
                                         const Headers& headers) const;

  // Caller-supplied parameters: "Action" names the operation and
  // "BucketName", when present, the targeted resource.
  StagedOutcome run(const InboundRequest& req, const util::Params& params) const;

  Flavor flavor() const { return flavor_; }

  static util::Params request_params(const InboundRequest& req);

private:
  StagedOutcome finish(AuthOutcome outcome, Stage stage) const;

  const directory::DirectoryView& directory_;
  Flavor flavor_;
  std::unique_ptr<ErrorFlavor> errors_;
  SignatureVerifier verifier_;
  std::string account_id_;
};

} // namespace auth
