#pragma once

#include "principal.hpp"
#include "sigv4.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace auth {

enum class OutcomeKind {
  Success,
  CredentialResolutionFailed,
  SignatureMismatch,
  AccessDenied,
  MalformedAuthorization,
  MissingAction,
  InternalFailure
};

std::ostream& operator<<(std::ostream& os, OutcomeKind k);

// Wire vocabulary a failure is rendered in.
enum class ErrorShape {
  Query,  // <ErrorResponse><Error>...</Error><RequestId/></ErrorResponse>
  Object  // <Error>...<BucketName/><RequestId/></Error>
};

struct ServiceError {
  unsigned http_status = 0;
  std::string code;
  std::string message;
  std::string bucket; // empty unless the failure names one
  ErrorShape shape = ErrorShape::Query;
};

struct AuthOutcome {
  OutcomeKind kind = OutcomeKind::Success;
  ResolutionError reason = ResolutionError::InvalidId; // CredentialResolutionFailed only
  std::string principal_arn;
  std::string service;
  std::string action;
  std::optional<std::string> resource; // bucket the request targets, if any
  std::string detail;                  // diagnostics, never sent to the client
  ServiceError error;                  // filled by the flavor for failures

  bool ok() const { return kind == OutcomeKind::Success; }
};

enum class Flavor {
  Generic,        // query-protocol services (iam, sts, ec2, ...)
  ResourceScoped  // object store: bucket-qualified variants
};

// Picks the error vocabulary and the signer variant for one family of services.
class ErrorFlavor {
public:
  virtual ~ErrorFlavor() = default;

  virtual SignerFlavor signer() const = 0;
  virtual ServiceError render(const AuthOutcome& outcome) const = 0;

protected:
  static ServiceError signature_mismatch(ErrorShape shape);
};

class GenericErrorFlavor final : public ErrorFlavor {
public:
  SignerFlavor signer() const override { return SignerFlavor::Generic; }
  ServiceError render(const AuthOutcome& outcome) const override;
};

class ResourceErrorFlavor final : public ErrorFlavor {
public:
  SignerFlavor signer() const override { return SignerFlavor::Object; }
  ServiceError render(const AuthOutcome& outcome) const override;
};

std::unique_ptr<ErrorFlavor> make_error_flavor(Flavor flavor);

} // namespace auth
