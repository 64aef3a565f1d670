#include "error_flavor.hpp"

#include <string>
#include <utility>

namespace auth {

namespace {

ServiceError make(unsigned status, std::string code, std::string message, ErrorShape shape) {
  ServiceError e;
  e.http_status = status;
  e.code = std::move(code);
  e.message = std::move(message);
  e.shape = shape;
  return e;
}

} // namespace

std::ostream& operator<<(std::ostream& os, OutcomeKind k) {
  switch (k) {
    case OutcomeKind::Success:                    return os << "Success";
    case OutcomeKind::CredentialResolutionFailed: return os << "CredentialResolutionFailed";
    case OutcomeKind::SignatureMismatch:          return os << "SignatureMismatch";
    case OutcomeKind::AccessDenied:               return os << "AccessDenied";
    case OutcomeKind::MalformedAuthorization:     return os << "MalformedAuthorization";
    case OutcomeKind::MissingAction:              return os << "MissingAction";
    case OutcomeKind::InternalFailure:            return os << "InternalFailure";
    default:                                      return os << "Unknown";
  }
}

ServiceError ErrorFlavor::signature_mismatch(ErrorShape shape) {
  return make(403, "SignatureDoesNotMatch",
              "The request signature we calculated does not match the signature you provided. "
              "Check your AWS Secret Access Key and signing method. Consult the service documentation for details.",
              shape);
}

ServiceError GenericErrorFlavor::render(const AuthOutcome& outcome) const {
  constexpr auto shape = ErrorShape::Query;
  switch (outcome.kind) {
    case OutcomeKind::Success:
      return ServiceError{};
    case OutcomeKind::CredentialResolutionFailed:
      if (outcome.service == "ec2") {
        return make(401, "AuthFailure", "AWS was not able to validate the provided access credentials", shape);
      }
      return make(403, "InvalidClientTokenId", "The security token included in the request is invalid.", shape);
    case OutcomeKind::SignatureMismatch:
      return signature_mismatch(shape);
    case OutcomeKind::AccessDenied:
      return make(403, "AccessDenied",
                  "User: " + outcome.principal_arn + " is not authorized to perform: " + outcome.action,
                  shape);
    case OutcomeKind::MalformedAuthorization:
      return make(400, "IncompleteSignature",
                  "The request signature does not conform to AWS standards.", shape);
    case OutcomeKind::MissingAction:
      return make(400, "MissingAction", "The request must contain the parameter Action.", shape);
    case OutcomeKind::InternalFailure:
    default:
      return make(500, "InternalFailure",
                  "The request processing has failed because of an unknown error, exception or failure.", shape);
  }
}

ServiceError ResourceErrorFlavor::render(const AuthOutcome& outcome) const {
  constexpr auto shape = ErrorShape::Object;
  ServiceError e;
  switch (outcome.kind) {
    case OutcomeKind::Success:
      return ServiceError{};
    case OutcomeKind::CredentialResolutionFailed:
      if (outcome.reason == ResolutionError::InvalidToken) {
        e = make(400, "InvalidToken", "The provided token is malformed or otherwise invalid.", shape);
      } else {
        e = make(403, "InvalidAccessKeyId",
                 "The AWS Access Key Id you provided does not exist in our records.", shape);
      }
      break;
    case OutcomeKind::SignatureMismatch:
      return signature_mismatch(shape);
    case OutcomeKind::AccessDenied:
      e = make(403, "AccessDenied", "Access Denied", shape);
      break;
    case OutcomeKind::MalformedAuthorization:
      return make(400, "AuthorizationHeaderMalformed", "The authorization header is malformed.", shape);
    case OutcomeKind::MissingAction:
      return make(400, "InvalidRequest", "The request does not map to a storage operation.", shape);
    case OutcomeKind::InternalFailure:
    default:
      return make(500, "InternalError", "We encountered an internal error. Please try again.", shape);
  }
  if (outcome.resource) e.bucket = *outcome.resource;
  return e;
}

std::unique_ptr<ErrorFlavor> make_error_flavor(Flavor flavor) {
  if (flavor == Flavor::ResourceScoped) return std::make_unique<ResourceErrorFlavor>();
  return std::make_unique<GenericErrorFlavor>();
}

} // namespace auth
