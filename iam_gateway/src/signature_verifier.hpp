#pragma once

#include "principal.hpp"
#include "sigv4.hpp"

#include <memory>
#include <string>
#include <vector>

namespace auth {

struct InboundRequest {
  std::string method;
  std::string target; // path[?query] as received
  std::string body;
  Headers headers;
};

enum class VerifyStatus {
  Ok,
  SignatureMismatch,
  MissingTimestamp
};

struct VerifyResult {
  VerifyStatus status = VerifyStatus::Ok;
  std::string expected; // recomputed signature, for diagnostics

  bool ok() const { return status == VerifyStatus::Ok; }
};

// Recomputes the request signature with the principal's credentials and
// compares it with the one the client sent. A signed x-amz-content-sha256
// other than UNSIGNED-PAYLOAD must also match the body received.
class SignatureVerifier {
public:
  explicit SignatureVerifier(SignerFlavor flavor);

  VerifyResult verify(const InboundRequest& req,
                      const AuthorizationHeader& auth,
                      const Principal& principal) const;

  // Method, target and body of req with only the headers listed in
  // signed_headers (lower-case); names compare case-insensitively.
  static SigningRequest restricted_view(const InboundRequest& req,
                                        const std::vector<std::string>& signed_headers);

private:
  std::unique_ptr<Signer> signer_;
};

} // namespace auth
