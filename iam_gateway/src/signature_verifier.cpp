#include "signature_verifier.hpp"
#include "util.hpp"

#include <algorithm>

namespace auth {

SignatureVerifier::SignatureVerifier(SignerFlavor flavor) : signer_(make_signer(flavor)) {}

SigningRequest SignatureVerifier::restricted_view(const InboundRequest& req,
                                                  const std::vector<std::string>& signed_headers) {
  SigningRequest out;
  out.method = req.method;
  out.target = req.target;
  out.body = req.body;
  for (const auto& kv : req.headers) {
    const std::string name = util::to_lower(kv.first);
    if (std::find(signed_headers.begin(), signed_headers.end(), name) != signed_headers.end()) {
      out.headers.push_back(kv);
    }
  }
  if (auto ts = header_get(out.headers, "X-Amz-Date")) out.timestamp = *ts;
  return out;
}

VerifyResult SignatureVerifier::verify(const InboundRequest& req,
                                       const AuthorizationHeader& auth,
                                       const Principal& principal) const {
  VerifyResult r;
  SigningRequest view = restricted_view(req, auth.signed_headers);
  if (view.timestamp.size() < 8) {
    r.status = VerifyStatus::MissingTimestamp;
    return r;
  }

  // A signed payload hash only covers the body if it is the body's hash.
  if (auto claimed = header_get(view.headers, "x-amz-content-sha256")) {
    if (*claimed != kUnsignedPayload &&
        !util::constant_time_equal(*claimed, util::sha256_hex(req.body))) {
      r.status = VerifyStatus::SignatureMismatch;
      return r;
    }
  }

  r.expected = signer_->sign(principal.credentials(), auth.scope.service, auth.scope.region, view);
  if (!util::constant_time_equal(r.expected, auth.signature)) {
    r.status = VerifyStatus::SignatureMismatch;
  }
  return r;
}

} // namespace auth
