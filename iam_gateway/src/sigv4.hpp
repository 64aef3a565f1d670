#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace auth {

using Headers = std::vector<std::pair<std::string, std::string>>;

// Case-insensitive header lookup; first match wins.
std::optional<std::string> header_get(const Headers& headers, std::string_view name);
bool header_present(const Headers& headers, std::string_view name);

struct Credentials {
  std::string access_key;
  std::string secret_key;
  std::string session_token; // empty for long-term keys
};

struct SigningRequest {
  std::string method;
  std::string target;    // path, optionally followed by '?' and the query
  std::string body;
  Headers headers;
  std::string timestamp; // X-Amz-Date value, e.g. 20240101T000000Z
};

// Generic: every service except the object store.
// Object: storage-object variant (single URI encoding).
enum class SignerFlavor {
  Generic,
  Object
};

// Computes AWS Signature Version 4 signatures over a request.
// Every header present in the request takes part in canonicalization, so the
// caller passes exactly the headers that were (or are to be) signed.
class Signer {
public:
  virtual ~Signer() = default;

  // Lower-case hex signature.
  std::string sign(const Credentials& creds,
                   std::string_view service,
                   std::string_view region,
                   const SigningRequest& req) const;

  std::string canonical_request(const SigningRequest& req) const;

  std::string string_to_sign(const SigningRequest& req,
                             std::string_view canonical_request,
                             std::string_view region,
                             std::string_view service) const;

  // "host;x-amz-date;..." for the headers present in req.
  static std::string signed_headers(const SigningRequest& req);

  // x-amz-content-sha256 when it is among the headers, the body hash otherwise.
  static std::string payload_hash(const SigningRequest& req);

protected:
  virtual std::string canonical_uri(std::string_view path) const = 0;

private:
  static std::string canonical_headers(const SigningRequest& req);
};

class SigV4Signer final : public Signer {
protected:
  std::string canonical_uri(std::string_view path) const override;
};

class S3SigV4Signer final : public Signer {
protected:
  std::string canonical_uri(std::string_view path) const override;
};

inline constexpr std::string_view kUnsignedPayload = "UNSIGNED-PAYLOAD";

std::unique_ptr<Signer> make_signer(SignerFlavor flavor);

struct CredentialScope {
  std::string access_key;
  std::string date;
  std::string region;
  std::string service;
};

struct AuthorizationHeader {
  CredentialScope scope;
  std::vector<std::string> signed_headers; // lower-case
  std::string signature;
};

// Parses "AWS4-HMAC-SHA256 Credential=AKID/20240101/us-east-1/iam/aws4_request,
// SignedHeaders=host;x-amz-date, Signature=...". std::nullopt when any of the
// three components or the credential scope fields are missing.
std::optional<AuthorizationHeader> parse_authorization(std::string_view value);

// Client side signing: stamps X-Amz-Date (and X-Amz-Security-Token,
// x-amz-content-sha256 where they apply) and appends the Authorization header.
void sign_request(SigningRequest& req,
                  const Credentials& creds,
                  std::string_view service,
                  std::string_view region,
                  SignerFlavor flavor,
                  std::int64_t now_epoch_seconds);

} // namespace auth
