#include "sigv4.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace auth {

static constexpr std::string_view kAlgorithm = "AWS4-HMAC-SHA256";

std::optional<std::string> header_get(const Headers& headers, std::string_view name) {
  for (const auto& kv : headers) {
    if (util::iequals(kv.first, name)) return kv.second;
  }
  return std::nullopt;
}

bool header_present(const Headers& headers, std::string_view name) {
  return header_get(headers, name).has_value();
}

struct ParsedTarget {
  std::string path;  // includes leading '/'
  std::string query; // without '?'
};

static ParsedTarget parse_target(std::string_view target) {
  ParsedTarget pt;
  size_t q = target.find('?');
  if (q == std::string_view::npos) {
    pt.path = std::string(target);
  } else {
    pt.path = std::string(target.substr(0, q));
    pt.query = std::string(target.substr(q + 1));
  }
  return pt;
}

static std::vector<std::uint8_t> derive_signing_key(std::string_view secret_key,
                                                    std::string_view yyyymmdd,
                                                    std::string_view region,
                                                    std::string_view service) {
  std::string ksecret = "AWS4";
  ksecret += secret_key;
  auto k_date = util::hmac_sha256(ksecret, yyyymmdd);
  auto k_region = util::hmac_sha256(k_date, region);
  auto k_service = util::hmac_sha256(k_region, service);
  return util::hmac_sha256(k_service, "aws4_request");
}

// lower-case name -> values in arrival order
static std::map<std::string, std::vector<std::string>> grouped_headers(const SigningRequest& req) {
  std::map<std::string, std::vector<std::string>> out;
  for (const auto& kv : req.headers) {
    out[util::to_lower(kv.first)].push_back(util::trim_and_collapse_ws(kv.second));
  }
  return out;
}

std::string Signer::canonical_headers(const SigningRequest& req) {
  std::string ch;
  for (const auto& [name, values] : grouped_headers(req)) {
    ch += name;
    ch += ':';
    for (size_t i = 0; i < values.size(); ++i) {
      if (i > 0) ch.push_back(',');
      ch += values[i];
    }
    ch += '\n';
  }
  return ch;
}

std::string Signer::signed_headers(const SigningRequest& req) {
  std::string sh;
  bool first = true;
  for (const auto& entry : grouped_headers(req)) {
    if (!first) sh.push_back(';');
    first = false;
    sh += entry.first;
  }
  return sh;
}

std::string Signer::canonical_request(const SigningRequest& req) const {
  auto pt = parse_target(req.target);
  auto params = util::parse_query(pt.query);

  std::ostringstream cr;
  cr << req.method << '\n'
     << canonical_uri(pt.path) << '\n'
     << util::canonical_query_string(params) << '\n'
     << canonical_headers(req) << '\n'
     << signed_headers(req) << '\n'
     << payload_hash(req);
  return cr.str();
}

std::string Signer::string_to_sign(const SigningRequest& req,
                                   std::string_view canonical_request,
                                   std::string_view region,
                                   std::string_view service) const {
  std::ostringstream sts;
  sts << kAlgorithm << '\n'
      << req.timestamp << '\n'
      << std::string_view(req.timestamp).substr(0, 8) << '/' << region << '/' << service << "/aws4_request" << '\n'
      << util::sha256_hex(canonical_request);
  return sts.str();
}

std::string Signer::sign(const Credentials& creds,
                         std::string_view service,
                         std::string_view region,
                         const SigningRequest& req) const {
  const std::string cr = canonical_request(req);
  const std::string sts = string_to_sign(req, cr, region, service);
  auto key = derive_signing_key(creds.secret_key, std::string_view(req.timestamp).substr(0, 8), region, service);
  return util::hex_lower(util::hmac_sha256(key, sts));
}

std::string SigV4Signer::canonical_uri(std::string_view path) const {
  // Already-encoded paths get encoded a second time; that is what
  // non-storage services expect.
  std::string normalized = util::remove_dot_segments(path);
  if (normalized.empty()) return "/";
  return util::percent_encode(normalized, false);
}

std::string S3SigV4Signer::canonical_uri(std::string_view path) const {
  if (path.empty()) return "/";
  auto decoded = util::percent_decode(path);
  if (!decoded) {
    return util::percent_encode(path, false);
  }
  return util::percent_encode(*decoded, false);
}

std::string Signer::payload_hash(const SigningRequest& req) {
  if (auto h = header_get(req.headers, "x-amz-content-sha256")) return *h;
  return util::sha256_hex(req.body);
}

std::unique_ptr<Signer> make_signer(SignerFlavor flavor) {
  if (flavor == SignerFlavor::Object) return std::make_unique<S3SigV4Signer>();
  return std::make_unique<SigV4Signer>();
}

std::optional<AuthorizationHeader> parse_authorization(std::string_view s) {
  s = util::trim(s);
  if (s.substr(0, kAlgorithm.size()) == kAlgorithm) s.remove_prefix(kAlgorithm.size());

  std::map<std::string, std::string> kv;
  while (!s.empty()) {
    size_t comma = s.find(',');
    std::string_view part = (comma == std::string_view::npos) ? s : s.substr(0, comma);
    if (comma != std::string_view::npos) s.remove_prefix(comma + 1); else s = {};

    part = util::trim(part);
    size_t eq = part.find('=');
    if (eq == std::string_view::npos) continue;
    kv[std::string(part.substr(0, eq))] = std::string(part.substr(eq + 1));
  }

  auto cred_it = kv.find("Credential");
  auto sh_it = kv.find("SignedHeaders");
  auto sig_it = kv.find("Signature");
  if (cred_it == kv.end() || sh_it == kv.end() || sig_it == kv.end()) return std::nullopt;

  // AKID/YYYYMMDD/REGION/SERVICE/aws4_request
  auto parts = util::split(cred_it->second, '/');
  if (parts.size() < 4) return std::nullopt;
  if (parts[0].empty() || parts[3].empty()) return std::nullopt;

  AuthorizationHeader ah;
  ah.scope.access_key = parts[0];
  ah.scope.date = parts[1];
  ah.scope.region = parts[2];
  ah.scope.service = parts[3];
  for (const auto& h : util::split(sh_it->second, ';')) {
    if (!h.empty()) ah.signed_headers.push_back(util::to_lower(h));
  }
  if (ah.signed_headers.empty()) return std::nullopt;
  ah.signature = sig_it->second;
  return ah;
}

void sign_request(SigningRequest& req,
                  const Credentials& creds,
                  std::string_view service,
                  std::string_view region,
                  SignerFlavor flavor,
                  std::int64_t now_epoch_seconds) {
  req.timestamp = util::amz_timestamp(now_epoch_seconds);
  req.headers.emplace_back("X-Amz-Date", req.timestamp);
  if (!creds.session_token.empty()) {
    req.headers.emplace_back("X-Amz-Security-Token", creds.session_token);
  }
  if (flavor == SignerFlavor::Object && !header_present(req.headers, "x-amz-content-sha256")) {
    req.headers.emplace_back("x-amz-content-sha256", util::sha256_hex(req.body));
  }

  auto signer = make_signer(flavor);
  const std::string signature = signer->sign(creds, service, region, req);

  std::ostringstream auth;
  auth << kAlgorithm << " Credential=" << creds.access_key << '/'
       << req.timestamp.substr(0, 8) << '/' << region << '/' << service << "/aws4_request"
       << ", SignedHeaders=" << Signer::signed_headers(req)
       << ", Signature=" << signature;
  req.headers.emplace_back("Authorization", auth.str());
}

} // namespace auth
