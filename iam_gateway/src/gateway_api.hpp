#pragma once

#include "authenticator.hpp"
#include "directory.hpp"
#include "error_flavor.hpp"
#include "util.hpp"

#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

namespace server {
class Metrics;
} // namespace server

namespace gateway {

namespace http = boost::beast::http;

struct Config {
  std::string account_id = std::string(auth::kDefaultAccountId);
};

using Request = http::request<http::vector_body<char>>;
using Response = http::response<http::vector_body<char>>;

// Storage operation implied by an object-store request: Action and, when the
// path names one, BucketName. Empty for requests that map to no operation.
util::Params storage_params(std::string_view method, std::string_view target);

std::string render_error(const auth::ServiceError& e, std::string_view request_id);
std::string render_success(std::string_view action_name,
                           std::string_view principal_arn,
                           std::string_view request_id);

// Authenticates every request against the directory and answers with the
// flavor's error document or a stub success carrying the caller's ARN.
class Api {
public:
  Api(const directory::DirectoryView& dir,
      Config cfg,
      server::Metrics* metrics = nullptr);

  Response handle(const Request& req);

  static auth::InboundRequest to_inbound(const Request& req);

private:
  Config cfg_;
  auth::RequestAuthenticator generic_;
  auth::RequestAuthenticator object_;
  server::Metrics* metrics_;
};

} // namespace gateway
