#include "gateway_api.hpp"
#include "metrics.hpp"
#include "sigv4.hpp"

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace gateway {

static std::atomic<std::uint64_t> g_reqid{1};

static std::string new_request_id() {
  auto v = g_reqid.fetch_add(1, std::memory_order_relaxed);
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static std::string xml_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '\"': out += "&quot;"; break;
      case '\'': out += "&apos;"; break;
      default: out.push_back(c); break;
    }
  }
  return out;
}

static Response make_xml_response(unsigned status, std::string body_xml, bool keep_alive, unsigned version) {
  Response res{static_cast<http::status>(status), version};
  res.set(http::field::server, "iam_gateway");
  res.set(http::field::content_type, "text/xml");
  res.keep_alive(keep_alive);
  res.body().assign(body_xml.begin(), body_xml.end());
  res.content_length(res.body().size());
  return res;
}

util::Params storage_params(std::string_view method, std::string_view target) {
  util::Params out;
  size_t q = target.find('?');
  std::string_view p = (q == std::string_view::npos) ? target : target.substr(0, q);
  if (!p.empty() && p.front() == '/') p.remove_prefix(1);

  // Path-style: /bucket or /bucket/key
  size_t slash = p.find('/');
  std::string_view bucket_enc = (slash == std::string_view::npos) ? p : p.substr(0, slash);
  std::string_view key_enc = (slash == std::string_view::npos) ? std::string_view{} : p.substr(slash + 1);

  std::string action;
  if (bucket_enc.empty()) {
    if (method == "GET") action = "ListAllMyBuckets";
  } else if (key_enc.empty()) {
    if (method == "GET" || method == "HEAD") action = "ListBucket";
    else if (method == "PUT") action = "CreateBucket";
    else if (method == "DELETE") action = "DeleteBucket";
  } else {
    if (method == "GET" || method == "HEAD") action = "GetObject";
    else if (method == "PUT") action = "PutObject";
    else if (method == "DELETE") action = "DeleteObject";
  }

  if (!action.empty()) out.emplace_back("Action", std::move(action));
  if (!bucket_enc.empty()) {
    auto bucket = util::percent_decode(bucket_enc);
    out.emplace_back("BucketName", bucket ? *bucket : std::string(bucket_enc));
  }
  return out;
}

std::string render_error(const auth::ServiceError& e, std::string_view request_id) {
  std::ostringstream oss;
  oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>";
  if (e.shape == auth::ErrorShape::Object) {
    oss << "<Error>"
        << "<Code>" << xml_escape(e.code) << "</Code>"
        << "<Message>" << xml_escape(e.message) << "</Message>";
    if (!e.bucket.empty()) oss << "<BucketName>" << xml_escape(e.bucket) << "</BucketName>";
    oss << "<RequestId>" << xml_escape(request_id) << "</RequestId>"
        << "</Error>";
    return oss.str();
  }
  oss << "<ErrorResponse>"
      << "<Error>"
      << "<Type>Sender</Type>"
      << "<Code>" << xml_escape(e.code) << "</Code>"
      << "<Message>" << xml_escape(e.message) << "</Message>"
      << "</Error>"
      << "<RequestId>" << xml_escape(request_id) << "</RequestId>"
      << "</ErrorResponse>";
  return oss.str();
}

std::string render_success(std::string_view action_name,
                           std::string_view principal_arn,
                           std::string_view request_id) {
  const std::string name = xml_escape(action_name);
  std::ostringstream oss;
  oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
      << "<" << name << "Response>"
      << "<" << name << "Result>"
      << "<Arn>" << xml_escape(principal_arn) << "</Arn>"
      << "</" << name << "Result>"
      << "<ResponseMetadata><RequestId>" << xml_escape(request_id) << "</RequestId></ResponseMetadata>"
      << "</" << name << "Response>";
  return oss.str();
}

Api::Api(const directory::DirectoryView& dir,
         Config cfg,
         server::Metrics* metrics)
    : cfg_(std::move(cfg)),
      generic_(dir, auth::Flavor::Generic, cfg_.account_id),
      object_(dir, auth::Flavor::ResourceScoped, cfg_.account_id),
      metrics_(metrics) {}

auth::InboundRequest Api::to_inbound(const Request& req) {
  auth::InboundRequest in;
  in.method.assign(req.method_string().data(), req.method_string().size());
  in.target.assign(req.target().data(), req.target().size());
  in.body.assign(req.body().begin(), req.body().end());
  for (const auto& field : req) {
    in.headers.emplace_back(std::string(field.name_string().data(), field.name_string().size()),
                            std::string(field.value().data(), field.value().size()));
  }
  return in;
}

Response Api::handle(const Request& req) {
  const std::string request_id = new_request_id();
  const bool keep_alive = req.keep_alive();
  const unsigned version = req.version();

  auto in = to_inbound(req);
  auto params = auth::RequestAuthenticator::request_params(in);

  // The credential scope decides the flavor; a header that cannot be parsed
  // is reported in the generic vocabulary.
  const auth::RequestAuthenticator* authenticator = &generic_;
  auto auth_value = auth::header_get(in.headers, "Authorization");
  auto scope = auth_value ? auth::parse_authorization(*auth_value) : std::nullopt;
  if (scope && scope->scope.service == "s3") {
    authenticator = &object_;
    auto derived = storage_params(in.method, in.target);
    params.insert(params.begin(), derived.begin(), derived.end());
  }

  auto staged = authenticator->run(in, params);
  const auto& outcome = staged.outcome;
  if (metrics_) metrics_->ObserveAuth(outcome.kind, outcome.service);

  if (!outcome.ok()) {
    auto res = make_xml_response(outcome.error.http_status, render_error(outcome.error, request_id),
                                 keep_alive, version);
    res.set("x-amz-request-id", request_id);
    return res;
  }

  std::string_view action_name = outcome.action;
  size_t colon = action_name.find(':');
  if (colon != std::string_view::npos) action_name.remove_prefix(colon + 1);
  auto res = make_xml_response(200, render_success(action_name, outcome.principal_arn, request_id),
                               keep_alive, version);
  res.set("x-amz-request-id", request_id);
  return res;
}

} // namespace gateway
