#include "metrics.hpp"

#include <cmath>
#include <sstream>

namespace server {

namespace {

template <std::size_t N>
void record_latency(double latency_ms,
                    const std::array<double, N>& bounds,
                    std::array<std::atomic<std::uint64_t>, N>& buckets,
                    std::atomic<std::uint64_t>& count,
                    std::atomic<std::uint64_t>& sum_us) {
  count.fetch_add(1, std::memory_order_relaxed);
  sum_us.fetch_add(static_cast<std::uint64_t>(std::llround(latency_ms * 1000.0)), std::memory_order_relaxed);
  for (std::size_t i = 0; i < N; ++i) {
    if (latency_ms <= bounds[i]) {
      buckets[i].fetch_add(1, std::memory_order_relaxed);
      break;
    }
  }
}

void write_help(std::ostringstream& oss, const char* name, const char* help, const char* type) {
  oss << "# HELP " << name << " " << help << "\n";
  oss << "# TYPE " << name << " " << type << "\n";
}

// One counter family with a single label; label_of(i) names series i.
template <std::size_t N, typename LabelFn>
void write_counters(std::ostringstream& oss,
                    const char* name,
                    const char* help,
                    const char* label,
                    const std::array<std::atomic<std::uint64_t>, N>& values,
                    LabelFn label_of) {
  write_help(oss, name, help, "counter");
  for (std::size_t i = 0; i < N; ++i) {
    oss << name << "{" << label << "=\"" << label_of(i) << "\"} " << values[i].load() << "\n";
  }
}

template <std::size_t N>
void write_histogram(std::ostringstream& oss,
                     const char* name,
                     const char* help,
                     const std::array<double, N>& bounds,
                     const std::array<std::atomic<std::uint64_t>, N>& buckets,
                     std::uint64_t count,
                     std::uint64_t sum_us) {
  write_help(oss, name, help, "histogram");
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < N; ++i) {
    cumulative += buckets[i].load();
    oss << name << "_bucket{le=\"" << bounds[i] << "\"} " << cumulative << "\n";
  }
  oss << name << "_bucket{le=\"+Inf\"} " << count << "\n";
  oss << name << "_sum " << static_cast<double>(sum_us) / 1000.0 << "\n";
  oss << name << "_count " << count << "\n";
}

} // namespace

Metrics::Metrics()
    : buckets_ms_{{1, 2, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000}} {}

void Metrics::IncInFlight() {
  inflight_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::DecInFlight() {
  inflight_.fetch_sub(1, std::memory_order_relaxed);
}

Metrics::MethodIndex Metrics::method_index(std::string_view method) {
  if (method == "GET") return kGet;
  if (method == "PUT") return kPut;
  if (method == "POST") return kPost;
  if (method == "DELETE") return kDelete;
  if (method == "HEAD") return kHead;
  return kOther;
}

const char* Metrics::method_name(MethodIndex idx) {
  switch (idx) {
    case kGet: return "GET";
    case kPut: return "PUT";
    case kPost: return "POST";
    case kDelete: return "DELETE";
    case kHead: return "HEAD";
    default: return "OTHER";
  }
}

void Metrics::Observe(std::string_view method,
                      unsigned status,
                      std::size_t req_bytes,
                      std::size_t resp_bytes,
                      double latency_ms) {
  MethodIndex idx = method_index(method);
  req_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  req_bytes_[idx].fetch_add(req_bytes, std::memory_order_relaxed);
  resp_bytes_[idx].fetch_add(resp_bytes, std::memory_order_relaxed);
  if (status >= 400) {
    err_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  }

  record_latency(latency_ms, buckets_ms_, bucket_counts_, latency_count_, latency_sum_us_);
}

Metrics::RocksOpIndex Metrics::rocks_op_index(std::string_view op) {
  if (op == "get") return kRdbGet;
  if (op == "put") return kRdbPut;
  if (op == "iter") return kRdbIter;
  return kRdbOther;
}

const char* Metrics::rocks_op_name(RocksOpIndex idx) {
  switch (idx) {
    case kRdbGet: return "get";
    case kRdbPut: return "put";
    case kRdbIter: return "iter";
    default: return "other";
  }
}

void Metrics::ObserveRocksdb(std::string_view op,
                             bool ok,
                             std::size_t bytes,
                             double latency_ms) {
  RocksOpIndex idx = rocks_op_index(op);
  rdb_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  rdb_bytes_[idx].fetch_add(bytes, std::memory_order_relaxed);
  if (!ok) {
    rdb_err_counts_[idx].fetch_add(1, std::memory_order_relaxed);
  }

  record_latency(latency_ms, buckets_ms_, rdb_bucket_counts_, rdb_latency_count_, rdb_latency_sum_us_);
}

Metrics::ServiceIndex Metrics::service_index(std::string_view service) {
  if (service.empty()) return kSvcNone;
  if (service == "iam") return kSvcIam;
  if (service == "sts") return kSvcSts;
  if (service == "s3") return kSvcS3;
  if (service == "ec2") return kSvcEc2;
  return kSvcOther;
}

const char* Metrics::service_name(ServiceIndex idx) {
  switch (idx) {
    case kSvcIam: return "iam";
    case kSvcSts: return "sts";
    case kSvcS3: return "s3";
    case kSvcEc2: return "ec2";
    case kSvcNone: return "none";
    default: return "other";
  }
}

void Metrics::ObserveAuth(auth::OutcomeKind kind, std::string_view service) {
  auto k = static_cast<std::size_t>(kind);
  if (k < kOutcomeCount) {
    auth_outcomes_[k].fetch_add(1, std::memory_order_relaxed);
  }
  ServiceIndex idx = service_index(service);
  auth_by_service_[idx].fetch_add(1, std::memory_order_relaxed);
  if (kind != auth::OutcomeKind::Success) {
    auth_denied_by_service_[idx].fetch_add(1, std::memory_order_relaxed);
  }
}

std::string Metrics::RenderPrometheus() const {
  std::ostringstream oss;

  auto method_label = [](std::size_t i) { return method_name(static_cast<MethodIndex>(i)); };
  write_counters(oss, "iamgw_requests_total", "Total HTTP requests.", "method", req_counts_, method_label);
  write_counters(oss, "iamgw_request_errors_total", "HTTP requests with status >= 400.", "method",
                 err_counts_, method_label);
  write_counters(oss, "iamgw_request_bytes_total", "Request body bytes.", "method", req_bytes_, method_label);
  write_counters(oss, "iamgw_response_bytes_total", "Response body bytes.", "method", resp_bytes_, method_label);

  write_help(oss, "iamgw_inflight_requests", "In-flight HTTP requests.", "gauge");
  oss << "iamgw_inflight_requests " << inflight_.load() << "\n";

  write_histogram(oss, "iamgw_request_latency_ms", "Request latency in milliseconds.",
                  buckets_ms_, bucket_counts_, latency_count_.load(), latency_sum_us_.load());

  auto op_label = [](std::size_t i) { return rocks_op_name(static_cast<RocksOpIndex>(i)); };
  write_counters(oss, "iamgw_rocksdb_ops_total", "RocksDB operations.", "op", rdb_counts_, op_label);
  write_counters(oss, "iamgw_rocksdb_errors_total", "RocksDB operations with non-OK status.", "op",
                 rdb_err_counts_, op_label);
  write_counters(oss, "iamgw_rocksdb_bytes_total", "RocksDB bytes read/written.", "op", rdb_bytes_, op_label);
  write_histogram(oss, "iamgw_rocksdb_latency_ms", "RocksDB operation latency in milliseconds.",
                  buckets_ms_, rdb_bucket_counts_, rdb_latency_count_.load(), rdb_latency_sum_us_.load());

  write_counters(oss, "iamgw_auth_outcomes_total", "Authentication decisions by outcome.", "outcome",
                 auth_outcomes_, [](std::size_t i) { return static_cast<auth::OutcomeKind>(i); });
  auto service_label = [](std::size_t i) { return service_name(static_cast<ServiceIndex>(i)); };
  write_counters(oss, "iamgw_auth_requests_total", "Authentication decisions by service.", "service",
                 auth_by_service_, service_label);
  write_counters(oss, "iamgw_auth_rejected_total", "Rejected requests by service.", "service",
                 auth_denied_by_service_, service_label);

  return oss.str();
}

} // namespace server
