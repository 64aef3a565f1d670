#pragma once

#include "error_flavor.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace server {

class Metrics {
public:
  Metrics();

  void IncInFlight();
  void DecInFlight();

  void Observe(std::string_view method,
               unsigned status,
               std::size_t req_bytes,
               std::size_t resp_bytes,
               double latency_ms);

  void ObserveRocksdb(std::string_view op,
                      bool ok,
                      std::size_t bytes,
                      double latency_ms);

  // One authentication decision, by outcome and by service of the
  // credential scope ("none" when the header could not be parsed).
  void ObserveAuth(auth::OutcomeKind kind, std::string_view service);

  std::string RenderPrometheus() const;

private:
  enum MethodIndex {
    kGet = 0,
    kPut = 1,
    kPost = 2,
    kDelete = 3,
    kHead = 4,
    kOther = 5,
    kMethodCount = 6,
  };

  static MethodIndex method_index(std::string_view method);
  static const char* method_name(MethodIndex idx);

  static constexpr std::size_t kBucketCount = 13;

  std::array<std::atomic<std::uint64_t>, kMethodCount> req_counts_{};
  std::array<std::atomic<std::uint64_t>, kMethodCount> err_counts_{};
  std::array<std::atomic<std::uint64_t>, kMethodCount> req_bytes_{};
  std::array<std::atomic<std::uint64_t>, kMethodCount> resp_bytes_{};

  std::atomic<std::uint64_t> latency_count_{0};
  std::atomic<std::uint64_t> latency_sum_us_{0};
  std::array<double, kBucketCount> buckets_ms_{};
  std::array<std::atomic<std::uint64_t>, kBucketCount> bucket_counts_{};

  std::atomic<std::int64_t> inflight_{0};

  enum RocksOpIndex {
    kRdbGet = 0,
    kRdbPut = 1,
    kRdbIter = 2,
    kRdbOther = 3,
    kRdbOpCount = 4,
  };

  static RocksOpIndex rocks_op_index(std::string_view op);
  static const char* rocks_op_name(RocksOpIndex idx);

  std::array<std::atomic<std::uint64_t>, kRdbOpCount> rdb_counts_{};
  std::array<std::atomic<std::uint64_t>, kRdbOpCount> rdb_err_counts_{};
  std::array<std::atomic<std::uint64_t>, kRdbOpCount> rdb_bytes_{};

  std::atomic<std::uint64_t> rdb_latency_count_{0};
  std::atomic<std::uint64_t> rdb_latency_sum_us_{0};
  std::array<std::atomic<std::uint64_t>, kBucketCount> rdb_bucket_counts_{};

  enum ServiceIndex {
    kSvcIam = 0,
    kSvcSts = 1,
    kSvcS3 = 2,
    kSvcEc2 = 3,
    kSvcOther = 4,
    kSvcNone = 5,
    kServiceCount = 6,
  };

  static constexpr std::size_t kOutcomeCount =
      static_cast<std::size_t>(auth::OutcomeKind::InternalFailure) + 1;

  static ServiceIndex service_index(std::string_view service);
  static const char* service_name(ServiceIndex idx);

  std::array<std::atomic<std::uint64_t>, kOutcomeCount> auth_outcomes_{};
  std::array<std::atomic<std::uint64_t>, kServiceCount> auth_by_service_{};
  std::array<std::atomic<std::uint64_t>, kServiceCount> auth_denied_by_service_{};
};

} // namespace server
