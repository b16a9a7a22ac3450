#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/cycle_record.hpp"

struct redisContext;

namespace edge_twin::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  // Takes precedence over host/port when set.
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"edge:twin"};
  std::uint32_t connect_timeout_ms{1000};
};

// One TS.MADD sample, keyed relative to the configured prefix.
struct TsSample {
  std::string suffix;
  double value{0.0};
};

// Flattens a committed cycle into the exported series. Battery is omitted
// while unknown.
std::vector<TsSample> cycle_samples(const core::CycleRecord& record, std::uint64_t scan_errors,
                                    double redis_latency_ms);

// Write-only RedisTimeSeries export. Series are created once per connection
// with DUPLICATE_POLICY LAST and labelled with the prefix and metric name.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();

  // Retries once on a fresh connection. False when both attempts fail or the
  // server lacks the TimeSeries module.
  bool publish(const core::CycleRecord& record, std::uint64_t scan_errors);

  static const std::vector<std::string>& metric_suffixes();

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool connect();
  bool prepare_connection();
  bool create_series();
  bool send(const std::vector<TsSample>& samples, std::uint64_t timestamp_ms);

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> args_;
  std::vector<const char*> argv_;
  std::vector<std::size_t> argv_len_;
  double last_latency_ms_{0.0};
  bool module_missing_{false};
};

}  // namespace edge_twin::sinks
