#include "sinks/redis_ts.hpp"

#include <cctype>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace edge_twin::sinks {
namespace {

struct ReplyDeleter {
  void operator()(redisReply* reply) const {
    if (reply != nullptr) {
      freeReplyObject(reply);
    }
  }
};

using Reply = std::unique_ptr<redisReply, ReplyDeleter>;

template <typename... Args>
Reply command(redisContext* context, const char* format, Args... args) {
  return Reply(static_cast<redisReply*>(redisCommand(context, format, args...)));
}

bool is_error(const Reply& reply, const char* needle = nullptr) {
  if (reply == nullptr || reply->type != REDIS_REPLY_ERROR) {
    return false;
  }
  return needle == nullptr || (reply->str != nullptr && std::strstr(reply->str, needle) != nullptr);
}

const char* error_text(const Reply& reply) {
  return reply != nullptr && reply->str != nullptr ? reply->str : "no reply";
}

// "Decision Stability" -> "health:decision_stability"
std::string health_suffix(const std::string& name) {
  std::string out = "health:";
  for (const char c : name) {
    out.push_back(c == ' ' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

}  // namespace

std::vector<TsSample> cycle_samples(const core::CycleRecord& record, const std::uint64_t scan_errors,
                                    const double redis_latency_ms) {
  const auto& snapshot = record.snapshot;
  const auto& optimized = record.decision.optimized_decision;

  std::vector<TsSample> samples{
      {"raw:cpu", snapshot.cpu_percent},
      {"raw:memory", snapshot.memory_percent},
      {"raw:disk", snapshot.disk_percent},
  };
  if (snapshot.battery_percent.has_value()) {
    samples.push_back({"raw:battery", *snapshot.battery_percent});
  }
  samples.push_back({"raw:processes", static_cast<double>(snapshot.process_count)});
  samples.push_back({"industrial:grid_load", snapshot.industrial.grid_load});
  samples.push_back({"industrial:energy_usage", snapshot.industrial.energy_usage_kwh});
  samples.push_back({"industrial:thermal_index", snapshot.industrial.thermal_index_c});
  samples.push_back({"score:optimization", record.optimization_score});
  samples.push_back({"decision:reduction", optimized.has_value() ? optimized->recommended_reduction : 0.0});
  samples.push_back({"decision:stability", decision::stability_score(record.decision)});
  for (const auto& metric : record.health) {
    samples.push_back({health_suffix(metric.name), metric.value});
  }
  samples.push_back({"agent:scan_errors", static_cast<double>(scan_errors)});
  samples.push_back({"agent:redis_latency", redis_latency_ms});
  samples.push_back({"agent:fault", snapshot.fault_flag ? 1.0 : 0.0});
  return samples;
}

const std::vector<std::string>& RedisTsSink::metric_suffixes() {
  static const std::vector<std::string> kSuffixes = {
      "raw:cpu",
      "raw:memory",
      "raw:disk",
      "raw:battery",
      "raw:processes",
      "industrial:grid_load",
      "industrial:energy_usage",
      "industrial:thermal_index",
      "score:optimization",
      "decision:reduction",
      "decision:stability",
      "health:cpu_headroom",
      "health:memory_headroom",
      "health:grid_resilience",
      "health:power_health",
      "health:decision_stability",
      "agent:scan_errors",
      "agent:redis_latency",
      "agent:fault",
  };
  return kSuffixes;
}

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  const std::size_t max_args = 1 + metric_suffixes().size() * 3;
  args_.reserve(max_args);
  argv_.reserve(max_args);
  argv_len_.reserve(max_args);
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::check_connectivity() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return connect();
}

bool RedisTsSink::connect() {
  context_.reset();
  if (module_missing_) {
    return false;
  }

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = options_.unix_socket.empty()
                          ? redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout)
                          : redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  if (raw == nullptr) {
    std::cerr << "[redis] connect failed: out of memory\n";
    return false;
  }
  context_.reset(raw);
  if (context_->err != REDIS_OK) {
    std::cerr << "[redis] connect failed: " << context_->errstr << '\n';
    context_.reset();
    return false;
  }

  if (!prepare_connection() || !create_series()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::prepare_connection() {
  if (!options_.password.empty()) {
    const Reply reply = command(context_.get(), "AUTH %s", options_.password.c_str());
    if (reply == nullptr || is_error(reply)) {
      std::cerr << "[redis] AUTH rejected: " << error_text(reply) << '\n';
      return false;
    }
  }

  if (options_.db != 0) {
    const Reply reply = command(context_.get(), "SELECT %d", options_.db);
    if (reply == nullptr || is_error(reply)) {
      std::cerr << "[redis] SELECT " << options_.db << " failed: " << error_text(reply) << '\n';
      return false;
    }
  }
  return true;
}

bool RedisTsSink::create_series() {
  for (const auto& suffix : metric_suffixes()) {
    const std::string key = options_.key_prefix + ":" + suffix;
    const Reply reply = command(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST LABELS prefix %s metric %s",
                                key.c_str(), options_.key_prefix.c_str(), suffix.c_str());
    if (reply == nullptr) {
      return false;
    }
    if (is_error(reply, "unknown command")) {
      std::cerr << "[redis] RedisTimeSeries module not available; export disabled\n";
      module_missing_ = true;
      return false;
    }
    if (is_error(reply) && !is_error(reply, "already exists")) {
      std::cerr << "[redis] TS.CREATE " << key << " failed: " << error_text(reply) << '\n';
      return false;
    }
  }
  return true;
}

bool RedisTsSink::publish(const core::CycleRecord& record, const std::uint64_t scan_errors) {
  if (!check_connectivity()) {
    return false;
  }

  const auto samples = cycle_samples(record, scan_errors, last_latency_ms_);
  if (send(samples, record.snapshot.timestamp_ms)) {
    return true;
  }
  return connect() && send(samples, record.snapshot.timestamp_ms);
}

bool RedisTsSink::send(const std::vector<TsSample>& samples, const std::uint64_t timestamp_ms) {
  const std::string timestamp = std::to_string(timestamp_ms);

  args_.clear();
  args_.emplace_back("TS.MADD");
  for (const auto& sample : samples) {
    args_.push_back(options_.key_prefix + ":" + sample.suffix);
    args_.push_back(timestamp);
    args_.push_back(std::to_string(std::isfinite(sample.value) ? sample.value : 0.0));
  }

  argv_.clear();
  argv_len_.clear();
  for (const auto& arg : args_) {
    argv_.push_back(arg.c_str());
    argv_len_.push_back(arg.size());
  }

  const auto started = std::chrono::steady_clock::now();
  const Reply reply(static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(argv_.size()), argv_.data(), argv_len_.data())));
  last_latency_ms_ = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

  return reply != nullptr && !is_error(reply);
}

}  // namespace edge_twin::sinks
