#pragma once

#include <cstdint>
#include <memory>

#include "telemetry/source.hpp"

namespace edge_twin::telemetry {

// host sensors -> out-of-process query -> load average estimate.
class LiveTelemetry {
 public:
  LiveTelemetry(std::unique_ptr<TelemetrySource> host, std::unique_ptr<TelemetrySource> query,
                std::unique_ptr<TelemetrySource> estimate);

  LiveTelemetry(const LiveTelemetry&) = delete;
  LiveTelemetry& operator=(const LiveTelemetry&) = delete;

  // Throws TelemetryError when the chain reaches a failing query. A host
  // SensorReadError is counted and skipped.
  model::TelemetrySnapshot collect();
  model::TelemetrySnapshot collect_estimate();

  std::uint64_t sensor_failures() const noexcept { return sensor_failures_; }

 private:
  std::unique_ptr<TelemetrySource> host_;
  std::unique_ptr<TelemetrySource> query_;
  std::unique_ptr<TelemetrySource> estimate_;
  std::uint64_t sensor_failures_{0};
  bool host_was_ok_{true};
};

}  // namespace edge_twin::telemetry
