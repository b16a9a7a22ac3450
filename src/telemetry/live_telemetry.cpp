#include "telemetry/live_telemetry.hpp"

#include <iostream>
#include <utility>

namespace edge_twin::telemetry {

LiveTelemetry::LiveTelemetry(std::unique_ptr<TelemetrySource> host, std::unique_ptr<TelemetrySource> query,
                             std::unique_ptr<TelemetrySource> estimate)
    : host_(std::move(host)), query_(std::move(query)), estimate_(std::move(estimate)) {
  if (!estimate_) {
    estimate_ = make_loadavg_source();
  }
}

model::TelemetrySnapshot LiveTelemetry::collect() {
  if (host_ && host_->available()) {
    try {
      model::TelemetrySnapshot snapshot = host_->collect();
      if (!host_was_ok_) {
        std::cerr << "[telemetry] host sensors recovered\n";
        host_was_ok_ = true;
      }
      return snapshot;
    } catch (const SensorReadError& ex) {
      ++sensor_failures_;
      if (host_was_ok_) {
        std::cerr << "[telemetry] " << ex.what() << "; falling back\n";
        host_was_ok_ = false;
      }
    }
  }
  if (query_ && query_->available()) {
    return query_->collect();
  }
  return estimate_->collect();
}

model::TelemetrySnapshot LiveTelemetry::collect_estimate() { return estimate_->collect(); }

}  // namespace edge_twin::telemetry
