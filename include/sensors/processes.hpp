#pragma once

#include <string>

#include "model/telemetry_snapshot.hpp"

namespace edge_twin::sensors {

class ProcessSensor {
 public:
  explicit ProcessSensor(std::string proc_root = "/proc");

  bool sample(model::TelemetrySnapshot& snapshot) noexcept;

 private:
  std::string proc_root_;
};

}  // namespace edge_twin::sensors
