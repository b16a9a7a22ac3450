#pragma once

#include <string>

#include "model/telemetry_snapshot.hpp"

namespace edge_twin::sensors {

// Filesystem usage of the volume holding `path`, reserved blocks excluded.
class DiskSensor {
 public:
  explicit DiskSensor(std::string path = "/");

  bool sample(model::TelemetrySnapshot& snapshot) noexcept;
  [[nodiscard]] const std::string& path() const noexcept { return path_; }

 private:
  std::string path_;
};

}  // namespace edge_twin::sensors
