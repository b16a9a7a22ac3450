#include "sensors/disk.hpp"

#include <sys/statvfs.h>

#include <utility>

#include "core/math.hpp"

namespace edge_twin::sensors {

DiskSensor::DiskSensor(std::string path) : path_(std::move(path)) {}

bool DiskSensor::sample(model::TelemetrySnapshot& snapshot) noexcept {
  snapshot.disk_percent = 0.0;

  struct statvfs stats {};
  if (statvfs(path_.c_str(), &stats) != 0) {
    return false;
  }

  const auto used = static_cast<double>(stats.f_blocks - stats.f_bfree);
  const auto usable = used + static_cast<double>(stats.f_bavail);
  if (usable <= 0.0) {
    return true;
  }

  snapshot.disk_percent = core::clamp_percent((used / usable) * 100.0);
  return true;
}

}  // namespace edge_twin::sensors
