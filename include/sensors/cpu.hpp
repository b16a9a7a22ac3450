#pragma once

#include <cstdint>
#include <cstdio>

#include "model/telemetry_snapshot.hpp"

namespace edge_twin::sensors {

// Aggregate jiffies from the "cpu " line of /proc/stat. iowait counts as idle;
// guest time is already folded into user and nice.
struct CpuTicks {
  std::uint64_t busy{0};
  std::uint64_t idle{0};

  std::uint64_t total() const noexcept { return busy + idle; }
};

bool parse_cpu_ticks(const char* line, CpuTicks& ticks) noexcept;

class CpuSensor {
 public:
  CpuSensor();
  explicit CpuSensor(std::FILE* file, bool owns_file = false);
  ~CpuSensor();

  CpuSensor(const CpuSensor&) = delete;
  CpuSensor& operator=(const CpuSensor&) = delete;

  // Busy percentage since the previous call. The first call primes the
  // baseline and a counter that went backwards reports 0.
  bool sample(model::TelemetrySnapshot& snapshot) noexcept;
  [[nodiscard]] bool available() const noexcept { return file_ != nullptr; }

 private:
  std::FILE* file_{nullptr};
  bool owns_file_{true};
  CpuTicks previous_{};
  bool primed_{false};
};

}  // namespace edge_twin::sensors
