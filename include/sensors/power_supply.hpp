#pragma once

#include <cstdio>
#include <optional>
#include <string>

#include "model/telemetry_snapshot.hpp"

namespace edge_twin::sensors {

// Battery capacity and AC state from /sys/class/power_supply. Hosts without a
// battery report both as unknown, which is not a failure.
class PowerSupplySensor {
 public:
  struct RawFields {
    std::optional<double> capacity_pct{};
    std::optional<bool> ac_online{};
  };

  PowerSupplySensor();
  explicit PowerSupplySensor(const std::string& power_supply_root);
  PowerSupplySensor(std::FILE* capacity, std::FILE* ac_online, bool owns_files = false);
  ~PowerSupplySensor();

  PowerSupplySensor(const PowerSupplySensor&) = delete;
  PowerSupplySensor& operator=(const PowerSupplySensor&) = delete;
  PowerSupplySensor(PowerSupplySensor&&) = delete;
  PowerSupplySensor& operator=(PowerSupplySensor&&) = delete;

  bool sample(model::TelemetrySnapshot& snapshot) noexcept;
  [[nodiscard]] bool has_battery() const noexcept { return capacity_ != nullptr; }
  const RawFields& raw() const noexcept;

 private:
  void discover(const std::string& power_supply_root);
  static bool read_long(std::FILE* file, long& value) noexcept;

  std::FILE* capacity_{nullptr};
  std::FILE* ac_online_{nullptr};
  bool owns_files_{true};
  RawFields raw_{};
};

}  // namespace edge_twin::sensors
