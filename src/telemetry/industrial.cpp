#include "telemetry/industrial.hpp"

#include <algorithm>
#include <string>

#include "core/math.hpp"

namespace edge_twin::telemetry {

std::uint64_t stable_hash(const std::string_view text) noexcept {
  std::uint64_t hash = 14695981039346656037ULL;
  for (const char c : text) {
    hash ^= static_cast<unsigned char>(c);
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::string site_id_for(const std::string_view hostname) {
  return "plant-" + std::to_string(stable_hash(hostname) % 7 + 1);
}

model::IndustrialMetrics derive_industrial_metrics(const model::TelemetrySnapshot& snapshot) {
  const double cpu = snapshot.cpu_percent;
  const double memory = snapshot.memory_percent;
  const double disk = snapshot.disk_percent;

  model::IndustrialMetrics metrics{};
  metrics.site_id = site_id_for(snapshot.hostname);
  metrics.energy_usage_kwh = std::max(5.0, core::round2(cpu * 0.85 + memory * 0.45 + disk * 0.25));
  metrics.thermal_index_c = core::round2(24.0 + cpu * 0.36 + (snapshot.fault_flag ? 9.0 : 0.0));
  metrics.grid_load = core::round2(std::clamp((cpu * 0.75 + memory * 0.25) / 100.0, 0.05, 0.99));
  return metrics;
}

}  // namespace edge_twin::telemetry
