#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "model/telemetry_snapshot.hpp"

namespace edge_twin::telemetry {

// FNV-1a, stable across runs and builds.
std::uint64_t stable_hash(std::string_view text) noexcept;

// "plant-1" .. "plant-7" keyed on the host name.
std::string site_id_for(std::string_view hostname);

// Expects the scenario override to have been applied already.
model::IndustrialMetrics derive_industrial_metrics(const model::TelemetrySnapshot& snapshot);

}  // namespace edge_twin::telemetry
