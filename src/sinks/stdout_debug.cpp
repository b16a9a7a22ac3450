#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace edge_twin::sinks {

std::string StdoutDebugSink::format(const core::CycleRecord& record) {
  const auto& snapshot = record.snapshot;
  const double reduction =
      record.decision.optimized_decision.has_value() ? record.decision.optimized_decision->recommended_reduction : 0.0;

  char line[256]{};
  std::snprintf(line, sizeof(line),
                "[scan] mode=%s scenario=%s cpu=%.2f memory=%.2f disk=%.2f grid_load=%.2f score=%.2f reduction=%.2f",
                model::to_string(snapshot.scan_mode), model::to_string(snapshot.scenario), snapshot.cpu_percent,
                snapshot.memory_percent, snapshot.disk_percent, snapshot.industrial.grid_load,
                record.optimization_score, reduction);
  return line;
}

void StdoutDebugSink::publish(const core::CycleRecord& record) const {
  std::printf("%s\n", format(record).c_str());
  std::fflush(stdout);
}

}  // namespace edge_twin::sinks
