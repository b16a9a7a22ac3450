#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/process.hpp"
#include "model/telemetry_snapshot.hpp"

namespace edge_twin::telemetry {

class TelemetryError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A host sensor stopped reading after it opened. LiveTelemetry moves on to the
// next source instead of failing the scan.
class SensorReadError : public TelemetryError {
 public:
  using TelemetryError::TelemetryError;
};

class TelemetrySource {
 public:
  virtual bool available() const = 0;
  virtual model::TelemetrySnapshot collect() = 0;
  virtual ~TelemetrySource() = default;
};

// procfs/sysfs readers; unavailable when /proc/stat or /proc/meminfo cannot be opened.
// collect() throws SensorReadError when either of them fails to read.
std::unique_ptr<TelemetrySource> make_host_source(const std::string& disk_path);

// Runs `argv` and parses a JSON object with cpu_percent, memory_percent,
// disk_percent, battery_percent, power_plugged and process_count. collect()
// throws TelemetryError on a failed, timed out or malformed query.
std::unique_ptr<TelemetrySource> make_command_source(std::vector<std::string> argv, std::chrono::milliseconds timeout,
                                                     core::CommandRunner runner = core::run_command);

// cpu from the 1-minute load average, everything else unknown or zero.
std::unique_ptr<TelemetrySource> make_loadavg_source();

std::string host_name();
std::string platform_label();

}  // namespace edge_twin::telemetry
