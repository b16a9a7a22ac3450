#include <sys/utsname.h>
#include <unistd.h>

#include <cstdlib>
#include <memory>
#include <string>

#include "core/math.hpp"
#include "core/timestamp.hpp"
#include "sensors/cpu.hpp"
#include "sensors/disk.hpp"
#include "sensors/memory.hpp"
#include "sensors/power_supply.hpp"
#include "sensors/processes.hpp"
#include "telemetry/source.hpp"

namespace edge_twin::telemetry {
namespace {

class HostTelemetrySource final : public TelemetrySource {
 public:
  explicit HostTelemetrySource(const std::string& disk_path) : disk_sensor_(disk_path) {
    // Prime the tick counters so the first real sample has a delta.
    model::TelemetrySnapshot scratch{};
    (void)cpu_sensor_.sample(scratch);
  }

  bool available() const override { return cpu_sensor_.available() && memory_sensor_.available(); }

  model::TelemetrySnapshot collect() override {
    model::TelemetrySnapshot snapshot{};
    snapshot.timestamp_ms = core::unix_timestamp_now_ms();
    snapshot.hostname = host_name();
    snapshot.platform = platform_label();

    if (!cpu_sensor_.sample(snapshot)) {
      throw SensorReadError("cpu sensor failed to read /proc/stat");
    }
    if (!memory_sensor_.sample(snapshot)) {
      throw SensorReadError("memory sensor failed to read /proc/meminfo");
    }

    // Optional readers leave their fields zero or unknown on failure.
    (void)disk_sensor_.sample(snapshot);
    (void)power_sensor_.sample(snapshot);
    (void)process_sensor_.sample(snapshot);

    snapshot.cpu_percent = core::round2(snapshot.cpu_percent);
    snapshot.memory_percent = core::round2(snapshot.memory_percent);
    snapshot.disk_percent = core::round2(snapshot.disk_percent);
    if (snapshot.battery_percent.has_value()) {
      snapshot.battery_percent = core::round2(*snapshot.battery_percent);
    }
    return snapshot;
  }

 private:
  sensors::CpuSensor cpu_sensor_{};
  sensors::MemorySensor memory_sensor_{};
  sensors::DiskSensor disk_sensor_;
  sensors::PowerSupplySensor power_sensor_{};
  sensors::ProcessSensor process_sensor_{};
};

class LoadAverageSource final : public TelemetrySource {
 public:
  bool available() const override { return true; }

  model::TelemetrySnapshot collect() override {
    model::TelemetrySnapshot snapshot{};
    snapshot.timestamp_ms = core::unix_timestamp_now_ms();
    snapshot.hostname = host_name();
    snapshot.platform = platform_label();

    double load[1]{0.0};
    if (getloadavg(load, 1) == 1) {
      snapshot.cpu_percent = core::round2(core::clamp_percent(load[0] * 25.0));
    }
    return snapshot;
  }
};

}  // namespace

std::unique_ptr<TelemetrySource> make_host_source(const std::string& disk_path) {
  return std::make_unique<HostTelemetrySource>(disk_path);
}

std::unique_ptr<TelemetrySource> make_loadavg_source() { return std::make_unique<LoadAverageSource>(); }

std::string host_name() {
  char buffer[256]{};
  if (gethostname(buffer, sizeof(buffer) - 1) != 0 || buffer[0] == '\0') {
    return "edge-node";
  }
  return buffer;
}

std::string platform_label() {
  utsname info{};
  if (uname(&info) != 0) {
    return "unknown";
  }
  return std::string(info.sysname) + "-" + info.release + "-" + info.machine;
}

}  // namespace edge_twin::telemetry
