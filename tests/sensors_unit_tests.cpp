#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include "core/process.hpp"
#include "model/telemetry_snapshot.hpp"
#include "scenario/scenario_injector.hpp"
#include "sensors/cpu.hpp"
#include "sensors/disk.hpp"
#include "sensors/memory.hpp"
#include "sensors/power_supply.hpp"
#include "sensors/processes.hpp"
#include "telemetry/blend.hpp"
#include "telemetry/industrial.hpp"
#include "telemetry/live_telemetry.hpp"
#include "telemetry/simulator.hpp"
#include "telemetry/source.hpp"

using edge_twin::core::CommandResult;
using edge_twin::model::RuntimeMode;
using edge_twin::model::Scenario;
using edge_twin::model::TelemetrySnapshot;
using edge_twin::scenario::ScenarioInjector;
using edge_twin::sensors::CpuSensor;
using edge_twin::sensors::DiskSensor;
using edge_twin::sensors::MemorySensor;
using edge_twin::sensors::PowerSupplySensor;
using edge_twin::sensors::ProcessSensor;
using edge_twin::telemetry::SimulatedTelemetry;
using edge_twin::telemetry::TelemetryError;

namespace {

bool almost_equal(double a, double b, double eps = 1e-6) { return std::fabs(a - b) <= eps; }

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool write_temp_file(std::FILE* file, const std::string& content) {
  if (file == nullptr) {
    return false;
  }
  const int fd = fileno(file);
  if (fd < 0) {
    return false;
  }
  if (ftruncate(fd, 0) != 0) {
    return false;
  }
  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    return false;
  }
  if (!content.empty() && std::fwrite(content.data(), 1, content.size(), file) != content.size()) {
    return false;
  }
  std::fflush(file);
  return std::fseek(file, 0L, SEEK_SET) == 0;
}

std::filesystem::path make_temp_dir() {
  char pattern[] = "/tmp/edge_twin_test_XXXXXX";
  const char* dir = mkdtemp(pattern);
  return dir != nullptr ? std::filesystem::path(dir) : std::filesystem::path{};
}

void write_text(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path);
  out << content;
}

class FakeSource final : public edge_twin::telemetry::TelemetrySource {
 public:
  FakeSource(bool available, double cpu) : available_(available), cpu_(cpu) {}

  bool available() const override { return available_; }

  TelemetrySnapshot collect() override {
    TelemetrySnapshot snapshot{};
    snapshot.hostname = "fake-host";
    snapshot.cpu_percent = cpu_;
    return snapshot;
  }

 private:
  bool available_;
  double cpu_;
};

// Fails its first `failures` collections the way an unreadable /proc/stat does.
class FlakyHostSource final : public edge_twin::telemetry::TelemetrySource {
 public:
  explicit FlakyHostSource(int failures) : failures_(failures) {}

  bool available() const override { return true; }

  TelemetrySnapshot collect() override {
    if (failures_ > 0) {
      --failures_;
      throw edge_twin::telemetry::SensorReadError("cpu sensor failed to read /proc/stat");
    }
    TelemetrySnapshot snapshot{};
    snapshot.cpu_percent = 11.0;
    return snapshot;
  }

 private:
  int failures_;
};

int test_cpu_sensor_with_injected_proc_stat() {
  std::FILE* stat_file = std::tmpfile();
  if (!write_temp_file(stat_file, "cpu  100 20 30 400 50 0 0 0 0 0\n")) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "failed writing first proc/stat snapshot");
  }

  CpuSensor sensor(stat_file, false);
  TelemetrySnapshot snapshot{};
  if (!sensor.sample(snapshot) || !almost_equal(snapshot.cpu_percent, 0.0)) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "first sample should initialize baseline");
  }

  if (!write_temp_file(stat_file, "cpu  140 30 40 420 60 0 0 0 0 0\n")) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "failed writing second proc/stat snapshot");
  }

  if (!sensor.sample(snapshot) || !almost_equal(snapshot.cpu_percent, 66.6667, 1e-3)) {
    return fail("test_cpu_sensor_with_injected_proc_stat", "computed utilization mismatch");
  }

  std::fclose(stat_file);
  return 0;
}

int test_cpu_sensor_counter_reset_reports_zero() {
  std::FILE* stat_file = std::tmpfile();
  if (!write_temp_file(stat_file, "cpu  500 0 0 500 0 0 0 0 0 0\n")) {
    return fail("test_cpu_sensor_counter_reset_reports_zero", "failed writing proc/stat");
  }

  CpuSensor sensor(stat_file, false);
  TelemetrySnapshot snapshot{};
  sensor.sample(snapshot);

  if (!write_temp_file(stat_file, "cpu  10 0 0 10 0 0 0 0 0 0\n")) {
    return fail("test_cpu_sensor_counter_reset_reports_zero", "failed writing reset proc/stat");
  }

  if (!sensor.sample(snapshot) || !almost_equal(snapshot.cpu_percent, 0.0)) {
    return fail("test_cpu_sensor_counter_reset_reports_zero", "counter reset should not produce a spike");
  }

  std::fclose(stat_file);
  return 0;
}

int test_cpu_tick_parser() {
  edge_twin::sensors::CpuTicks ticks{};
  if (!edge_twin::sensors::parse_cpu_ticks("cpu  1 2 3 4\n", ticks) || ticks.busy != 6 || ticks.idle != 4) {
    return fail("test_cpu_tick_parser", "short cpu line should parse the first four fields");
  }
  if (!edge_twin::sensors::parse_cpu_ticks("cpu 10 0 5 100 20 1 2 3 7 0\n", ticks) || ticks.busy != 21 ||
      ticks.idle != 120 || ticks.total() != 141) {
    return fail("test_cpu_tick_parser", "iowait should be idle and guest time ignored");
  }
  if (edge_twin::sensors::parse_cpu_ticks("cpu0 1 2 3 4\n", ticks) ||
      edge_twin::sensors::parse_cpu_ticks("intr 55\n", ticks) ||
      edge_twin::sensors::parse_cpu_ticks("cpu  1 2\n", ticks)) {
    return fail("test_cpu_tick_parser", "per-core, foreign and truncated lines should be rejected");
  }
  return 0;
}

int test_memory_sensor_used_percent() {
  std::FILE* meminfo = std::tmpfile();
  if (!write_temp_file(meminfo, "MemTotal:       1000 kB\nMemFree:         100 kB\nMemAvailable:    250 kB\n")) {
    return fail("test_memory_sensor_used_percent", "failed writing meminfo");
  }

  MemorySensor sensor(meminfo, true);
  TelemetrySnapshot snapshot{};
  if (!sensor.sample(snapshot)) {
    return fail("test_memory_sensor_used_percent", "sample should succeed");
  }

  if (!almost_equal(snapshot.memory_percent, 75.0)) {
    return fail("test_memory_sensor_used_percent", "used percent should be (total - available) / total");
  }

  if (sensor.raw().mem_total_kb != 1000 || sensor.raw().mem_available_kb != 250) {
    return fail("test_memory_sensor_used_percent", "raw fields parsed incorrectly");
  }
  return 0;
}

int test_memory_sensor_without_mem_available() {
  std::FILE* meminfo = std::tmpfile();
  if (!write_temp_file(meminfo, "MemTotal:       1000 kB\nMemFree:         200 kB\nBuffers:         100 kB\n"
                                "Cached:          200 kB\nSwapCached:       50 kB\n")) {
    return fail("test_memory_sensor_without_mem_available", "failed writing meminfo");
  }

  MemorySensor sensor(meminfo, true);
  TelemetrySnapshot snapshot{};
  if (!sensor.sample(snapshot) || !almost_equal(snapshot.memory_percent, 50.0)) {
    return fail("test_memory_sensor_without_mem_available", "available should fall back to free + buffers + cached");
  }
  return 0;
}

int test_memory_sensor_missing_total_fails() {
  std::FILE* meminfo = std::tmpfile();
  if (!write_temp_file(meminfo, "MemFree:         100 kB\n")) {
    return fail("test_memory_sensor_missing_total_fails", "failed writing meminfo");
  }

  MemorySensor sensor(meminfo, true);
  TelemetrySnapshot snapshot{};
  snapshot.memory_percent = 42.0;
  if (sensor.sample(snapshot) || !almost_equal(snapshot.memory_percent, 0.0)) {
    return fail("test_memory_sensor_missing_total_fails", "missing MemTotal should fail and zero the field");
  }
  return 0;
}

int test_disk_sensor_bounds() {
  DiskSensor root("/");
  TelemetrySnapshot snapshot{};
  if (!root.sample(snapshot)) {
    return fail("test_disk_sensor_bounds", "statvfs on / should succeed");
  }
  if (snapshot.disk_percent < 0.0 || snapshot.disk_percent > 100.0) {
    return fail("test_disk_sensor_bounds", "disk percent out of range");
  }

  DiskSensor missing("/definitely/not/a/mount/point");
  if (missing.sample(snapshot) || !almost_equal(snapshot.disk_percent, 0.0)) {
    return fail("test_disk_sensor_bounds", "missing path should fail and zero the field");
  }
  return 0;
}

int test_power_supply_sensor_injected_files() {
  std::FILE* capacity = std::tmpfile();
  std::FILE* online = std::tmpfile();
  if (!write_temp_file(capacity, "42\n") || !write_temp_file(online, "1\n")) {
    return fail("test_power_supply_sensor_injected_files", "failed writing power supply files");
  }

  PowerSupplySensor sensor(capacity, online, true);
  TelemetrySnapshot snapshot{};
  if (!sensor.sample(snapshot)) {
    return fail("test_power_supply_sensor_injected_files", "sample should succeed");
  }

  if (!snapshot.battery_percent.has_value() || !almost_equal(*snapshot.battery_percent, 42.0)) {
    return fail("test_power_supply_sensor_injected_files", "battery capacity mismatch");
  }
  if (!snapshot.power_plugged.has_value() || !*snapshot.power_plugged) {
    return fail("test_power_supply_sensor_injected_files", "AC online should report plugged");
  }
  return 0;
}

int test_power_supply_sensor_without_battery() {
  std::FILE* online = std::tmpfile();
  if (!write_temp_file(online, "1\n")) {
    return fail("test_power_supply_sensor_without_battery", "failed writing online file");
  }

  PowerSupplySensor sensor(nullptr, online, true);
  TelemetrySnapshot snapshot{};
  sensor.sample(snapshot);

  if (sensor.has_battery() || snapshot.battery_percent.has_value() || snapshot.power_plugged.has_value()) {
    return fail("test_power_supply_sensor_without_battery", "desktop hosts should report battery and plug unknown");
  }
  return 0;
}

int test_power_supply_sensor_discovery() {
  const auto root = make_temp_dir();
  if (root.empty()) {
    return fail("test_power_supply_sensor_discovery", "mkdtemp failed");
  }

  write_text(root / "BAT0" / "type", "Battery\n");
  write_text(root / "BAT0" / "capacity", "17\n");
  write_text(root / "AC" / "type", "Mains\n");
  write_text(root / "AC" / "online", "0\n");

  int rc = 0;
  {
    PowerSupplySensor sensor(root.string());
    TelemetrySnapshot snapshot{};
    sensor.sample(snapshot);

    if (!sensor.has_battery() || !snapshot.battery_percent.has_value() ||
        !almost_equal(*snapshot.battery_percent, 17.0)) {
      rc = fail("test_power_supply_sensor_discovery", "battery should be discovered by type");
    } else if (!snapshot.power_plugged.has_value() || *snapshot.power_plugged) {
      rc = fail("test_power_supply_sensor_discovery", "mains offline should report unplugged");
    }
  }

  std::filesystem::remove_all(root);
  return rc;
}

int test_process_sensor_counts_numeric_entries() {
  const auto root = make_temp_dir();
  if (root.empty()) {
    return fail("test_process_sensor_counts_numeric_entries", "mkdtemp failed");
  }

  for (const char* name : {"1", "22", "333", "self", "abc1", "1x"}) {
    std::filesystem::create_directories(root / name);
  }

  ProcessSensor sensor(root.string());
  TelemetrySnapshot snapshot{};
  const bool ok = sensor.sample(snapshot);
  std::filesystem::remove_all(root);

  if (!ok || snapshot.process_count != 3) {
    return fail("test_process_sensor_counts_numeric_entries", "only all-digit names are processes");
  }
  return 0;
}

int test_simulator_is_seeded_and_bounded() {
  SimulatedTelemetry first(1234);
  SimulatedTelemetry second(1234);

  for (int i = 0; i < 2000; ++i) {
    const auto a = first.collect();
    const auto b = second.collect();

    if (!almost_equal(a.cpu_percent, b.cpu_percent) || a.process_count != b.process_count ||
        a.battery_percent != b.battery_percent || a.power_plugged != b.power_plugged) {
      return fail("test_simulator_is_seeded_and_bounded", "same seed should replay the same trajectory");
    }

    if (a.cpu_percent < 8.0 || a.cpu_percent > 96.0 || a.memory_percent < 20.0 || a.memory_percent > 96.0 ||
        a.disk_percent < 20.0 || a.disk_percent > 98.0) {
      return fail("test_simulator_is_seeded_and_bounded", "walk escaped its bounds");
    }
    if (a.process_count < 40 || a.process_count > 600) {
      return fail("test_simulator_is_seeded_and_bounded", "process count escaped its bounds");
    }
    if (!a.battery_percent.has_value() || *a.battery_percent < 8.0 || *a.battery_percent > 100.0) {
      return fail("test_simulator_is_seeded_and_bounded", "battery escaped its bounds");
    }
    if (a.hostname != "digital-twin-edge" || a.grid_status != "healthy" || a.fault_flag) {
      return fail("test_simulator_is_seeded_and_bounded", "simulated identity mismatch");
    }
  }
  return 0;
}

int test_simulator_first_step_stays_near_initial_state() {
  SimulatedTelemetry simulator(7);
  const auto snapshot = simulator.collect();

  if (std::fabs(snapshot.cpu_percent - 38.0) > 7.0 + 0.01 || std::fabs(snapshot.memory_percent - 52.0) > 4.0 + 0.01) {
    return fail("test_simulator_first_step_stays_near_initial_state", "first step exceeded its delta");
  }
  if (snapshot.power_plugged != std::optional<bool>(false) || *snapshot.battery_percent >= 78.0) {
    return fail("test_simulator_first_step_stays_near_initial_state", "unplugged battery should drain");
  }
  return 0;
}

int test_blend_weights_and_preferences() {
  TelemetrySnapshot edge{};
  edge.hostname = "edge-01";
  edge.platform = "Linux-6.8-x86_64";
  edge.cpu_percent = 80.0;
  edge.memory_percent = 50.0;
  edge.disk_percent = 30.0;
  edge.process_count = 100;

  TelemetrySnapshot simulated{};
  simulated.hostname = "digital-twin-edge";
  simulated.cpu_percent = 40.0;
  simulated.memory_percent = 70.0;
  simulated.disk_percent = 60.0;
  simulated.process_count = 200;
  simulated.battery_percent = 55.5;
  simulated.power_plugged = true;
  simulated.fault_flag = true;
  simulated.grid_status = "healthy";

  const auto blended = edge_twin::telemetry::blend(edge, simulated);

  if (!almost_equal(blended.cpu_percent, 80.0 * 0.65 + 40.0 * 0.35)) {
    return fail("test_blend_weights_and_preferences", "cpu should be edge*0.65 + sim*0.35");
  }
  if (!almost_equal(blended.memory_percent, 57.0) || !almost_equal(blended.disk_percent, 40.5)) {
    return fail("test_blend_weights_and_preferences", "memory/disk blend mismatch");
  }
  if (blended.process_count != 135) {
    return fail("test_blend_weights_and_preferences", "process count should round to an integer");
  }
  if (blended.battery_percent != std::optional<double>(55.5) || blended.power_plugged != std::optional<bool>(true)) {
    return fail("test_blend_weights_and_preferences", "missing edge battery should fall back to simulated");
  }
  if (!blended.fault_flag || blended.grid_status != "healthy") {
    return fail("test_blend_weights_and_preferences", "fault should be OR of both, grid from simulated");
  }
  if (blended.hostname != "edge-01" || blended.platform != "Hybrid (Linux-6.8-x86_64 + simulation)") {
    return fail("test_blend_weights_and_preferences", "identity should come from the edge");
  }
  if (blended.scan_mode != RuntimeMode::HYBRID) {
    return fail("test_blend_weights_and_preferences", "blend should be labelled HYBRID");
  }

  edge.battery_percent = 90.0;
  edge.grid_status = "stressed";
  const auto edge_first = edge_twin::telemetry::blend(edge, simulated);
  if (edge_first.battery_percent != std::optional<double>(90.0) || edge_first.grid_status != "stressed") {
    return fail("test_blend_weights_and_preferences", "edge values should win when present");
  }
  return 0;
}

int test_industrial_metrics_derivation() {
  TelemetrySnapshot snapshot{};
  snapshot.hostname = "edge-01";
  snapshot.cpu_percent = 60.0;
  snapshot.memory_percent = 20.0;
  snapshot.disk_percent = 20.0;

  auto metrics = edge_twin::telemetry::derive_industrial_metrics(snapshot);
  if (!almost_equal(metrics.energy_usage_kwh, 65.0) || !almost_equal(metrics.thermal_index_c, 45.6) ||
      !almost_equal(metrics.grid_load, 0.5)) {
    return fail("test_industrial_metrics_derivation", "industrial formulas mismatch");
  }

  snapshot.fault_flag = true;
  metrics = edge_twin::telemetry::derive_industrial_metrics(snapshot);
  if (!almost_equal(metrics.thermal_index_c, 54.6)) {
    return fail("test_industrial_metrics_derivation", "fault should add 9 C to the thermal index");
  }

  TelemetrySnapshot idle{};
  idle.hostname = "edge-01";
  metrics = edge_twin::telemetry::derive_industrial_metrics(idle);
  if (!almost_equal(metrics.energy_usage_kwh, 5.0) || !almost_equal(metrics.grid_load, 0.05)) {
    return fail("test_industrial_metrics_derivation", "idle host should hit the energy and grid floors");
  }

  const auto site = edge_twin::telemetry::site_id_for("edge-01");
  if (site != metrics.site_id || site.rfind("plant-", 0) != 0) {
    return fail("test_industrial_metrics_derivation", "site id should be stable per host");
  }
  const int plant = std::stoi(site.substr(6));
  if (plant < 1 || plant > 7) {
    return fail("test_industrial_metrics_derivation", "site number out of range");
  }
  return 0;
}

int test_scenario_peak_load_runs_for_requested_cycles() {
  ScenarioInjector injector;
  injector.set("peak_load", 3);

  for (int cycle = 1; cycle <= 3; ++cycle) {
    TelemetrySnapshot snapshot{};
    snapshot.cpu_percent = 20.0;
    snapshot.process_count = 100;
    const bool completed = injector.apply(snapshot);

    if (snapshot.cpu_percent < 92.0 || snapshot.memory_percent < 88.0 || snapshot.disk_percent < 78.0 ||
        snapshot.process_count < 450 || snapshot.grid_status != "stressed" || snapshot.fault_flag) {
      return fail("test_scenario_peak_load_runs_for_requested_cycles", "peak_load override not applied");
    }
    if (completed != (cycle == 3)) {
      return fail("test_scenario_peak_load_runs_for_requested_cycles", "completion should fire on the last cycle");
    }
    if (snapshot.scenario != (cycle == 3 ? Scenario::NORMAL : Scenario::PEAK_LOAD)) {
      return fail("test_scenario_peak_load_runs_for_requested_cycles", "last cycle should be labelled normal");
    }
  }

  if (injector.scenario() != Scenario::NORMAL || injector.cycles_left() != 0) {
    return fail("test_scenario_peak_load_runs_for_requested_cycles", "scenario should revert to normal");
  }

  TelemetrySnapshot after{};
  after.cpu_percent = 20.0;
  after.fault_flag = true;
  after.grid_status = "down";
  if (injector.apply(after) || after.cpu_percent != 20.0 || after.fault_flag || after.grid_status != "healthy") {
    return fail("test_scenario_peak_load_runs_for_requested_cycles", "normal should clear fault and leave load");
  }
  return 0;
}

int test_scenario_low_load_and_grid_failure() {
  ScenarioInjector injector;
  injector.set(Scenario::LOW_LOAD, 5);

  TelemetrySnapshot busy{};
  busy.cpu_percent = 90.0;
  busy.memory_percent = 90.0;
  busy.process_count = 900;
  injector.apply(busy);
  if (busy.cpu_percent > 18.0 || busy.memory_percent > 40.0 || busy.process_count != 120 ||
      busy.grid_status != "relaxed") {
    return fail("test_scenario_low_load_and_grid_failure", "low_load override mismatch");
  }

  TelemetrySnapshot quiet{};
  quiet.process_count = 3;
  injector.apply(quiet);
  if (quiet.process_count != 30) {
    return fail("test_scenario_low_load_and_grid_failure", "low_load should floor processes at 30");
  }

  injector.set(" GRID_FAILURE ", 2);
  TelemetrySnapshot grid{};
  injector.apply(grid);
  if (grid.cpu_percent < 72.0 || grid.memory_percent < 70.0 || !grid.fault_flag || grid.grid_status != "down" ||
      grid.scenario != Scenario::GRID_FAILURE) {
    return fail("test_scenario_low_load_and_grid_failure", "grid_failure override mismatch");
  }
  return 0;
}

int test_scenario_validation_and_clamping() {
  ScenarioInjector injector;
  try {
    injector.set("meteor_strike", 3);
    return fail("test_scenario_validation_and_clamping", "unknown scenario should throw");
  } catch (const std::invalid_argument&) {
  }
  if (injector.scenario() != Scenario::NORMAL) {
    return fail("test_scenario_validation_and_clamping", "rejected set should leave state untouched");
  }

  injector.set("peak_load", 1000);
  if (injector.cycles_left() != ScenarioInjector::kMaxCycles) {
    return fail("test_scenario_validation_and_clamping", "cycles should clamp to 240");
  }
  injector.set("peak_load", 0);
  if (injector.cycles_left() != 1) {
    return fail("test_scenario_validation_and_clamping", "non-normal scenario should run at least once");
  }
  injector.set("normal", 50);
  if (injector.cycles_left() != 0) {
    return fail("test_scenario_validation_and_clamping", "normal should carry no counter");
  }
  return 0;
}

int test_command_source_parses_json() {
  std::vector<std::string> seen_argv;
  auto runner = [&seen_argv](const std::vector<std::string>& argv, std::chrono::milliseconds) {
    seen_argv = argv;
    CommandResult result{};
    result.exit_code = 0;
    result.out =
        R"({"cpu_percent": 41.256, "memory_percent": 63.1, "disk_percent": 120, "battery_percent": null,)"
        R"( "power_plugged": true, "process_count": 211})";
    return result;
  };

  auto source = edge_twin::telemetry::make_command_source({"host-telemetry", "--json"}, std::chrono::milliseconds(8000),
                                                          runner);
  const auto snapshot = source->collect();

  if (seen_argv.size() != 2 || seen_argv[0] != "host-telemetry") {
    return fail("test_command_source_parses_json", "query argv not forwarded");
  }
  if (!almost_equal(snapshot.cpu_percent, 41.26) || !almost_equal(snapshot.disk_percent, 100.0)) {
    return fail("test_command_source_parses_json", "percentages should be rounded and clamped");
  }
  if (snapshot.battery_percent.has_value() || snapshot.power_plugged != std::optional<bool>(true) ||
      snapshot.process_count != 211) {
    return fail("test_command_source_parses_json", "optional fields mismatch");
  }
  return 0;
}

int test_command_source_failures_raise() {
  const auto expect_error = [](CommandResult result) {
    auto source = edge_twin::telemetry::make_command_source(
        {"host-telemetry"}, std::chrono::milliseconds(100),
        [result](const std::vector<std::string>&, std::chrono::milliseconds) { return result; });
    try {
      source->collect();
    } catch (const TelemetryError&) {
      return true;
    }
    return false;
  };

  CommandResult nonzero{};
  nonzero.exit_code = 2;
  nonzero.err = "no sensors";
  CommandResult timed_out{};
  timed_out.timed_out = true;
  CommandResult malformed{};
  malformed.exit_code = 0;
  malformed.out = "{cpu_percent: oops";
  CommandResult wrong_type{};
  wrong_type.exit_code = 0;
  wrong_type.out = R"({"cpu_percent": "high"})";

  if (!expect_error(nonzero) || !expect_error(timed_out) || !expect_error(malformed) || !expect_error(wrong_type)) {
    return fail("test_command_source_failures_raise", "every failed query should raise TelemetryError");
  }
  return 0;
}

int test_live_telemetry_fallback_chain() {
  edge_twin::telemetry::LiveTelemetry host_first(std::make_unique<FakeSource>(true, 11.0),
                                                 std::make_unique<FakeSource>(true, 22.0),
                                                 std::make_unique<FakeSource>(true, 33.0));
  if (!almost_equal(host_first.collect().cpu_percent, 11.0)) {
    return fail("test_live_telemetry_fallback_chain", "available host sensors should win");
  }

  edge_twin::telemetry::LiveTelemetry query_next(std::make_unique<FakeSource>(false, 11.0),
                                                 std::make_unique<FakeSource>(true, 22.0),
                                                 std::make_unique<FakeSource>(true, 33.0));
  if (!almost_equal(query_next.collect().cpu_percent, 22.0)) {
    return fail("test_live_telemetry_fallback_chain", "query should back missing host sensors");
  }

  edge_twin::telemetry::LiveTelemetry estimate_last(std::make_unique<FakeSource>(false, 11.0), nullptr,
                                                    std::make_unique<FakeSource>(true, 33.0));
  if (!almost_equal(estimate_last.collect().cpu_percent, 33.0) ||
      !almost_equal(estimate_last.collect_estimate().cpu_percent, 33.0)) {
    return fail("test_live_telemetry_fallback_chain", "estimate should close the chain");
  }
  return 0;
}

int test_live_telemetry_skips_failing_host_sensors() {
  edge_twin::telemetry::LiveTelemetry with_query(std::make_unique<FlakyHostSource>(1),
                                                 std::make_unique<FakeSource>(true, 22.0),
                                                 std::make_unique<FakeSource>(true, 33.0));
  if (!almost_equal(with_query.collect().cpu_percent, 22.0) || with_query.sensor_failures() != 1) {
    return fail("test_live_telemetry_skips_failing_host_sensors", "sensor read failure should fall to the query");
  }
  if (!almost_equal(with_query.collect().cpu_percent, 11.0) || with_query.sensor_failures() != 1) {
    return fail("test_live_telemetry_skips_failing_host_sensors", "recovered host sensors should win again");
  }

  edge_twin::telemetry::LiveTelemetry without_query(std::make_unique<FlakyHostSource>(2), nullptr,
                                                    std::make_unique<FakeSource>(true, 33.0));
  try {
    if (!almost_equal(without_query.collect().cpu_percent, 33.0) ||
        !almost_equal(without_query.collect().cpu_percent, 33.0) || without_query.sensor_failures() != 2) {
      return fail("test_live_telemetry_skips_failing_host_sensors", "estimate should back failing sensors");
    }
  } catch (const TelemetryError&) {
    return fail("test_live_telemetry_skips_failing_host_sensors", "sensor read failure must not fail the scan");
  }
  return 0;
}

int test_loadavg_source_bounds() {
  auto source = edge_twin::telemetry::make_loadavg_source();
  const auto snapshot = source->collect();
  if (snapshot.cpu_percent < 0.0 || snapshot.cpu_percent > 100.0 || snapshot.memory_percent != 0.0 ||
      snapshot.battery_percent.has_value() || snapshot.process_count != 0) {
    return fail("test_loadavg_source_bounds", "estimate should carry cpu only");
  }
  return 0;
}

int test_run_command_captures_output_and_exit_code() {
  const auto result = edge_twin::core::run_command({"/bin/sh", "-c", "printf out; printf err >&2; exit 3"},
                                                   std::chrono::milliseconds(5000));
  if (result.timed_out || result.exit_code != 3 || result.out != "out" || result.err != "err") {
    return fail("test_run_command_captures_output_and_exit_code", "exit code or captured streams mismatch");
  }
  return 0;
}

int test_run_command_kills_on_timeout() {
  const auto start = std::chrono::steady_clock::now();
  const auto result = edge_twin::core::run_command({"/bin/sh", "-c", "sleep 5"}, std::chrono::milliseconds(200));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  if (!result.timed_out || result.ok()) {
    return fail("test_run_command_kills_on_timeout", "sleeping child should time out");
  }
  if (elapsed > std::chrono::seconds(3)) {
    return fail("test_run_command_kills_on_timeout", "timeout should not wait for the child");
  }
  return 0;
}

int test_split_command_line() {
  const auto argv = edge_twin::core::split_command_line("  /usr/bin/host-telemetry   --json  -q ");
  if (argv.size() != 3 || argv[0] != "/usr/bin/host-telemetry" || argv[2] != "-q") {
    return fail("test_split_command_line", "whitespace split mismatch");
  }
  if (!edge_twin::core::split_command_line("").empty()) {
    return fail("test_split_command_line", "empty command should yield no argv");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_cpu_sensor_with_injected_proc_stat(); rc != 0) {
    return rc;
  }
  if (int rc = test_cpu_sensor_counter_reset_reports_zero(); rc != 0) {
    return rc;
  }
  if (int rc = test_cpu_tick_parser(); rc != 0) {
    return rc;
  }
  if (int rc = test_memory_sensor_used_percent(); rc != 0) {
    return rc;
  }
  if (int rc = test_memory_sensor_without_mem_available(); rc != 0) {
    return rc;
  }
  if (int rc = test_memory_sensor_missing_total_fails(); rc != 0) {
    return rc;
  }
  if (int rc = test_disk_sensor_bounds(); rc != 0) {
    return rc;
  }
  if (int rc = test_power_supply_sensor_injected_files(); rc != 0) {
    return rc;
  }
  if (int rc = test_power_supply_sensor_without_battery(); rc != 0) {
    return rc;
  }
  if (int rc = test_power_supply_sensor_discovery(); rc != 0) {
    return rc;
  }
  if (int rc = test_process_sensor_counts_numeric_entries(); rc != 0) {
    return rc;
  }
  if (int rc = test_simulator_is_seeded_and_bounded(); rc != 0) {
    return rc;
  }
  if (int rc = test_simulator_first_step_stays_near_initial_state(); rc != 0) {
    return rc;
  }
  if (int rc = test_blend_weights_and_preferences(); rc != 0) {
    return rc;
  }
  if (int rc = test_industrial_metrics_derivation(); rc != 0) {
    return rc;
  }
  if (int rc = test_scenario_peak_load_runs_for_requested_cycles(); rc != 0) {
    return rc;
  }
  if (int rc = test_scenario_low_load_and_grid_failure(); rc != 0) {
    return rc;
  }
  if (int rc = test_scenario_validation_and_clamping(); rc != 0) {
    return rc;
  }
  if (int rc = test_command_source_parses_json(); rc != 0) {
    return rc;
  }
  if (int rc = test_command_source_failures_raise(); rc != 0) {
    return rc;
  }
  if (int rc = test_live_telemetry_fallback_chain(); rc != 0) {
    return rc;
  }
  if (int rc = test_live_telemetry_skips_failing_host_sensors(); rc != 0) {
    return rc;
  }
  if (int rc = test_loadavg_source_bounds(); rc != 0) {
    return rc;
  }
  if (int rc = test_run_command_captures_output_and_exit_code(); rc != 0) {
    return rc;
  }
  if (int rc = test_run_command_kills_on_timeout(); rc != 0) {
    return rc;
  }
  if (int rc = test_split_command_line(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] sensors_unit_tests\n";
  return 0;
}
