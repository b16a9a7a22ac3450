#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "core/config.hpp"
#include "core/cycle_record.hpp"
#include "core/process.hpp"
#include "core/ring_buffer.hpp"
#include "decision/decision_engine.hpp"
#include "health/alert_engine.hpp"
#include "model/runtime_records.hpp"
#include "model/telemetry_snapshot.hpp"
#include "power/power_profile.hpp"
#include "scenario/scenario_injector.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "telemetry/live_telemetry.hpp"
#include "telemetry/simulator.hpp"
#include "telemetry/source.hpp"

namespace edge_twin::core {

struct HealthStatus {
  bool running{false};
  std::chrono::milliseconds scan_interval{0};
  std::optional<std::string> last_scan_error{};
  bool auto_apply{false};
  model::RuntimeMode mode{model::RuntimeMode::LIVE_EDGE};
  model::Scenario scenario{model::Scenario::NORMAL};
  int scenario_cycles_left{0};
  std::optional<std::uint64_t> latest_timestamp_ms{};
  std::uint64_t scans_completed{0};
  std::uint64_t missed_cycles{0};
};

struct RuntimePayload {
  std::string status{"ok"};
  model::RuntimeMode mode{model::RuntimeMode::LIVE_EDGE};
  model::Scenario scenario{model::Scenario::NORMAL};
  std::uint64_t generated_at_ms{0};

  // Empty until the first scan commits.
  std::optional<model::TelemetrySnapshot> telemetry{};
  std::optional<decision::DecisionPayload> decision{};
  std::optional<optimization::OptimizationResult> optimization{};
  std::optional<model::PowerAction> power_action{};
  std::vector<model::RuntimeHealthMetric> runtime_health{};

  std::vector<model::HistoryRecord> history{};
  std::vector<model::Event> events{};
  std::vector<model::Alert> alerts{};

  HealthStatus service_health{};
  std::vector<std::string> supported_modes{};
  std::vector<std::string> supported_scenarios{};
};

// Owns all runtime state. A background thread scans at the configured
// interval; control calls run on the caller's thread and rescan synchronously.
class RuntimeService {
 public:
  static constexpr std::size_t kHistoryCapacity = 720;
  static constexpr std::size_t kEventCapacity = 500;
  static constexpr std::size_t kAlertCapacity = 200;

  // `live_source` replaces the host/query/estimate chain as the primary live
  // source; `power_runner` replaces the power backend and marks it supported.
  explicit RuntimeService(RuntimeConfig config, std::unique_ptr<telemetry::TelemetrySource> live_source = nullptr,
                          std::unique_ptr<decision::DecisionEngine> engine = nullptr,
                          CommandRunner power_runner = {});
  ~RuntimeService();

  RuntimeService(const RuntimeService&) = delete;
  RuntimeService& operator=(const RuntimeService&) = delete;

  void start();
  void stop();
  void scan_now();

  HealthStatus health_status() const;
  RuntimePayload latest_payload(std::size_t history_limit = 30, std::size_t event_limit = 30,
                                std::size_t alert_limit = 10) const;

  // Both throw std::invalid_argument on unknown names and leave state untouched.
  void set_mode(std::string_view mode);
  void set_mode(model::RuntimeMode mode);
  void set_scenario(std::string_view scenario, int cycles = 12);
  void set_auto_apply(bool enabled);

 private:
  void run_loop();
  void run_cycle();
  model::TelemetrySnapshot collect_live(std::optional<std::string>& error);
  decision::DecisionPayload decide(const model::TelemetrySnapshot& snapshot);
  void publish_sinks(const CycleRecord& record, std::uint64_t scan_errors);

  void push_event_locked(model::EventType type, std::string message, const std::string& time_label);
  void push_alert_locked(model::Alert alert);
  HealthStatus health_status_locked() const;

  RuntimeConfig config_;

  // Touched only inside a scan, which scan_mutex_ serializes.
  telemetry::LiveTelemetry live_;
  telemetry::SimulatedTelemetry simulator_;
  std::unique_ptr<decision::DecisionEngine> engine_;
  health::AlertEngine alert_engine_{};
  power::PowerProfileController power_;
  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};
  bool telemetry_was_ok_{true};

  std::mutex scan_mutex_;

  mutable std::mutex state_mutex_;
  model::RuntimeMode mode_;
  scenario::ScenarioInjector scenario_{};
  std::uint64_t scenario_generation_{0};
  std::optional<CycleRecord> latest_{};
  RingBuffer<model::HistoryRecord> history_{kHistoryCapacity};
  RingBuffer<model::Event> events_{kEventCapacity};
  RingBuffer<model::Alert> alerts_{kAlertCapacity};
  std::optional<std::string> last_scan_error_{};
  std::uint64_t next_event_id_{1};
  std::uint64_t next_alert_id_{1};
  std::uint64_t scans_completed_{0};
  std::uint64_t scan_errors_{0};
  std::uint64_t missed_cycles_{0};

  std::atomic<bool> running_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread worker_;
};

}  // namespace edge_twin::core
