#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/math.hpp"
#include "core/timestamp.hpp"
#include "telemetry/source.hpp"

namespace edge_twin::telemetry {
namespace {

double percent_field(const nlohmann::json& payload, const char* key) {
  const auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    return 0.0;
  }
  return core::round2(core::clamp_percent(it->get<double>()));
}

class CommandTelemetrySource final : public TelemetrySource {
 public:
  CommandTelemetrySource(std::vector<std::string> argv, const std::chrono::milliseconds timeout,
                         core::CommandRunner runner)
      : argv_(std::move(argv)), timeout_(timeout), runner_(std::move(runner)) {}

  bool available() const override { return !argv_.empty() && static_cast<bool>(runner_); }

  model::TelemetrySnapshot collect() override {
    const core::CommandResult result = runner_(argv_, timeout_);
    if (result.timed_out) {
      throw TelemetryError("telemetry query timed out: " + argv_.front());
    }
    if (result.exit_code != 0) {
      throw TelemetryError(result.err.empty() ? "telemetry query failed: " + argv_.front() : result.err);
    }

    model::TelemetrySnapshot snapshot{};
    snapshot.timestamp_ms = core::unix_timestamp_now_ms();
    snapshot.hostname = host_name();
    snapshot.platform = platform_label();

    try {
      const auto payload = nlohmann::json::parse(result.out);
      if (!payload.is_object()) {
        throw TelemetryError("telemetry query returned a non-object payload");
      }

      snapshot.cpu_percent = percent_field(payload, "cpu_percent");
      snapshot.memory_percent = percent_field(payload, "memory_percent");
      snapshot.disk_percent = percent_field(payload, "disk_percent");

      const auto battery_it = payload.find("battery_percent");
      if (battery_it != payload.end() && !battery_it->is_null()) {
        snapshot.battery_percent = core::round2(core::clamp_percent(battery_it->get<double>()));
      }

      const auto plugged_it = payload.find("power_plugged");
      if (plugged_it != payload.end() && !plugged_it->is_null()) {
        snapshot.power_plugged = plugged_it->get<bool>();
      }

      const auto processes_it = payload.find("process_count");
      if (processes_it != payload.end() && !processes_it->is_null()) {
        const auto count = processes_it->get<std::int64_t>();
        snapshot.process_count = count > 0 ? static_cast<std::uint32_t>(count) : 0U;
      }
    } catch (const nlohmann::json::exception& ex) {
      throw TelemetryError(std::string("malformed telemetry query output: ") + ex.what());
    }

    return snapshot;
  }

 private:
  std::vector<std::string> argv_;
  std::chrono::milliseconds timeout_;
  core::CommandRunner runner_;
};

}  // namespace

std::unique_ptr<TelemetrySource> make_command_source(std::vector<std::string> argv,
                                                     const std::chrono::milliseconds timeout,
                                                     core::CommandRunner runner) {
  return std::make_unique<CommandTelemetrySource>(std::move(argv), timeout, std::move(runner));
}

}  // namespace edge_twin::telemetry
