#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace edge_twin::model {

enum class EventType : std::uint8_t {
  INFO = 0,
  WARN = 1,
  ERROR = 2,
  SUCCESS = 3,
};

enum class AlertSeverity : std::uint8_t {
  WARNING = 0,
  CRITICAL = 1,
};

enum class PowerProfile : std::uint8_t {
  POWER_SAVER = 0,
  BALANCED = 1,
  HIGH_PERFORMANCE = 2,
};

const char* to_string(EventType type) noexcept;
const char* to_string(AlertSeverity severity) noexcept;
const char* to_string(PowerProfile profile) noexcept;

struct Event {
  std::uint64_t id{0};
  EventType type{EventType::INFO};
  std::string message{};
  std::string time{};
};

struct Alert {
  std::uint64_t id{0};
  AlertSeverity severity{AlertSeverity::WARNING};
  std::string title{};
  std::string message{};
  std::string time{};
};

struct HistoryRecord {
  std::uint64_t timestamp_ms{0};
  std::string time{};
  double optimization{0.0};
  double energy{0.0};
};

struct RuntimeHealthMetric {
  std::string name{};
  double value{0.0};
};

struct PowerAction {
  bool applied{false};
  PowerProfile requested{PowerProfile::BALANCED};
  std::string reason{};
};

}  // namespace edge_twin::model
