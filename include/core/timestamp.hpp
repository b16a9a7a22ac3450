#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace edge_twin::core {

inline std::uint64_t monotonic_timestamp_now_ns() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

// "2026-10-19T14:03:07.412Z"
std::string format_iso8601_utc(std::uint64_t unix_ms);

// "HH:MM:SS" in the host's local time zone.
std::string format_clock_label(std::uint64_t unix_ms);

struct CalendarSlot {
  int day_of_week{0};  // Monday = 0
  int hour{0};
};

CalendarSlot utc_calendar_slot(std::uint64_t unix_ms);

}  // namespace edge_twin::core
