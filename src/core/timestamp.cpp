#include "core/timestamp.hpp"

#include <cstdio>
#include <ctime>

namespace edge_twin::core {
namespace {

std::time_t to_time_t(const std::uint64_t unix_ms) {
  return static_cast<std::time_t>(unix_ms / 1000ULL);
}

}  // namespace

std::string format_iso8601_utc(const std::uint64_t unix_ms) {
  const std::time_t seconds = to_time_t(unix_ms);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[40]{};
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ", utc.tm_year + 1900, utc.tm_mon + 1,
                utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<unsigned>(unix_ms % 1000ULL));
  return buffer;
}

std::string format_clock_label(const std::uint64_t unix_ms) {
  const std::time_t seconds = to_time_t(unix_ms);
  std::tm local{};
  localtime_r(&seconds, &local);

  char buffer[16]{};
  std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &local);
  return buffer;
}

CalendarSlot utc_calendar_slot(const std::uint64_t unix_ms) {
  const std::time_t seconds = to_time_t(unix_ms);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  CalendarSlot slot{};
  slot.day_of_week = (utc.tm_wday + 6) % 7;
  slot.hour = utc.tm_hour;
  return slot;
}

}  // namespace edge_twin::core
