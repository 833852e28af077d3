#ifndef NETSTACK_CORE_TIME_UTILS_HPP_
#define NETSTACK_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace netstack::core {

// UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.250Z.
// Used by log lines and by the teardown report.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

inline std::int64_t ToEpochMilliseconds(std::chrono::system_clock::time_point timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch())
      .count();
}

} // namespace netstack::core

#endif // NETSTACK_CORE_TIME_UTILS_HPP_
