#ifndef NUCLEOBENCH_CORE_TIME_UTILS_HPP_
#define NUCLEOBENCH_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace nucleobench::core {

// Canonical UTC timestamp formatter used by log lines and run identifiers.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// `run-<epoch_ms>` keeps identifiers sortable in log archives.
inline std::string MakeRunId(std::chrono::system_clock::time_point now) {
  const auto epoch_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "run-" + std::to_string(epoch_ms);
}

inline double ToSeconds(std::chrono::steady_clock::duration elapsed) {
  return std::chrono::duration<double>(elapsed).count();
}

inline std::string FormatSeconds(double seconds, int precision = 1) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << seconds;
  return out.str();
}

} // namespace nucleobench::core

#endif // NUCLEOBENCH_CORE_TIME_UTILS_HPP_
