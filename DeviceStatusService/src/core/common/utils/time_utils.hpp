#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace devstatus::core::common::time {

inline std::int64_t NowUnixMs() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
  return static_cast<std::int64_t>(ms.count());
}

inline void SleepMs(std::uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

// Parses "250ms", "30s", "5m", "2h" or a bare integer (milliseconds).
// Surrounding whitespace is ignored; negative values are rejected.
inline std::optional<std::int64_t> ParseDurationMs(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  if (s.empty()) return std::nullopt;

  std::size_t i = 0;
  std::int64_t v = 0;
  for (; i < s.size(); ++i) {
    const char c = s[i];
    if (c < '0' || c > '9') break;
    if (v > (INT64_MAX - 9) / 10) return std::nullopt;
    v = v * 10 + (c - '0');
  }
  if (i == 0) return std::nullopt;

  const std::string_view unit = s.substr(i);
  std::int64_t scale = 0;
  if (unit.empty() || unit == "ms") scale = 1;
  else if (unit == "s") scale = 1000;
  else if (unit == "m") scale = 60 * 1000;
  else if (unit == "h") scale = 60 * 60 * 1000;
  else return std::nullopt;

  if (v > INT64_MAX / scale) return std::nullopt;
  return v * scale;
}

// "1h 2m 3s", "4m 0s", "12s"; sub-second remainders are truncated.
inline std::string FormatDurationMs(std::int64_t ms) {
  if (ms <= 0) return "0s";
  std::int64_t seconds = ms / 1000;
  const std::int64_t hours = seconds / 3600;
  seconds %= 3600;
  const std::int64_t minutes = seconds / 60;
  seconds %= 60;

  if (hours > 0) {
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
  }
  if (minutes > 0) return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
  return std::to_string(seconds) + "s";
}

}  // namespace devstatus::core::common::time
