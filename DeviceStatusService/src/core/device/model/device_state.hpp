#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace devstatus {
namespace core {
namespace device {
namespace model {

// Online -> Stale -> Offline via sweeps; any state -> Online via a fresh report.
enum class DeviceState : std::uint8_t {
  Online  = 0,
  Stale   = 1,
  Offline = 2
};

inline const char* StateName(DeviceState s) {
  switch (s) {
    case DeviceState::Online:  return "online";
    case DeviceState::Stale:   return "stale";
    case DeviceState::Offline: return "offline";
    default:                   return "unknown";
  }
}

inline std::optional<DeviceState> ParseState(std::string_view s) {
  if (s == "online") return DeviceState::Online;
  if (s == "stale") return DeviceState::Stale;
  if (s == "offline") return DeviceState::Offline;
  return std::nullopt;
}

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace devstatus
