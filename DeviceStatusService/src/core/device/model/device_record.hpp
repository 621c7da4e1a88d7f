#pragma once

#include <cstdint>
#include <string>

#include "core/common/clock/clock.hpp"
#include "core/device/model/device_state.hpp"
#include "core/device/model/status_payload.hpp"

namespace devstatus {
namespace core {
namespace device {
namespace model {

struct DeviceRecord {
  std::string id;
  StatusPayload last_payload;
  common::clock::TimestampMs last_seen_ms = 0;
  DeviceState state = DeviceState::Online;
  common::clock::TimestampMs created_at_ms = 0;
  common::clock::TimestampMs state_since_ms = 0;
  std::uint64_t report_count = 0;
};

struct TransitionEvent {
  std::string device_id;
  DeviceState from = DeviceState::Offline;
  DeviceState to = DeviceState::Online;
  common::clock::TimestampMs at = 0;
  // Set on the event that created the record; `from` is then Offline by convention.
  bool first_seen = false;
};

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace devstatus
