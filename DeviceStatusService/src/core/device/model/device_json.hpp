#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/common/clock/clock.hpp"
#include "core/device/model/device_record.hpp"

namespace devstatus {
namespace core {
namespace device {
namespace model {

std::string PayloadValueToJson(const PayloadValue& v);
std::string PayloadToJson(const StatusPayload& p);

// `expires_in_ms` is the time left before the next sweep transition; omitted when unset.
std::string RecordToJson(const DeviceRecord& r,
                         std::optional<common::clock::DurationMs> expires_in_ms = std::nullopt);
std::string RecordsToJson(const std::vector<DeviceRecord>& records);

// {"type":"transition","device_id":...,"from":...,"to":...,"at_ms":...,"first_seen":...}
std::string EventToJson(const TransitionEvent& e);

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace devstatus
