#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace devstatus {
namespace core {
namespace device {
namespace model {

// Scalar carried in a report. Nested structures arrive as their JSON text.
using PayloadValue = std::variant<std::nullptr_t, bool, std::int64_t, double, std::string>;

// Caller-defined health data (battery, firmware, rssi...). Stored and
// forwarded as-is; the registry never interprets it.
using StatusPayload = std::map<std::string, PayloadValue>;

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace devstatus
