#include "core/device/model/device_json.hpp"

#include <string>
#include <type_traits>
#include <vector>

#include "core/common/utils/json_utils.hpp"

namespace devstatus {
namespace core {
namespace device {
namespace model {

namespace json = devstatus::core::common::json;

std::string PayloadValueToJson(const PayloadValue& v) {
  return std::visit(
      [](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return json::Null();
        } else if constexpr (std::is_same_v<T, bool>) {
          return json::Bool(x);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return json::Number(x);
        } else if constexpr (std::is_same_v<T, double>) {
          return json::Number(x);
        } else {
          return json::Quote(x);
        }
      },
      v);
}

std::string PayloadToJson(const StatusPayload& p) {
  json::Fields fields;
  fields.reserve(p.size());
  for (const auto& kv : p) fields.emplace_back(kv.first, PayloadValueToJson(kv.second));
  return json::Object(fields);
}

std::string RecordToJson(const DeviceRecord& r, std::optional<common::clock::DurationMs> expires_in_ms) {
  json::Fields fields{
      {"id", json::Quote(r.id)},
      {"state", json::Quote(StateName(r.state))},
      {"last_seen_ms", json::Number(static_cast<std::int64_t>(r.last_seen_ms))},
      {"created_at_ms", json::Number(static_cast<std::int64_t>(r.created_at_ms))},
      {"state_since_ms", json::Number(static_cast<std::int64_t>(r.state_since_ms))},
      {"report_count", json::Number(static_cast<std::uint64_t>(r.report_count))},
      {"last_payload", PayloadToJson(r.last_payload)},
  };
  if (expires_in_ms) {
    fields.emplace_back("expires_in_ms", json::Number(static_cast<std::int64_t>(*expires_in_ms)));
  }
  return json::Object(fields);
}

std::string RecordsToJson(const std::vector<DeviceRecord>& records) {
  std::vector<std::string> items;
  items.reserve(records.size());
  for (const auto& r : records) items.push_back(RecordToJson(r));
  return json::Array(items);
}

std::string EventToJson(const TransitionEvent& e) {
  return json::Object({
      {"type", json::Quote("transition")},
      {"device_id", json::Quote(e.device_id)},
      {"from", json::Quote(StateName(e.from))},
      {"to", json::Quote(StateName(e.to))},
      {"at_ms", json::Number(static_cast<std::int64_t>(e.at))},
      {"first_seen", json::Bool(e.first_seen)},
  });
}

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace devstatus
