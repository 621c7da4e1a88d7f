#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/common/clock/clock.hpp"
#include "core/common/config/config_manager.hpp"
#include "core/device/events/event_notifier.hpp"
#include "core/device/manager/device_record_store.hpp"
#include "core/device/staleness/staleness_engine.hpp"

namespace devstatus {
namespace core {
namespace device {
namespace manager {

struct RegistryOptions {
  staleness::Thresholds thresholds;
  std::unordered_map<std::string, staleness::Thresholds> overrides;
  common::clock::DurationMs sweep_period_ms = 10'000;
  staleness::Strategy strategy = staleness::Strategy::Active;
  OutOfOrderPolicy out_of_order = OutOfOrderPolicy::Reject;
  std::size_t shard_count = 16;
  // Applied to subscribers that do not bring their own options.
  events::SubscriberOptions subscriber_defaults;
};

// One message per violated constraint; empty when the options are usable.
std::vector<std::string> ValidateOptions(const RegistryOptions& opt);

// Reads the registry.*, events.* and devices.* keys on top of `out`, which
// holds the defaults. Malformed values are reported in `errors` and leave the
// corresponding field untouched. Returns errors.empty().
bool LoadOptions(const common::config::ConfigManager& cfg, RegistryOptions& out,
                 std::vector<std::string>& errors);

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace devstatus
