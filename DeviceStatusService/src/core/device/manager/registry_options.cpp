#include "core/device/manager/registry_options.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace devstatus {
namespace core {
namespace device {
namespace manager {

namespace {

void Append(std::vector<std::string>& dst, std::vector<std::string> src) {
  for (auto& s : src) dst.push_back(std::move(s));
}

void CheckThresholds(const staleness::Thresholds& t, const std::string& scope,
                     std::vector<std::string>& errors) {
  if (t.stale_after_ms <= 0) {
    errors.push_back(scope + ": stale_after must be greater than zero");
  }
  if (t.offline_after_ms <= t.stale_after_ms) {
    errors.push_back(scope + ": offline_after (" + std::to_string(t.offline_after_ms) +
                     "ms) must be greater than stale_after (" + std::to_string(t.stale_after_ms) + "ms)");
  }
}

bool ReadPositive(const common::config::ConfigManager& cfg, const std::string& key, std::size_t& out,
                  std::vector<std::string>& errors) {
  if (!cfg.Has(key)) return true;
  std::int64_t v = 0;
  if (!cfg.GetInt64(key, v) || v <= 0) {
    errors.push_back("invalid value for " + key + ": expected a positive integer");
    return false;
  }
  out = static_cast<std::size_t>(v);
  return true;
}

}  // namespace

std::vector<std::string> ValidateOptions(const RegistryOptions& opt) {
  std::vector<std::string> errors;
  CheckThresholds(opt.thresholds, "registry", errors);
  for (const auto& kv : opt.overrides) CheckThresholds(kv.second, "devices." + kv.first, errors);
  if (opt.sweep_period_ms <= 0) errors.push_back("registry: sweep_period must be greater than zero");
  if (opt.shard_count == 0) errors.push_back("registry: shards must be greater than zero");
  if (opt.subscriber_defaults.queue_capacity == 0) {
    errors.push_back("events: queue_capacity must be greater than zero");
  }
  return errors;
}

bool LoadOptions(const common::config::ConfigManager& cfg, RegistryOptions& out,
                 std::vector<std::string>& errors) {
  const std::size_t errors_before = errors.size();

  Append(errors, common::config::ValidateDurationKeys(
                     cfg, {"registry.stale_after", "registry.offline_after", "registry.sweep_period"}));
  Append(errors, common::config::ValidateOneOf(cfg, "registry.strategy", {"active", "lazy"}));
  Append(errors, common::config::ValidateOneOf(cfg, "registry.out_of_order", {"reject", "merge_payload"}));
  Append(errors, common::config::ValidateOneOf(cfg, "events.overflow", {"drop_oldest", "drop_newest"}));

  std::int64_t ms = 0;
  if (cfg.GetDurationMs("registry.stale_after", ms)) out.thresholds.stale_after_ms = ms;
  if (cfg.GetDurationMs("registry.offline_after", ms)) out.thresholds.offline_after_ms = ms;
  if (cfg.GetDurationMs("registry.sweep_period", ms)) out.sweep_period_ms = ms;

  std::string s;
  if (cfg.GetString("registry.strategy", s)) {
    if (s == "lazy") out.strategy = staleness::Strategy::Lazy;
    else if (s == "active") out.strategy = staleness::Strategy::Active;
  }
  if (cfg.GetString("registry.out_of_order", s)) {
    if (s == "merge_payload") out.out_of_order = OutOfOrderPolicy::MergePayload;
    else if (s == "reject") out.out_of_order = OutOfOrderPolicy::Reject;
  }
  if (cfg.GetString("events.overflow", s)) {
    if (s == "drop_newest") out.subscriber_defaults.overflow = events::OverflowPolicy::DropNewest;
    else if (s == "drop_oldest") out.subscriber_defaults.overflow = events::OverflowPolicy::DropOldest;
  }

  (void)ReadPositive(cfg, "registry.shards", out.shard_count, errors);
  (void)ReadPositive(cfg, "events.queue_capacity", out.subscriber_defaults.queue_capacity, errors);

  // devices.<id>.stale_after / devices.<id>.offline_after; a missing half
  // falls back to the global value.
  for (const auto& id : cfg.ChildNames("devices")) {
    const std::string stale_key = "devices." + id + ".stale_after";
    const std::string offline_key = "devices." + id + ".offline_after";
    Append(errors, common::config::ValidateDurationKeys(cfg, {stale_key, offline_key}));

    staleness::Thresholds t = out.thresholds;
    if (cfg.GetDurationMs(stale_key, ms)) t.stale_after_ms = ms;
    if (cfg.GetDurationMs(offline_key, ms)) t.offline_after_ms = ms;
    out.overrides[id] = t;
  }

  Append(errors, ValidateOptions(out));
  return errors.size() == errors_before;
}

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace devstatus
