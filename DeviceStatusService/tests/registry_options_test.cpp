#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/common/config/config_manager.hpp"
#include "core/device/manager/registry_options.hpp"

namespace devstatus::core::device::manager {
namespace {

bool AnyContains(const std::vector<std::string>& errors, const std::string& needle) {
  for (const auto& e : errors) {
    if (e.find(needle) != std::string::npos) return true;
  }
  return false;
}

TEST(RegistryOptionsTest, DefaultsAreValid) {
  EXPECT_TRUE(ValidateOptions(RegistryOptions{}).empty());

  common::config::ConfigManager cfg;
  RegistryOptions opt;
  std::vector<std::string> errors;
  EXPECT_TRUE(LoadOptions(cfg, opt, errors));
  EXPECT_EQ(opt.thresholds.stale_after_ms, 5 * 60 * 1000);
  EXPECT_EQ(opt.thresholds.offline_after_ms, 15 * 60 * 1000);
  EXPECT_EQ(opt.sweep_period_ms, 10'000);
  EXPECT_EQ(opt.strategy, staleness::Strategy::Active);
  EXPECT_EQ(opt.out_of_order, OutOfOrderPolicy::Reject);
}

TEST(RegistryOptionsTest, LoadsEveryKey) {
  common::config::ConfigManager cfg;
  ASSERT_TRUE(cfg.LoadYamlString(
      "registry:\n"
      "  stale_after: 5s\n"
      "  offline_after: 15s\n"
      "  sweep_period: 500ms\n"
      "  strategy: lazy\n"
      "  out_of_order: merge_payload\n"
      "  shards: 4\n"
      "events:\n"
      "  queue_capacity: 64\n"
      "  overflow: drop_newest\n"
      "devices:\n"
      "  pump-1:\n"
      "    stale_after: 1m\n"
      "    offline_after: 5m\n"
      "  meter-7:\n"
      "    offline_after: 1h\n"));

  RegistryOptions opt;
  std::vector<std::string> errors;
  ASSERT_TRUE(LoadOptions(cfg, opt, errors)) << (errors.empty() ? "" : errors[0]);

  EXPECT_EQ(opt.thresholds.stale_after_ms, 5'000);
  EXPECT_EQ(opt.thresholds.offline_after_ms, 15'000);
  EXPECT_EQ(opt.sweep_period_ms, 500);
  EXPECT_EQ(opt.strategy, staleness::Strategy::Lazy);
  EXPECT_EQ(opt.out_of_order, OutOfOrderPolicy::MergePayload);
  EXPECT_EQ(opt.shard_count, 4u);
  EXPECT_EQ(opt.subscriber_defaults.queue_capacity, 64u);
  EXPECT_EQ(opt.subscriber_defaults.overflow, events::OverflowPolicy::DropNewest);

  ASSERT_EQ(opt.overrides.size(), 2u);
  EXPECT_EQ(opt.overrides.at("pump-1").stale_after_ms, 60'000);
  EXPECT_EQ(opt.overrides.at("pump-1").offline_after_ms, 300'000);
  EXPECT_EQ(opt.overrides.at("meter-7").stale_after_ms, 5'000);
  EXPECT_EQ(opt.overrides.at("meter-7").offline_after_ms, 3'600'000);
}

TEST(RegistryOptionsTest, ReportsMalformedValues) {
  common::config::ConfigManager cfg;
  cfg.Set("registry.stale_after", "later");
  cfg.Set("registry.strategy", "eager");
  cfg.Set("events.queue_capacity", "0");

  RegistryOptions opt;
  std::vector<std::string> errors;
  EXPECT_FALSE(LoadOptions(cfg, opt, errors));
  EXPECT_TRUE(AnyContains(errors, "registry.stale_after"));
  EXPECT_TRUE(AnyContains(errors, "registry.strategy"));
  EXPECT_TRUE(AnyContains(errors, "events.queue_capacity"));
  EXPECT_EQ(opt.thresholds.stale_after_ms, 5 * 60 * 1000);
}

TEST(RegistryOptionsTest, OfflineMustExceedStale) {
  common::config::ConfigManager cfg;
  cfg.Set("registry.stale_after", "10m");
  cfg.Set("registry.offline_after", "10m");

  RegistryOptions opt;
  std::vector<std::string> errors;
  EXPECT_FALSE(LoadOptions(cfg, opt, errors));
  EXPECT_TRUE(AnyContains(errors, "offline_after"));
}

TEST(RegistryOptionsTest, OverrideOrderingIsChecked) {
  common::config::ConfigManager cfg;
  cfg.Set("devices.pump-1.stale_after", "20m");

  RegistryOptions opt;
  std::vector<std::string> errors;
  EXPECT_FALSE(LoadOptions(cfg, opt, errors));
  EXPECT_TRUE(AnyContains(errors, "devices.pump-1"));
}

TEST(RegistryOptionsTest, ZeroValuesRejected) {
  RegistryOptions opt;
  opt.thresholds.stale_after_ms = 0;
  opt.sweep_period_ms = 0;
  opt.shard_count = 0;
  const auto errors = ValidateOptions(opt);
  EXPECT_TRUE(AnyContains(errors, "stale_after must be greater than zero"));
  EXPECT_TRUE(AnyContains(errors, "sweep_period"));
  EXPECT_TRUE(AnyContains(errors, "shards"));
}

}  // namespace
}  // namespace devstatus::core::device::manager
