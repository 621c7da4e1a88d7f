#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "mongoose.h"
#include "core/common/clock/clock.hpp"
#include "core/device/manager/status_registry.hpp"
#include "core/device/protocol_adapters/mqtt_adapter/heartbeat_adapter.hpp"

namespace devstatus::core::device::protocol_adapters::mqtt {
namespace {

TEST(MqttHeartbeatAdapterTest, DeviceIdFromTopic) {
  EXPECT_EQ(MqttHeartbeatAdapter::DeviceIdFromTopic("devices/42", "devices/"), "42");
  EXPECT_EQ(MqttHeartbeatAdapter::DeviceIdFromTopic("devices/pump-1", "devices/"), "pump-1");
  EXPECT_EQ(MqttHeartbeatAdapter::DeviceIdFromTopic("devices/", "devices/"), "");
  EXPECT_EQ(MqttHeartbeatAdapter::DeviceIdFromTopic("other/42", "devices/"), "");
  EXPECT_EQ(MqttHeartbeatAdapter::DeviceIdFromTopic("devices/42/status", "devices/"), "");
  EXPECT_EQ(MqttHeartbeatAdapter::DeviceIdFromTopic("hb-7", "hb-"), "7");
  EXPECT_EQ(MqttHeartbeatAdapter::DeviceIdFromTopic("7", ""), "7");
}

TEST(MqttHeartbeatAdapterTest, SubscriptionFilter) {
  EXPECT_EQ(MqttHeartbeatAdapter::SubscriptionFilter("devices/"), "devices/+");
  EXPECT_EQ(MqttHeartbeatAdapter::SubscriptionFilter(""), "+");
  EXPECT_EQ(MqttHeartbeatAdapter::SubscriptionFilter("hb-"), "#");
}

TEST(MqttHeartbeatAdapterTest, DisabledWithoutUrl) {
  std::vector<std::string> errors;
  auto registry = manager::StatusRegistry::Create(manager::RegistryOptions{},
                                                  std::make_shared<common::clock::ManualClock>(), nullptr, errors);
  ASSERT_TRUE(registry != nullptr);

  struct mg_mgr mgr;
  mg_mgr_init(&mgr);
  {
    MqttHeartbeatAdapter adapter(&mgr, MqttHeartbeatAdapter::Options{}, *registry, nullptr);
    EXPECT_EQ(adapter.Name(), "mqtt-heartbeat");
    EXPECT_FALSE(adapter.Start());
    adapter.Poll(0);
    adapter.Poll(60'000);
    adapter.Stop();
    EXPECT_EQ(adapter.Received(), 0u);
    EXPECT_EQ(adapter.ConnectAttempts(), 0u);
  }
  mg_mgr_free(&mgr);
}

TEST(MqttHeartbeatAdapterTest, ConnackReasons) {
  EXPECT_STREQ(MqttClient::ConnackReason(0), "accepted");
  EXPECT_STREQ(MqttClient::ConnackReason(4), "bad user name or password");
  EXPECT_STREQ(MqttClient::ConnackReason(5), "not authorized");
  EXPECT_STREQ(MqttClient::ConnackReason(-1), "unknown reason");
}

TEST(MqttHeartbeatAdapterTest, ReconnectsAfterTheSessionCloses) {
  std::vector<std::string> errors;
  auto registry = manager::StatusRegistry::Create(manager::RegistryOptions{},
                                                  std::make_shared<common::clock::ManualClock>(), nullptr, errors);
  ASSERT_TRUE(registry != nullptr);

  MqttHeartbeatAdapter::Options opt;
  // Nothing listens on port 1, so the broker connection is refused.
  opt.client.url = "mqtt://127.0.0.1:1";
  opt.reconnect_ms = 50;

  struct mg_mgr mgr;
  mg_mgr_init(&mgr);
  {
    MqttHeartbeatAdapter adapter(&mgr, opt, *registry, nullptr);
    ASSERT_TRUE(adapter.Start());
    EXPECT_EQ(adapter.ConnectAttempts(), 1u);

    for (int i = 0; i < 300 && adapter.SessionState() != MqttClient::Session::Closed; ++i) mg_mgr_poll(&mgr, 10);
    ASSERT_EQ(adapter.SessionState(), MqttClient::Session::Closed);

    adapter.Poll(1'000);
    adapter.Poll(1'020);
    EXPECT_EQ(adapter.ConnectAttempts(), 1u);
    adapter.Poll(1'050);
    EXPECT_EQ(adapter.ConnectAttempts(), 2u);

    adapter.Stop();
    for (int i = 0; i < 5; ++i) mg_mgr_poll(&mgr, 10);
    adapter.Poll(5'000);
    adapter.Poll(10'000);
    EXPECT_EQ(adapter.ConnectAttempts(), 2u);
  }
  mg_mgr_free(&mgr);
}

}  // namespace
}  // namespace devstatus::core::device::protocol_adapters::mqtt
