#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "mongoose.h"
#include "core/common/logger/logger.hpp"
#include "core/device/manager/status_registry.hpp"
#include "core/device/protocol_adapters/adapter_base.hpp"
#include "core/device/protocol_adapters/mqtt_adapter/mqtt_adapter.hpp"

namespace devstatus::core::device::protocol_adapters::mqtt {

// Every message on "<topic_prefix><device_id>" is a heartbeat for that device.
class MqttHeartbeatAdapter final : public AdapterBase {
public:
  struct Options {
    MqttClient::Options client;
    std::string topic_prefix = "devices/";
    std::uint8_t qos = 0;
    std::int64_t reconnect_ms = 5'000;
  };

  MqttHeartbeatAdapter(struct mg_mgr* mgr, Options opt, manager::StatusRegistry& registry,
                       std::shared_ptr<devstatus::core::common::log::Logger> logger);

  std::string Name() const override { return "mqtt-heartbeat"; }
  bool Start() override;
  // Reopens a lost broker session once reconnect_ms has passed.
  void Poll(std::int64_t now_ms) override;
  void Stop() override;

  // Empty when the topic is outside the prefix or has extra levels.
  static std::string DeviceIdFromTopic(const std::string& topic, const std::string& prefix);

  // "devices/" -> "devices/+"; prefixes not ending in '/' need the catch-all.
  static std::string SubscriptionFilter(const std::string& prefix);

  std::uint64_t Received() const { return received_; }
  std::uint64_t Ignored() const { return ignored_; }
  MqttClient::Session SessionState() const { return client_.State(); }
  std::uint32_t ConnectAttempts() const { return client_.ConnectAttempts(); }

private:
  void OnMessage(const std::string& topic, const std::string& payload);

private:
  Options opt_;
  manager::StatusRegistry& registry_;
  std::shared_ptr<devstatus::core::common::log::Logger> logger_;
  MqttClient client_;
  std::uint64_t received_ = 0;
  std::uint64_t ignored_ = 0;
  bool started_ = false;
  std::optional<std::int64_t> retry_at_ms_;
};

}  // namespace devstatus::core::device::protocol_adapters::mqtt
