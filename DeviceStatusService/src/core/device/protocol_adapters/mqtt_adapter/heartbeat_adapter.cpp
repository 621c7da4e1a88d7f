#include "core/device/protocol_adapters/mqtt_adapter/heartbeat_adapter.hpp"

#include <utility>

#include "core/device/protocol_adapters/payload_decoder.hpp"

namespace devstatus::core::device::protocol_adapters::mqtt {

using devstatus::core::common::log::Level;

MqttHeartbeatAdapter::MqttHeartbeatAdapter(struct mg_mgr* mgr, Options opt, manager::StatusRegistry& registry,
                                           std::shared_ptr<devstatus::core::common::log::Logger> logger)
    : opt_(std::move(opt)), registry_(registry), logger_(logger), client_(mgr, std::move(logger)) {}

std::string MqttHeartbeatAdapter::DeviceIdFromTopic(const std::string& topic, const std::string& prefix) {
  if (topic.size() <= prefix.size()) return {};
  if (topic.compare(0, prefix.size(), prefix) != 0) return {};
  std::string id = topic.substr(prefix.size());
  if (id.find('/') != std::string::npos) return {};
  return id;
}

std::string MqttHeartbeatAdapter::SubscriptionFilter(const std::string& prefix) {
  if (prefix.empty() || prefix.back() == '/') return prefix + "+";
  return "#";
}

bool MqttHeartbeatAdapter::Start() {
  if (started_) return true;
  if (opt_.client.url.empty()) return false;
  client_.SetMessageHandler(
      [this](const std::string& topic, const std::string& payload) { OnMessage(topic, payload); });
  client_.AddSubscription({SubscriptionFilter(opt_.topic_prefix), opt_.qos});
  started_ = client_.Connect(opt_.client);
  return started_;
}

void MqttHeartbeatAdapter::Poll(std::int64_t now_ms) {
  if (!started_ || client_.State() != MqttClient::Session::Closed) {
    retry_at_ms_.reset();
    return;
  }
  if (!retry_at_ms_) {
    retry_at_ms_ = now_ms + opt_.reconnect_ms;
    return;
  }
  if (now_ms < *retry_at_ms_) return;

  if (logger_) logger_->Log(Level::Info, "mqtt", "reconnecting after " + std::to_string(opt_.reconnect_ms) + "ms");
  retry_at_ms_.reset();
  if (!client_.Connect(opt_.client)) retry_at_ms_ = now_ms + opt_.reconnect_ms;
}

void MqttHeartbeatAdapter::Stop() {
  started_ = false;
  retry_at_ms_.reset();
  client_.Disconnect();
}

void MqttHeartbeatAdapter::OnMessage(const std::string& topic, const std::string& payload) {
  const std::string id = DeviceIdFromTopic(topic, opt_.topic_prefix);
  if (id.empty()) {
    ++ignored_;
    if (logger_) logger_->Log(Level::Debug, "mqtt", "ignored topic " + topic);
    return;
  }
  ++received_;
  const auto ack = registry_.Report(id, DecodeHeartbeatPayload(payload));
  if (logger_ && logger_->IsEnabled(Level::Trace)) {
    logger_->Log(Level::Trace, "mqtt",
                 "heartbeat " + id + " -> " + model::StateName(ack.state) + (ack.transitioned ? " (changed)" : ""));
  }
}

}  // namespace devstatus::core::device::protocol_adapters::mqtt
