#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "mongoose.h"
#include "core/common/logger/logger.hpp"

namespace devstatus::core::device::protocol_adapters::mqtt {

// Broker session behind the heartbeat listener. Subscriptions are replayed on
// every accepted CONNACK, so a new session resumes delivery. Calls and
// callbacks all happen on the thread polling `mgr`.
class MqttClient {
public:
  struct Options {
    std::string url;
    std::string client_id;
    std::string user;
    std::string pass;
    std::uint16_t keepalive_sec = 30;
    bool clean_session = true;
    std::uint8_t version = 4;
  };

  enum class Session : std::uint8_t {
    Closed = 0,
    Connecting = 1,
    Open = 2
  };

  struct Subscription {
    std::string filter;
    std::uint8_t qos = 0;
  };

  using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

  MqttClient(struct mg_mgr* mgr, std::shared_ptr<devstatus::core::common::log::Logger> logger);
  ~MqttClient();

  MqttClient(const MqttClient&) = delete;
  MqttClient& operator=(const MqttClient&) = delete;

  // Opens a new session unless one is already connecting or open.
  bool Connect(const Options& opt);
  void Disconnect();

  void AddSubscription(Subscription sub);
  void SetMessageHandler(MessageHandler handler);

  Session State() const { return session_; }
  std::uint32_t ConnectAttempts() const { return attempts_; }

  // Text for an MQTT 3.1.1 CONNACK return code.
  static const char* ConnackReason(int code);

private:
  static void EventHandler(struct mg_connection* c, int ev, void* ev_data);
  void OnConnack(struct mg_connection* c, int code);
  void OnMessage(const struct mg_mqtt_message& mm);
  void OnError(const char* err);
  void OnClosed(struct mg_connection* c);
  void SendSubscribe(struct mg_connection* c, const Subscription& sub);

private:
  struct mg_mgr* mgr_ = nullptr;
  struct mg_connection* conn_ = nullptr;
  Options opt_;
  std::vector<Subscription> subs_;
  Session session_ = Session::Closed;
  std::uint32_t attempts_ = 0;
  MessageHandler on_msg_;
  std::shared_ptr<devstatus::core::common::log::Logger> logger_;
};

}  // namespace devstatus::core::device::protocol_adapters::mqtt
