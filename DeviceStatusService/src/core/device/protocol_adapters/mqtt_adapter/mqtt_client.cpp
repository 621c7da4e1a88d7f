#include "core/device/protocol_adapters/mqtt_adapter/mqtt_adapter.hpp"

#include <utility>

namespace devstatus::core::device::protocol_adapters::mqtt {

using devstatus::core::common::log::Level;

MqttClient::MqttClient(struct mg_mgr* mgr, std::shared_ptr<devstatus::core::common::log::Logger> logger)
    : mgr_(mgr), logger_(std::move(logger)) {}

MqttClient::~MqttClient() {
  if (conn_ == nullptr) return;
  // The manager polls the connection once more while closing it.
  conn_->fn_data = nullptr;
  conn_->is_closing = 1;
}

const char* MqttClient::ConnackReason(int code) {
  switch (code) {
    case 0: return "accepted";
    case 1: return "unacceptable protocol version";
    case 2: return "client id rejected";
    case 3: return "server unavailable";
    case 4: return "bad user name or password";
    case 5: return "not authorized";
    default: return "unknown reason";
  }
}

bool MqttClient::Connect(const Options& opt) {
  if (mgr_ == nullptr || opt.url.empty()) return false;
  if (session_ != Session::Closed) return true;

  opt_ = opt;
  ++attempts_;

  mg_mqtt_opts login{};
  login.client_id = mg_str(opt_.client_id.c_str());
  login.user = mg_str(opt_.user.c_str());
  login.pass = mg_str(opt_.pass.c_str());
  login.keepalive = opt_.keepalive_sec;
  login.clean = opt_.clean_session;
  login.version = opt_.version;

  conn_ = mg_mqtt_connect(mgr_, opt_.url.c_str(), &login, EventHandler, this);
  if (conn_ == nullptr) {
    if (logger_) {
      logger_->Log(Level::Warn, "mqtt", "cannot open " + opt_.url + " (attempt " + std::to_string(attempts_) + ")");
    }
    return false;
  }
  session_ = Session::Connecting;
  if (logger_) logger_->Log(Level::Info, "mqtt", "connecting to " + opt_.url);
  return true;
}

void MqttClient::Disconnect() {
  if (conn_ == nullptr) return;
  if (session_ == Session::Open) {
    mg_mqtt_opts bye{};
    mg_mqtt_disconnect(conn_, &bye);
  }
  conn_->is_closing = 1;
}

void MqttClient::AddSubscription(Subscription sub) {
  if (sub.filter.empty()) return;
  subs_.push_back(std::move(sub));
  if (session_ == Session::Open && conn_ != nullptr) SendSubscribe(conn_, subs_.back());
}

void MqttClient::SetMessageHandler(MessageHandler handler) {
  on_msg_ = std::move(handler);
}

void MqttClient::SendSubscribe(struct mg_connection* c, const Subscription& sub) {
  mg_mqtt_opts req{};
  req.topic = mg_str(sub.filter.c_str());
  req.qos = sub.qos;
  mg_mqtt_sub(c, &req);
  if (logger_) logger_->Log(Level::Info, "mqtt", "subscribed to " + sub.filter);
}

void MqttClient::EventHandler(struct mg_connection* c, int ev, void* ev_data) {
  auto* self = static_cast<MqttClient*>(c->fn_data);
  if (self == nullptr) return;

  switch (ev) {
    case MG_EV_MQTT_OPEN:
      self->OnConnack(c, ev_data != nullptr ? *static_cast<const int*>(ev_data) : -1);
      break;
    case MG_EV_MQTT_MSG:
      if (ev_data != nullptr) self->OnMessage(*static_cast<const struct mg_mqtt_message*>(ev_data));
      break;
    case MG_EV_ERROR:
      self->OnError(static_cast<const char*>(ev_data));
      break;
    case MG_EV_CLOSE:
      self->OnClosed(c);
      break;
    default:
      break;
  }
}

void MqttClient::OnConnack(struct mg_connection* c, int code) {
  if (code != 0) {
    if (logger_) {
      logger_->Log(Level::Error, "mqtt", opt_.url + " refused the session: " + ConnackReason(code));
    }
    c->is_closing = 1;
    return;
  }
  session_ = Session::Open;
  if (logger_) logger_->Log(Level::Info, "mqtt", "session open on " + opt_.url);
  for (const auto& sub : subs_) SendSubscribe(c, sub);
}

void MqttClient::OnMessage(const struct mg_mqtt_message& mm) {
  if (!on_msg_) return;
  on_msg_(std::string(mm.topic.buf, mm.topic.len), std::string(mm.data.buf, mm.data.len));
}

void MqttClient::OnError(const char* err) {
  if (logger_) logger_->Log(Level::Warn, "mqtt", std::string(err != nullptr ? err : "unknown error"));
}

void MqttClient::OnClosed(struct mg_connection* c) {
  if (c != conn_) return;
  const bool was_open = session_ == Session::Open;
  conn_ = nullptr;
  session_ = Session::Closed;
  if (logger_) {
    logger_->Log(was_open ? Level::Warn : Level::Debug, "mqtt",
                 (was_open ? "session lost: " : "no session: ") + opt_.url);
  }
}

}  // namespace devstatus::core::device::protocol_adapters::mqtt
