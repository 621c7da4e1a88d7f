#pragma once

#include "core/device/model/device_json.hpp"
#include "services/web_services/websocket/websocket_server.hpp"

namespace devstatus::services::event_sinks {

// Pushes each transition to every connected WebSocket client as a JSON frame.
class WsEventSink {
public:
  explicit WsEventSink(web_services::websocket::MongooseServer& server) : server_(server) {}

  void operator()(const core::device::model::TransitionEvent& e) const {
    server_.QueueBroadcast(core::device::model::EventToJson(e));
  }

private:
  web_services::websocket::MongooseServer& server_;
};

}  // namespace devstatus::services::event_sinks
