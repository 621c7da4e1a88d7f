#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "mongoose.h"
#include "core/common/logger/logger.hpp"
#include "services/web_services/api/rest_api.hpp"

namespace devstatus::services::web_services::websocket {

// Single-threaded like mongoose itself: Start, Poll and the handlers run on
// the service loop thread. QueueBroadcast is the only method other threads
// may call; frames are sent on the next Poll.
class MongooseServer {
public:
  struct Options {
    std::string listen_addr = "http://0.0.0.0:8000";
    std::string ws_path = "/ws";
    std::size_t outbox_capacity = 4096;
  };

  explicit MongooseServer(Options opt, api::ApiContext api,
                          std::shared_ptr<devstatus::core::common::log::Logger> logger)
      : opt_(std::move(opt)), api_(std::move(api)), logger_(std::move(logger)) {
    mg_mgr_init(&mgr_);
  }

  ~MongooseServer() {
    mg_mgr_free(&mgr_);
  }

  MongooseServer(const MongooseServer&) = delete;
  MongooseServer& operator=(const MongooseServer&) = delete;

  bool Start() {
    if (mg_http_listen(&mgr_, opt_.listen_addr.c_str(), EventHandler, this) == nullptr) {
      if (logger_) logger_->Error("Failed to listen on " + opt_.listen_addr);
      return false;
    }
    if (logger_) logger_->Info("HTTP listening on " + opt_.listen_addr + ", websocket at " + opt_.ws_path);
    return true;
  }

  void Poll(int timeout_ms) {
    FlushOutbox();
    mg_mgr_poll(&mgr_, timeout_ms);
  }

  // Oldest frame is dropped when the outbox is full.
  void QueueBroadcast(std::string text) {
    std::lock_guard<std::mutex> lk(outbox_mu_);
    if (outbox_.size() >= opt_.outbox_capacity) {
      outbox_.pop_front();
      ++outbox_dropped_;
    }
    outbox_.push_back(std::move(text));
  }

  mg_mgr* GetMgr() { return &mgr_; }

private:
  static void EventHandler(struct mg_connection* c, int ev, void* ev_data) {
    auto* self = static_cast<MongooseServer*>(c->fn_data);
    self->HandleEvent(c, ev, ev_data);
  }

  void FlushOutbox() {
    std::deque<std::string> frames;
    std::uint64_t dropped = 0;
    {
      std::lock_guard<std::mutex> lk(outbox_mu_);
      frames.swap(outbox_);
      dropped = outbox_dropped_;
      outbox_dropped_ = 0;
    }
    if (dropped > 0 && logger_) {
      logger_->Log(devstatus::core::common::log::Level::Warn, "ws",
                   "dropped " + std::to_string(dropped) + " queued frames");
    }
    for (const auto& text : frames) BroadcastText(text);
  }

  void BroadcastText(const std::string& text) {
    for (auto* c : ws_conns_) {
      if (c != nullptr && c->is_websocket) {
        mg_ws_send(c, text.data(), text.size(), WEBSOCKET_OP_TEXT);
      }
    }
  }

  void HandleEvent(struct mg_connection* c, int ev, void* ev_data) {
    if (ev == MG_EV_HTTP_MSG) {
      struct mg_http_message* hm = (struct mg_http_message*)ev_data;
      const std::string uri(hm->uri.buf, hm->uri.len);

      if (logger_) logger_->Debug("HTTP request: " + uri);

      if (mg_match(hm->uri, mg_str(opt_.ws_path.c_str()), NULL)) {
        mg_ws_upgrade(c, hm, nullptr);
      } else if (!api::HandleHttpRequest(c, hm, api_)) {
        mg_http_reply(c, 404, "", "Not Found\n");
      }
    } else if (ev == MG_EV_WS_OPEN) {
      ws_conns_.push_back(c);
      if (logger_) logger_->Debug("WS client connected, " + std::to_string(ws_conns_.size()) + " open");
    } else if (ev == MG_EV_WS_MSG) {
      // The stream is push-only; client frames are ignored.
      struct mg_ws_message* wm = (struct mg_ws_message*)ev_data;
      if (logger_) logger_->Trace("WS message ignored: " + std::string(wm->data.buf, wm->data.len));
    } else if (ev == MG_EV_CLOSE) {
      if (c != nullptr && c->is_websocket && !ws_conns_.empty()) {
        for (size_t i = 0; i < ws_conns_.size(); ++i) {
          if (ws_conns_[i] == c) {
            ws_conns_.erase(ws_conns_.begin() + static_cast<long>(i));
            break;
          }
        }
      }
    }
  }

private:
  Options opt_;
  api::ApiContext api_;
  std::shared_ptr<devstatus::core::common::log::Logger> logger_;
  struct mg_mgr mgr_;
  std::vector<struct mg_connection*> ws_conns_;

  std::mutex outbox_mu_;
  std::deque<std::string> outbox_;
  std::uint64_t outbox_dropped_ = 0;
};

}  // namespace devstatus::services::web_services::websocket
