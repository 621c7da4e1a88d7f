#include "service/service_core.h"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "core/common/clock/clock.hpp"
#include "core/common/config/config_manager.hpp"
#include "core/common/logger/logger.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/device/manager/registry_options.hpp"
#include "core/device/manager/status_registry.hpp"
#include "core/device/protocol_adapters/mqtt_adapter/heartbeat_adapter.hpp"
#include "services/event_sinks/log_event_sink.hpp"
#include "services/event_sinks/ws_event_sink.hpp"
#include "services/web_services/api/rest_api.hpp"
#include "services/web_services/websocket/websocket_server.hpp"

namespace devstatus {
namespace service {

namespace log = devstatus::core::common::log;
namespace manager = devstatus::core::device::manager;
namespace mqtt = devstatus::core::device::protocol_adapters::mqtt;
namespace websocket = devstatus::services::web_services::websocket;

namespace {

constexpr const char* kVersion = "1.0.0";

std::atomic<bool>& RunningFlag() {
  static std::atomic<bool> running{true};
  return running;
}

void HandleSignal(int) {
  RunningFlag().store(false);
}

std::shared_ptr<log::Logger> MakeLogger(const std::string& log_file) {
  if (log_file.empty()) return std::make_shared<log::Logger>(std::make_shared<log::ConsoleSink>());

  const std::filesystem::path p(log_file);
  std::error_code ec;
  if (!p.parent_path().empty()) std::filesystem::create_directories(p.parent_path(), ec);
  if (ec) std::cerr << "cannot create log directory " << p.parent_path().string() << ": " << ec.message() << "\n";
  return std::make_shared<log::Logger>(std::make_shared<log::FileSink>(p));
}

mqtt::MqttHeartbeatAdapter::Options MqttOptions(const core::common::config::ConfigManager& cfg) {
  mqtt::MqttHeartbeatAdapter::Options mo;
  mo.client.url = cfg.GetStringOr("mqtt.url", "");
  mo.client.client_id = cfg.GetStringOr("mqtt.client_id", "devstatus");
  mo.client.user = cfg.GetStringOr("mqtt.user", "");
  mo.client.pass = cfg.GetStringOr("mqtt.pass", "");
  const std::int64_t keepalive = cfg.GetInt64Or("mqtt.keepalive_sec", 30);
  if (keepalive > 0 && keepalive <= 65535) mo.client.keepalive_sec = static_cast<std::uint16_t>(keepalive);
  mo.topic_prefix = cfg.GetStringOr("mqtt.topic_prefix", mo.topic_prefix);
  std::int64_t reconnect_ms = 0;
  if (cfg.GetDurationMs("mqtt.reconnect", reconnect_ms) && reconnect_ms > 0) mo.reconnect_ms = reconnect_ms;
  return mo;
}

}  // namespace

Args ParseArgs(int argc, const char* const* argv, std::vector<std::string>& errors) {
  Args out;
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];

    auto take_value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) {
        errors.push_back("missing value for " + std::string(a));
        return std::nullopt;
      }
      ++i;
      return std::string(argv[i]);
    };

    if (a == "--config") {
      if (auto v = take_value()) out.config_yaml = std::move(*v);
    } else if (a == "--log-file") {
      if (auto v = take_value()) out.log_file = std::move(*v);
    } else if (a == "--log-level") {
      if (auto v = take_value()) out.log_level = std::move(*v);
    } else {
      errors.push_back("unknown argument " + std::string(a));
    }
  }
  return out;
}

int ServiceCore::Run(const Args& args) {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  core::common::config::ConfigManager cfg;
  if (!args.config_yaml.empty() && !cfg.LoadYamlFile(args.config_yaml)) {
    std::cerr << "failed to load " << args.config_yaml << ": " << cfg.LastError() << "\n";
    return 2;
  }

  const std::string log_file =
      args.log_file ? *args.log_file : cfg.GetStringOr("log_file", "logs/device_status.log");
  const std::string log_level = args.log_level ? *args.log_level : cfg.GetStringOr("log_level", "info");

  auto logger = MakeLogger(log_file);
  if (const auto lvl = log::ParseLevel(log_level); lvl.has_value()) {
    logger->SetLevel(*lvl);
  } else {
    logger->Warn("unknown log_level '" + log_level + "', using info");
  }

  logger->Info(std::string("devstatus ") + kVersion + " starting");
  logger->Info("log_file=" + (log_file.empty() ? std::string("<stderr>") : log_file));

  std::vector<std::string> errors;
  manager::RegistryOptions opt;
  std::unique_ptr<manager::StatusRegistry> registry;
  if (manager::LoadOptions(cfg, opt, errors)) {
    registry = manager::StatusRegistry::Create(std::move(opt), std::make_shared<core::common::clock::SteadyClock>(),
                                               logger, errors);
  }
  if (!registry) {
    for (const auto& e : errors) {
      logger->Log(log::Level::Error, "config", e);
      std::cerr << e << "\n";
    }
    logger->Flush();
    return 2;
  }

  const auto& ro = registry->Options();
  logger->Info("stale_after=" + core::common::time::FormatDurationMs(ro.thresholds.stale_after_ms) +
               " offline_after=" + core::common::time::FormatDurationMs(ro.thresholds.offline_after_ms) +
               " overrides=" + std::to_string(ro.overrides.size()));

  services::web_services::api::ApiContext api;
  api.version = kVersion;
  api.registry = registry.get();
  api.logger = logger;

  websocket::MongooseServer::Options web_opt;
  web_opt.listen_addr = cfg.GetStringOr("http.listen", "");
  websocket::MongooseServer web_server(web_opt, api, logger);

  registry->Subscribe(services::event_sinks::LogEventSink(logger));

  if (!web_opt.listen_addr.empty()) {
    if (!web_server.Start()) {
      registry->Stop();
      logger->Flush();
      return 1;
    }
    registry->Subscribe(services::event_sinks::WsEventSink(web_server));
  }

  mqtt::MqttHeartbeatAdapter heartbeats(web_server.GetMgr(), MqttOptions(cfg), *registry, logger);
  const bool mqtt_enabled = heartbeats.Start();
  if (mqtt_enabled) logger->Info("listening for heartbeats via " + heartbeats.Name());

  registry->Start();

  std::int64_t last_heartbeat_ms = 0;

  while (RunningFlag().load()) {
    web_server.Poll(50);
    if (mqtt_enabled) heartbeats.Poll(registry->Now());

    const auto now = core::common::time::NowUnixMs();
    if (last_heartbeat_ms == 0 || now - last_heartbeat_ms >= 10'000) {
      last_heartbeat_ms = now;
      logger->Debug("heartbeat devices=" + std::to_string(registry->Size()) +
                    " dropped_events=" + std::to_string(registry->Notifier().TotalDropped()));
      logger->Flush();
    }
  }

  logger->Info("devstatus stopping");
  if (mqtt_enabled) {
    heartbeats.Stop();
    logger->Info("mqtt heartbeats received=" + std::to_string(heartbeats.Received()) +
                 " ignored=" + std::to_string(heartbeats.Ignored()));
  }
  registry->Stop();
  web_server.Poll(0);

  logger->Info("devstatus stopped");
  logger->Flush();
  return 0;
}

}  // namespace service
}  // namespace devstatus
