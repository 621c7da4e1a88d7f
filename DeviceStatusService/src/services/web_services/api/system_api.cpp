#include "services/web_services/api/rest_api.hpp"

#include <cstdint>
#include <string>

#include "core/common/utils/json_utils.hpp"
#include "core/device/model/device_state.hpp"

namespace devstatus {
namespace services {
namespace web_services {
namespace api {

namespace json = devstatus::core::common::json;
using devstatus::core::device::model::DeviceState;

namespace {

static std::string ToStdString(const struct mg_str& s) {
  return std::string(s.buf, s.len);
}

static std::string NormalizeBasePath(std::string p) {
  if (p.empty()) return std::string("/api");
  if (p[0] != '/') p.insert(p.begin(), '/');
  while (p.size() > 1 && p.back() == '/') p.pop_back();
  return p;
}

static bool StripBasePath(const std::string& uri, const std::string& base_path, std::string& out_rel) {
  if (base_path.empty() || base_path == "/") {
    out_rel = uri;
    return true;
  }
  if (uri == base_path) {
    out_rel = "/";
    return true;
  }
  const std::string prefix = base_path + "/";
  if (uri.size() >= prefix.size() && uri.compare(0, prefix.size(), prefix) == 0) {
    out_rel = uri.substr(base_path.size());
    if (out_rel.empty()) out_rel = "/";
    return true;
  }
  return false;
}

static bool IsMethod(const struct mg_http_message* hm, const char* method) {
  return mg_strcmp(hm->method, mg_str(method)) == 0;
}

static std::string StatsJson(const devstatus::core::device::manager::StatusRegistry& registry) {
  std::uint64_t online = 0, stale = 0, offline = 0;
  for (const auto& r : registry.List()) {
    switch (r.state) {
      case DeviceState::Online: ++online; break;
      case DeviceState::Stale: ++stale; break;
      case DeviceState::Offline: ++offline; break;
    }
  }
  const auto& notifier = registry.Notifier();
  return json::Object({
      {"devices", json::Number(online + stale + offline)},
      {"online", json::Number(online)},
      {"stale", json::Number(stale)},
      {"offline", json::Number(offline)},
      {"subscribers", json::Number(static_cast<std::uint64_t>(notifier.SubscriberCount()))},
      {"dropped_events", json::Number(notifier.TotalDropped())},
      {"now_ms", json::Number(static_cast<std::int64_t>(registry.Now()))},
  });
}

}  // namespace

bool HandleHttpRequest(struct mg_connection* c, struct mg_http_message* hm, const ApiContext& ctx) {
  if (c == nullptr || hm == nullptr) return false;

  const std::string uri = ToStdString(hm->uri);
  const std::string base_path = NormalizeBasePath(ctx.base_path);

  std::string rel_path;
  if (!StripBasePath(uri, base_path, rel_path)) return false;

  if (HandleSystemApi(c, hm, rel_path, ctx)) return true;
  if (HandleDeviceApi(c, hm, rel_path, ctx)) return true;

  mg_http_reply(c, 404, "Content-Type: application/json\r\n", "{\"error\":\"not_found\"}\n");
  return true;
}

bool HandleSystemApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx) {
  if (IsMethod(hm, "GET") && rel_path == "/health") {
    mg_http_reply(c, 200, "Content-Type: application/json\r\n", "{\"status\":\"ok\"}\n");
    return true;
  }

  if (IsMethod(hm, "GET") && rel_path == "/version") {
    const std::string body = json::Object({{"version", json::Quote(ctx.version)}});
    mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", body.c_str());
    return true;
  }

  if (IsMethod(hm, "GET") && rel_path == "/stats") {
    if (ctx.registry == nullptr) {
      mg_http_reply(c, 500, "Content-Type: application/json\r\n", "{\"error\":\"registry_null\"}\n");
      return true;
    }
    const std::string body = StatsJson(*ctx.registry);
    mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", body.c_str());
    return true;
  }

  return false;
}

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace devstatus
