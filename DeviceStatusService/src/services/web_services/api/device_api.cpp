#include "services/web_services/api/rest_api.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/common/utils/json_utils.hpp"
#include "core/device/model/device_json.hpp"
#include "core/device/model/device_state.hpp"
#include "core/device/protocol_adapters/payload_decoder.hpp"

namespace devstatus {
namespace services {
namespace web_services {
namespace api {

namespace json = devstatus::core::common::json;
namespace model = devstatus::core::device::model;

namespace {

const std::string kDevicesPrefix = "/devices/";
const std::string kReportSuffix = "/report";

static std::string ToStdString(const struct mg_str& s) {
  return std::string(s.buf, s.len);
}

static bool IsMethod(const struct mg_http_message* hm, const char* method) {
  return mg_strcmp(hm->method, mg_str(method)) == 0;
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static ApiReply Error(int status, const char* error) {
  return ApiReply{status, json::Object({{"error", json::Quote(error)}})};
}

// Empty string when the variable is absent.
static std::string QueryVar(const struct mg_http_message* hm, const char* name) {
  char buf[128] = {0};
  const int n = mg_http_get_var(&hm->query, name, buf, sizeof(buf));
  if (n <= 0) return std::string();
  return std::string(buf, static_cast<size_t>(n));
}

static bool ParseInt64(const std::string& s, std::int64_t& out) {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') return false;
  out = static_cast<std::int64_t>(v);
  return true;
}

static bool IsBlank(const std::string& s) {
  for (char ch : s) {
    if (ch != ' ' && ch != '\t' && ch != '\r' && ch != '\n') return false;
  }
  return true;
}

}  // namespace

bool DecodeDeviceId(const std::string& raw, std::string& out) {
  if (raw.empty() || raw.find('/') != std::string::npos) return false;
  std::vector<char> buf(raw.size() + 1);
  const int n = mg_url_decode(raw.data(), raw.size(), buf.data(), buf.size(), 0);
  if (n <= 0) return false;
  out.assign(buf.data(), static_cast<size_t>(n));
  return true;
}

ApiReply ListDevices(const ApiContext& ctx, const std::string& state) {
  if (ctx.registry == nullptr) return Error(500, "registry_null");

  std::optional<model::DeviceState> filter;
  if (!state.empty()) {
    filter = model::ParseState(state);
    if (!filter) return Error(400, "invalid_state");
  }
  return ApiReply{200, model::RecordsToJson(ctx.registry->List(filter))};
}

ApiReply GetDevice(const ApiContext& ctx, const std::string& raw_id) {
  if (ctx.registry == nullptr) return Error(500, "registry_null");

  std::string id;
  model::DeviceRecord r;
  if (!DecodeDeviceId(raw_id, id) || !ctx.registry->Query(id, r)) return Error(404, "device_not_found");
  return ApiReply{200, model::RecordToJson(r, ctx.registry->ExpiresInMs(r))};
}

ApiReply ReportDevice(const ApiContext& ctx, const std::string& raw_id, const std::string& body,
                      const std::string& observed_at_ms) {
  if (ctx.registry == nullptr) return Error(500, "registry_null");

  std::string id;
  if (!DecodeDeviceId(raw_id, id)) return Error(400, "invalid_id");

  model::StatusPayload payload;
  if (!IsBlank(body) && !devstatus::core::device::protocol_adapters::DecodeJsonPayload(body, payload)) {
    return Error(400, "invalid_payload");
  }

  // Milliseconds on the registry clock (see now_ms in /stats).
  std::optional<std::int64_t> observed_at;
  if (!observed_at_ms.empty()) {
    std::int64_t v = 0;
    if (!ParseInt64(observed_at_ms, v)) return Error(400, "invalid_observed_at_ms");
    observed_at = v;
  }

  if (ctx.logger) ctx.logger->Log(core::common::log::Level::Trace, "http", "report from " + id);
  const auto ack = ctx.registry->Report(id, std::move(payload), observed_at);
  return ApiReply{ack.accepted ? 200 : 400,
                  json::Object({
                      {"accepted", json::Bool(ack.accepted)},
                      {"applied", json::Bool(ack.applied)},
                      {"transitioned", json::Bool(ack.transitioned)},
                      {"state", json::Quote(model::StateName(ack.state))},
                  })};
}

bool HandleDeviceApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx) {
  if (c == nullptr || hm == nullptr) return false;
  if (rel_path != "/devices" && !StartsWith(rel_path, kDevicesPrefix)) return false;

  ApiReply reply;
  if (IsMethod(hm, "GET") && rel_path == "/devices") {
    reply = ListDevices(ctx, QueryVar(hm, "state"));
  } else if (IsMethod(hm, "POST") && EndsWith(rel_path, kReportSuffix) &&
             rel_path.size() > kDevicesPrefix.size() + kReportSuffix.size()) {
    const std::string raw_id =
        rel_path.substr(kDevicesPrefix.size(), rel_path.size() - kDevicesPrefix.size() - kReportSuffix.size());
    reply = ReportDevice(ctx, raw_id, ToStdString(hm->body), QueryVar(hm, "observed_at_ms"));
  } else if (IsMethod(hm, "GET")) {
    reply = GetDevice(ctx, rel_path.substr(kDevicesPrefix.size()));
  } else {
    reply = Error(405, "method_not_allowed");
  }

  mg_http_reply(c, reply.status, "Content-Type: application/json\r\n", "%s\n", reply.body.c_str());
  return true;
}

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace devstatus
