#pragma once

#include <memory>
#include <string>

#include "mongoose.h"

#include "core/common/logger/logger.hpp"
#include "core/device/manager/status_registry.hpp"

namespace devstatus {
namespace services {
namespace web_services {
namespace api {

struct ApiContext {
    std::string base_path = "/api";
    std::string version;

    devstatus::core::device::manager::StatusRegistry* registry = nullptr;

    std::shared_ptr<devstatus::core::common::log::Logger> logger;
};

// Status code and JSON body, before they are written to a connection.
struct ApiReply {
    int status = 200;
    std::string body;
};

// Returns false when the request is not under the API base path.
bool HandleHttpRequest(struct mg_connection* c, struct mg_http_message* hm, const ApiContext& ctx);

bool HandleSystemApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx);

bool HandleDeviceApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx);

// The /devices routes behind HandleDeviceApi. `raw_id` is the path segment as
// received (percent-encoded); query values are empty when absent.
ApiReply ListDevices(const ApiContext& ctx, const std::string& state);
ApiReply GetDevice(const ApiContext& ctx, const std::string& raw_id);
ApiReply ReportDevice(const ApiContext& ctx, const std::string& raw_id, const std::string& body,
                      const std::string& observed_at_ms);

bool DecodeDeviceId(const std::string& raw, std::string& out);

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace devstatus
