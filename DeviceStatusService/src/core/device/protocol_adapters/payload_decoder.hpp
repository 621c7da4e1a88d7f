#pragma once

#include <string>

#include "core/device/model/status_payload.hpp"

namespace devstatus {
namespace core {
namespace device {
namespace protocol_adapters {

// Top-level members of a JSON object become payload entries. Nested objects
// and arrays are kept as their JSON text. Returns false, leaving `out`
// untouched, unless `body` is a well-formed JSON object.
bool DecodeJsonPayload(const std::string& body, model::StatusPayload& out);

// Heartbeats are JSON objects in the common case; anything else is kept
// verbatim under "raw". An empty body gives an empty payload.
model::StatusPayload DecodeHeartbeatPayload(const std::string& body);

}  // namespace protocol_adapters
}  // namespace device
}  // namespace core
}  // namespace devstatus
