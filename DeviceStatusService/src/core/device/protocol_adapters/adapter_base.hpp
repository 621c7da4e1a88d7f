#pragma once

#include <cstdint>
#include <string>

namespace devstatus {
namespace core {
namespace device {
namespace protocol_adapters {

// Turns inbound traffic of one transport into StatusRegistry::Report calls.
// Every method runs on the thread that owns the transport's event loop.
class AdapterBase {
public:
  virtual ~AdapterBase() = default;

  virtual std::string Name() const = 0;

  // False when the transport is not configured or cannot be opened.
  virtual bool Start() = 0;

  // Called from the owning loop between polls; `now_ms` is monotonic.
  virtual void Poll(std::int64_t now_ms) = 0;

  virtual void Stop() = 0;
};

}  // namespace protocol_adapters
}  // namespace device
}  // namespace core
}  // namespace devstatus
