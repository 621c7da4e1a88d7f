#pragma once

#include <memory>
#include <string>
#include <utility>

#include "core/common/logger/logger.hpp"
#include "core/device/model/device_record.hpp"

namespace devstatus::services::event_sinks {

// "device 42 marked OFFLINE (was STALE)"; "device 42 registered ONLINE" for new ids.
inline std::string DescribeTransition(const core::device::model::TransitionEvent& e) {
  auto upper = [](const char* s) {
    std::string out(s);
    for (char& c : out) {
      if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return out;
  };

  const std::string to = upper(core::device::model::StateName(e.to));
  if (e.first_seen) return "device " + e.device_id + " registered " + to;
  return "device " + e.device_id + " marked " + to + " (was " + upper(core::device::model::StateName(e.from)) + ")";
}

// Status-change journal: one log line per transition. Going offline is a
// warning, everything else is informational.
class LogEventSink {
public:
  explicit LogEventSink(std::shared_ptr<core::common::log::Logger> logger) : logger_(std::move(logger)) {}

  void operator()(const core::device::model::TransitionEvent& e) const {
    if (!logger_) return;
    const auto level = (e.to == core::device::model::DeviceState::Offline) ? core::common::log::Level::Warn
                                                                          : core::common::log::Level::Info;
    logger_->Log(level, "status", DescribeTransition(e));
  }

private:
  std::shared_ptr<core::common::log::Logger> logger_;
};

}  // namespace devstatus::services::event_sinks
