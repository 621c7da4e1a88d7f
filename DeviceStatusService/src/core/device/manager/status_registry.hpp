#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/common/clock/clock.hpp"
#include "core/common/logger/logger.hpp"
#include "core/device/events/event_notifier.hpp"
#include "core/device/manager/device_record_store.hpp"
#include "core/device/manager/registry_options.hpp"
#include "core/device/model/device_record.hpp"
#include "core/device/staleness/staleness_engine.hpp"

namespace devstatus {
namespace core {
namespace device {
namespace manager {

struct ReportAck {
  bool accepted = false;      // false only for an empty id
  bool applied = false;       // false for an out-of-order report
  bool transitioned = false;
  model::DeviceState state = model::DeviceState::Offline;
};

// Entry point for transports. Thread-safe; every method may be called from
// any thread while the sweep runs.
class StatusRegistry {
public:
  using TimestampMs = common::clock::TimestampMs;
  using DurationMs = common::clock::DurationMs;

  // Returns nullptr and fills `errors` when the options are malformed.
  static std::unique_ptr<StatusRegistry> Create(RegistryOptions opt,
                                                std::shared_ptr<const common::clock::Clock> clock,
                                                std::shared_ptr<common::log::Logger> logger,
                                                std::vector<std::string>& errors);
  ~StatusRegistry();

  StatusRegistry(const StatusRegistry&) = delete;
  StatusRegistry& operator=(const StatusRegistry&) = delete;

  // `observed_at` defaults to the registry clock. Timestamps ahead of the
  // clock are clamped to it.
  ReportAck Report(const std::string& id, model::StatusPayload payload,
                   std::optional<TimestampMs> observed_at = std::nullopt);

  bool Query(const std::string& id, model::DeviceRecord& out) const;
  std::vector<model::DeviceRecord> List(std::optional<model::DeviceState> filter = std::nullopt) const;

  // Without options the registry's subscriber defaults apply.
  events::SubscriptionId Subscribe(events::Listener listener,
                                   std::optional<events::SubscriberOptions> opt = std::nullopt);
  bool Unsubscribe(events::SubscriptionId id);

  staleness::SweepResult SweepOnce();

  // Starts the sweep thread (Active strategy only). Stop also drains and
  // stops event delivery; the registry keeps answering queries afterwards.
  bool Start();
  void Stop();

  std::size_t Size() const { return store_.Size(); }
  std::optional<DurationMs> ExpiresInMs(const model::DeviceRecord& r) const;
  TimestampMs Now() const { return clock_->NowMs(); }

  const RegistryOptions& Options() const { return opt_; }
  events::EventNotifier& Notifier() { return notifier_; }
  const events::EventNotifier& Notifier() const { return notifier_; }

private:
  StatusRegistry(RegistryOptions opt, std::shared_ptr<const common::clock::Clock> clock,
                 std::shared_ptr<common::log::Logger> logger);

  DeviceRecordStore::TransitionHook PublishHook();
  model::DeviceRecord View(model::DeviceRecord r, TimestampMs now) const;

private:
  RegistryOptions opt_;
  std::shared_ptr<const common::clock::Clock> clock_;
  std::shared_ptr<common::log::Logger> logger_;

  DeviceRecordStore store_;
  events::EventNotifier notifier_;
  staleness::StalenessEngine engine_;
};

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace devstatus
