#include "core/device/manager/status_registry.hpp"

#include <string>
#include <utility>
#include <vector>

namespace devstatus {
namespace core {
namespace device {
namespace manager {

using common::log::Level;
using model::DeviceRecord;
using model::DeviceState;

namespace {

staleness::StalenessEngine::Options EngineOptions(const RegistryOptions& opt) {
  staleness::StalenessEngine::Options eo;
  eo.defaults = opt.thresholds;
  eo.overrides = opt.overrides;
  eo.sweep_period_ms = opt.sweep_period_ms;
  eo.strategy = opt.strategy;
  return eo;
}

}  // namespace

std::unique_ptr<StatusRegistry> StatusRegistry::Create(RegistryOptions opt,
                                                       std::shared_ptr<const common::clock::Clock> clock,
                                                       std::shared_ptr<common::log::Logger> logger,
                                                       std::vector<std::string>& errors) {
  auto found = ValidateOptions(opt);
  if (!clock) found.push_back("registry: clock is required");
  if (!found.empty()) {
    if (logger) {
      for (const auto& e : found) logger->Log(Level::Error, "registry", "invalid configuration: " + e);
    }
    for (auto& e : found) errors.push_back(std::move(e));
    return nullptr;
  }
  return std::unique_ptr<StatusRegistry>(new StatusRegistry(std::move(opt), std::move(clock), std::move(logger)));
}

StatusRegistry::StatusRegistry(RegistryOptions opt, std::shared_ptr<const common::clock::Clock> clock,
                               std::shared_ptr<common::log::Logger> logger)
    : opt_(std::move(opt)),
      clock_(std::move(clock)),
      logger_(std::move(logger)),
      store_(opt_.shard_count, opt_.out_of_order),
      notifier_(logger_),
      engine_(EngineOptions(opt_), store_, clock_, logger_) {}

StatusRegistry::~StatusRegistry() { Stop(); }

DeviceRecordStore::TransitionHook StatusRegistry::PublishHook() {
  return [this](const model::TransitionEvent& e) { notifier_.Publish(e); };
}

ReportAck StatusRegistry::Report(const std::string& id, model::StatusPayload payload,
                                 std::optional<TimestampMs> observed_at) {
  ReportAck ack;
  if (id.empty()) {
    if (logger_) logger_->Log(Level::Debug, "registry", "report without device id ignored");
    return ack;
  }

  // last_seen_ms never runs ahead of the registry clock.
  const TimestampMs now = clock_->NowMs();
  TimestampMs at = now;
  if (observed_at) {
    if (*observed_at > now) {
      if (logger_) {
        logger_->Log(Level::Debug, "registry",
                     "report for " + id + " at " + std::to_string(*observed_at) + " is ahead of the clock, using " +
                         std::to_string(now));
      }
    } else {
      at = *observed_at;
    }
  }
  const UpsertResult res = store_.Upsert(id, std::move(payload), at, PublishHook());

  ack.accepted = true;
  ack.applied = res.applied;
  ack.transitioned = res.transitioned;
  ack.state = res.record.state;

  if (!res.applied && logger_) {
    logger_->Log(Level::Debug, "registry",
                 "out-of-order report for " + id + " at " + std::to_string(at) + " < last_seen " +
                     std::to_string(res.record.last_seen_ms) + (res.payload_merged ? ", payload merged" : ""));
  }
  return ack;
}

DeviceRecord StatusRegistry::View(DeviceRecord r, TimestampMs now) const {
  if (opt_.strategy == staleness::Strategy::Lazy) r.state = engine_.EffectiveState(r, now);
  return r;
}

bool StatusRegistry::Query(const std::string& id, DeviceRecord& out) const {
  DeviceRecord r;
  if (!store_.Get(id, r)) return false;
  out = View(std::move(r), clock_->NowMs());
  return true;
}

std::vector<DeviceRecord> StatusRegistry::List(std::optional<DeviceState> filter) const {
  const TimestampMs now = clock_->NowMs();
  std::vector<DeviceRecord> all = store_.List();
  std::vector<DeviceRecord> out;
  out.reserve(all.size());
  for (auto& r : all) {
    DeviceRecord v = View(std::move(r), now);
    if (filter && v.state != *filter) continue;
    out.push_back(std::move(v));
  }
  return out;
}

events::SubscriptionId StatusRegistry::Subscribe(events::Listener listener,
                                                 std::optional<events::SubscriberOptions> opt) {
  return notifier_.Subscribe(std::move(listener), opt ? std::move(*opt) : opt_.subscriber_defaults);
}

bool StatusRegistry::Unsubscribe(events::SubscriptionId id) { return notifier_.Unsubscribe(id); }

staleness::SweepResult StatusRegistry::SweepOnce() { return engine_.SweepOnce(PublishHook()); }

bool StatusRegistry::Start() { return engine_.Start(PublishHook()); }

void StatusRegistry::Stop() {
  engine_.Stop();
  notifier_.Stop();
}

std::optional<StatusRegistry::DurationMs> StatusRegistry::ExpiresInMs(const DeviceRecord& r) const {
  return engine_.ExpiresInMs(r, clock_->NowMs());
}

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace devstatus
