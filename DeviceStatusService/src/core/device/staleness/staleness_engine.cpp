#include "core/device/staleness/staleness_engine.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace devstatus::core::device::staleness {

using common::clock::SaturatingAdd;
using common::clock::SaturatingSub;
using model::DeviceRecord;
using model::DeviceState;

StalenessEngine::StalenessEngine(Options opt, manager::DeviceRecordStore& store,
                                 std::shared_ptr<const common::clock::Clock> clock,
                                 std::shared_ptr<common::log::Logger> logger)
    : opt_(std::move(opt)), store_(store), clock_(std::move(clock)), logger_(std::move(logger)) {}

StalenessEngine::~StalenessEngine() { Stop(); }

Thresholds StalenessEngine::ThresholdsFor(const std::string& id) const {
  const auto it = opt_.overrides.find(id);
  if (it != opt_.overrides.end()) return it->second;
  return opt_.defaults;
}

DeviceState StalenessEngine::EffectiveState(const DeviceRecord& r, TimestampMs now) const {
  if (r.state == DeviceState::Offline) return DeviceState::Offline;

  const Thresholds t = ThresholdsFor(r.id);
  const DurationMs idle = SaturatingSub(now, r.last_seen_ms);
  if (idle > t.offline_after_ms) return DeviceState::Offline;
  if (idle > t.stale_after_ms) return DeviceState::Stale;
  return r.state;
}

std::optional<DurationMs> StalenessEngine::ExpiresInMs(const DeviceRecord& r, TimestampMs now) const {
  const Thresholds t = ThresholdsFor(r.id);
  DurationMs deadline = 0;
  switch (r.state) {
    case DeviceState::Online:
      deadline = SaturatingAdd(r.last_seen_ms, t.stale_after_ms);
      break;
    case DeviceState::Stale:
      deadline = SaturatingAdd(r.last_seen_ms, t.offline_after_ms);
      break;
    default:
      return std::nullopt;
  }
  const DurationMs left = SaturatingSub(deadline, now);
  return left > 0 ? left : 0;
}

SweepResult StalenessEngine::SweepOnce(const manager::DeviceRecordStore::TransitionHook& hook) {
  SweepResult res;
  const TimestampMs now = clock_->NowMs();

  for (const auto& id : store_.Ids()) {
    ++res.examined;
    const Thresholds t = ThresholdsFor(id);
    // Cutoffs are rechecked under the record lock, so a report that lands
    // mid-sweep keeps the device online.
    if (store_.MarkStale(id, now, SaturatingSub(now, t.stale_after_ms), hook)) ++res.went_stale;
    if (store_.MarkOffline(id, now, SaturatingSub(now, t.offline_after_ms), hook)) ++res.went_offline;
  }

  if (logger_ && (res.went_stale > 0 || res.went_offline > 0)) {
    logger_->Log(common::log::Level::Debug, "sweep",
                 "examined=" + std::to_string(res.examined) +
                     " stale=" + std::to_string(res.went_stale) +
                     " offline=" + std::to_string(res.went_offline));
  }
  return res;
}

bool StalenessEngine::Start(manager::DeviceRecordStore::TransitionHook hook) {
  if (opt_.strategy != Strategy::Active) {
    if (logger_) logger_->Info("staleness: lazy evaluation, no sweep thread");
    return false;
  }
  if (running_.exchange(true)) return false;

  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&StalenessEngine::Run, this, std::move(hook));
  if (logger_) {
    logger_->Info("staleness: sweeping every " + std::to_string(opt_.sweep_period_ms) + "ms");
  }
  return true;
}

void StalenessEngine::Stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  if (running_.exchange(false) && logger_) logger_->Info("staleness: sweep stopped");
}

void StalenessEngine::Run(manager::DeviceRecordStore::TransitionHook hook) {
  const auto period = std::chrono::milliseconds(opt_.sweep_period_ms > 0 ? opt_.sweep_period_ms : 1);
  std::unique_lock<std::mutex> lk(mu_);
  while (!stop_requested_) {
    if (cv_.wait_for(lk, period, [this] { return stop_requested_; })) break;
    lk.unlock();
    SweepOnce(hook);
    lk.lock();
  }
}

}  // namespace devstatus::core::device::staleness
