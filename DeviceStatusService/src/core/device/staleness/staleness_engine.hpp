#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "core/common/clock/clock.hpp"
#include "core/common/logger/logger.hpp"
#include "core/device/manager/device_record_store.hpp"
#include "core/device/model/device_record.hpp"

namespace devstatus::core::device::staleness {

using common::clock::DurationMs;
using common::clock::TimestampMs;

enum class Strategy : std::uint8_t {
  Active = 0,  // background sweep mutates the store and emits events
  Lazy   = 1   // no sweep; reads derive the state from the clock
};

struct Thresholds {
  DurationMs stale_after_ms = 5 * 60 * 1000;
  DurationMs offline_after_ms = 15 * 60 * 1000;
};

struct SweepResult {
  std::size_t examined = 0;
  std::size_t went_stale = 0;
  std::size_t went_offline = 0;
};

// Decides when records have gone quiet. A record is stale once
// now - last_seen_ms > stale_after_ms and offline once it exceeds
// offline_after_ms. A sweep that finds an Online record past both limits
// walks it through Stale to Offline, emitting both events.
class StalenessEngine {
public:
  struct Options {
    Thresholds defaults;
    std::unordered_map<std::string, Thresholds> overrides;
    DurationMs sweep_period_ms = 10'000;
    Strategy strategy = Strategy::Active;
  };

  StalenessEngine(Options opt, manager::DeviceRecordStore& store,
                  std::shared_ptr<const common::clock::Clock> clock,
                  std::shared_ptr<common::log::Logger> logger = nullptr);
  ~StalenessEngine();

  StalenessEngine(const StalenessEngine&) = delete;
  StalenessEngine& operator=(const StalenessEngine&) = delete;

  Thresholds ThresholdsFor(const std::string& id) const;

  // Read-only view: what a sweep run at `now` would leave the record in.
  model::DeviceState EffectiveState(const model::DeviceRecord& r, TimestampMs now) const;

  // Time until the record's next sweep transition; nullopt once Offline.
  std::optional<DurationMs> ExpiresInMs(const model::DeviceRecord& r, TimestampMs now) const;

  SweepResult SweepOnce(const manager::DeviceRecordStore::TransitionHook& hook);

  // Starts the periodic sweep thread. Returns false for the Lazy strategy or
  // when already running.
  bool Start(manager::DeviceRecordStore::TransitionHook hook);
  // Wakes the thread and joins it. The record being swept is finished first.
  void Stop();
  bool IsRunning() const { return running_.load(); }

private:
  void Run(manager::DeviceRecordStore::TransitionHook hook);

private:
  Options opt_;
  manager::DeviceRecordStore& store_;
  std::shared_ptr<const common::clock::Clock> clock_;
  std::shared_ptr<common::log::Logger> logger_;

  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace devstatus::core::device::staleness
