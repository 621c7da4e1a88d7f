#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/common/clock/clock.hpp"
#include "core/device/model/device_record.hpp"

namespace devstatus {
namespace core {
namespace device {
namespace manager {

// What to do with a report older than the record's last_seen_ms.
enum class OutOfOrderPolicy : std::uint8_t {
  Reject = 0,        // ignore it entirely
  MergePayload = 1   // merge its payload keys, leave state and timestamps alone
};

struct UpsertResult {
  model::DeviceRecord record;
  model::DeviceState from = model::DeviceState::Offline;
  bool created = false;
  bool applied = false;
  bool transitioned = false;
  bool payload_merged = false;
};

// Owns every DeviceRecord. Records live in shards keyed by id hash; the shard
// lock only guards the id -> slot map, each record has its own mutex. Readers
// always get copies.
//
// Mutating calls take an optional hook that runs while the record is still
// locked, so events for one device come out in the order they happened.
// Hooks must not call back into the store.
class DeviceRecordStore {
public:
  using TimestampMs = common::clock::TimestampMs;
  using TransitionHook = std::function<void(const model::TransitionEvent&)>;

  static constexpr TimestampMs kNoCutoff = std::numeric_limits<TimestampMs>::max();

  explicit DeviceRecordStore(std::size_t shard_count = 16,
                             OutOfOrderPolicy policy = OutOfOrderPolicy::Reject);

  DeviceRecordStore(const DeviceRecordStore&) = delete;
  DeviceRecordStore& operator=(const DeviceRecordStore&) = delete;

  // Empty ids are refused (applied = false, nothing stored).
  UpsertResult Upsert(const std::string& id, model::StatusPayload payload, TimestampMs observed_at,
                      const TransitionHook& hook = nullptr);

  // Online -> Stale. With a cutoff, only when last_seen_ms < seen_before.
  bool MarkStale(const std::string& id, TimestampMs at, TimestampMs seen_before = kNoCutoff,
                 const TransitionHook& hook = nullptr);

  // Stale -> Offline. Same cutoff rule as MarkStale.
  bool MarkOffline(const std::string& id, TimestampMs at, TimestampMs seen_before = kNoCutoff,
                   const TransitionHook& hook = nullptr);

  bool Has(const std::string& id) const;
  bool Get(const std::string& id, model::DeviceRecord& out) const;

  // Sorted by id. All records are locked together, so the snapshot is one
  // instant; writers wait for the copy.
  std::vector<model::DeviceRecord> List() const;
  std::vector<std::string> Ids() const;
  std::size_t Size() const;

  OutOfOrderPolicy Policy() const { return policy_; }

private:
  struct Slot {
    mutable std::mutex mu;
    model::DeviceRecord record;
  };

  struct Shard {
    mutable std::shared_mutex mu;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots;
  };

  Shard& ShardFor(const std::string& id) const;
  std::shared_ptr<Slot> Find(const std::string& id) const;

  bool Transition(const std::string& id, model::DeviceState from, model::DeviceState to,
                  TimestampMs at, TimestampMs seen_before, const TransitionHook& hook);

private:
  std::vector<std::unique_ptr<Shard>> shards_;
  OutOfOrderPolicy policy_;
  std::atomic<std::size_t> size_{0};
};

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace devstatus
