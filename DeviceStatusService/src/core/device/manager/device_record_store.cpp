#include "core/device/manager/device_record_store.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace devstatus {
namespace core {
namespace device {
namespace manager {

using model::DeviceRecord;
using model::DeviceState;
using model::TransitionEvent;

DeviceRecordStore::DeviceRecordStore(std::size_t shard_count, OutOfOrderPolicy policy)
    : policy_(policy) {
  if (shard_count == 0) shard_count = 1;
  shards_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i) shards_.push_back(std::make_unique<Shard>());
}

DeviceRecordStore::Shard& DeviceRecordStore::ShardFor(const std::string& id) const {
  const std::size_t h = std::hash<std::string>{}(id);
  return *shards_[h % shards_.size()];
}

std::shared_ptr<DeviceRecordStore::Slot> DeviceRecordStore::Find(const std::string& id) const {
  const Shard& shard = ShardFor(id);
  std::shared_lock<std::shared_mutex> lk(shard.mu);
  const auto it = shard.slots.find(id);
  if (it == shard.slots.end()) return nullptr;
  return it->second;
}

UpsertResult DeviceRecordStore::Upsert(const std::string& id, model::StatusPayload payload,
                                       TimestampMs observed_at, const TransitionHook& hook) {
  UpsertResult result;
  if (id.empty()) return result;

  std::shared_ptr<Slot> slot = Find(id);
  if (!slot) {
    Shard& shard = ShardFor(id);
    std::unique_lock<std::shared_mutex> shard_lk(shard.mu);
    const auto it = shard.slots.find(id);
    if (it != shard.slots.end()) {
      slot = it->second;
    } else {
      // Lock the new slot before publishing it in the map so nobody can read
      // a half-built record.
      auto created = std::make_shared<Slot>();
      std::lock_guard<std::mutex> slot_lk(created->mu);
      shard.slots.emplace(id, created);
      size_.fetch_add(1);
      shard_lk.unlock();

      DeviceRecord& r = created->record;
      r.id = id;
      r.last_payload = std::move(payload);
      r.last_seen_ms = observed_at;
      r.state = DeviceState::Online;
      r.created_at_ms = observed_at;
      r.state_since_ms = observed_at;
      r.report_count = 1;

      result.record = r;
      result.from = DeviceState::Offline;
      result.created = true;
      result.applied = true;
      result.transitioned = true;

      if (hook) {
        TransitionEvent e;
        e.device_id = id;
        e.from = DeviceState::Offline;
        e.to = DeviceState::Online;
        e.at = observed_at;
        e.first_seen = true;
        hook(e);
      }
      return result;
    }
  }

  std::lock_guard<std::mutex> slot_lk(slot->mu);
  DeviceRecord& r = slot->record;
  result.from = r.state;

  if (observed_at < r.last_seen_ms) {
    if (policy_ == OutOfOrderPolicy::MergePayload) {
      for (auto& kv : payload) r.last_payload[kv.first] = std::move(kv.second);
      result.payload_merged = true;
    }
    result.record = r;
    return result;
  }

  r.last_payload = std::move(payload);
  r.last_seen_ms = observed_at;
  ++r.report_count;
  result.applied = true;

  if (r.state != DeviceState::Online) {
    r.state = DeviceState::Online;
    r.state_since_ms = observed_at;
    result.transitioned = true;
  }
  result.record = r;

  if (result.transitioned && hook) {
    TransitionEvent e;
    e.device_id = id;
    e.from = result.from;
    e.to = DeviceState::Online;
    e.at = observed_at;
    hook(e);
  }
  return result;
}

bool DeviceRecordStore::Transition(const std::string& id, DeviceState from, DeviceState to,
                                   TimestampMs at, TimestampMs seen_before,
                                   const TransitionHook& hook) {
  const std::shared_ptr<Slot> slot = Find(id);
  if (!slot) return false;

  std::lock_guard<std::mutex> lk(slot->mu);
  DeviceRecord& r = slot->record;
  if (r.state != from) return false;
  if (seen_before != kNoCutoff && r.last_seen_ms >= seen_before) return false;

  r.state = to;
  r.state_since_ms = at;

  if (hook) {
    TransitionEvent e;
    e.device_id = id;
    e.from = from;
    e.to = to;
    e.at = at;
    hook(e);
  }
  return true;
}

bool DeviceRecordStore::MarkStale(const std::string& id, TimestampMs at, TimestampMs seen_before,
                                  const TransitionHook& hook) {
  return Transition(id, DeviceState::Online, DeviceState::Stale, at, seen_before, hook);
}

bool DeviceRecordStore::MarkOffline(const std::string& id, TimestampMs at, TimestampMs seen_before,
                                    const TransitionHook& hook) {
  return Transition(id, DeviceState::Stale, DeviceState::Offline, at, seen_before, hook);
}

bool DeviceRecordStore::Has(const std::string& id) const { return Find(id) != nullptr; }

bool DeviceRecordStore::Get(const std::string& id, DeviceRecord& out) const {
  const std::shared_ptr<Slot> slot = Find(id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lk(slot->mu);
  out = slot->record;
  return true;
}

std::vector<DeviceRecord> DeviceRecordStore::List() const {
  // Shard read locks keep new ids out while every record lock is taken, so
  // the copy is one instant. Writers hold a single record lock and never wait
  // on a shard while holding it.
  std::vector<std::shared_lock<std::shared_mutex>> shard_locks;
  shard_locks.reserve(shards_.size());
  std::vector<std::shared_ptr<Slot>> slots;
  slots.reserve(size_.load());
  for (const auto& shard : shards_) {
    shard_locks.emplace_back(shard->mu);
    for (const auto& kv : shard->slots) slots.push_back(kv.second);
  }

  std::vector<std::unique_lock<std::mutex>> record_locks;
  record_locks.reserve(slots.size());
  for (const auto& slot : slots) record_locks.emplace_back(slot->mu);

  std::vector<DeviceRecord> out;
  out.reserve(slots.size());
  for (const auto& slot : slots) out.push_back(slot->record);
  record_locks.clear();
  shard_locks.clear();

  std::sort(out.begin(), out.end(),
            [](const DeviceRecord& a, const DeviceRecord& b) { return a.id < b.id; });
  return out;
}

std::vector<std::string> DeviceRecordStore::Ids() const {
  std::vector<std::string> out;
  out.reserve(size_.load());
  for (const auto& shard : shards_) {
    std::shared_lock<std::shared_mutex> lk(shard->mu);
    for (const auto& kv : shard->slots) out.push_back(kv.first);
  }
  return out;
}

std::size_t DeviceRecordStore::Size() const { return size_.load(); }

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace devstatus
