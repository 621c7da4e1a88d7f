#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "core/device/manager/device_record_store.hpp"

namespace devstatus::core::device::manager {
namespace {

using model::DeviceRecord;
using model::DeviceState;
using model::StatusPayload;
using model::TransitionEvent;
using namespace std::chrono_literals;

StatusPayload Payload(std::int64_t seq) {
  StatusPayload p;
  p["seq"] = seq;
  return p;
}

std::int64_t Seq(const DeviceRecord& r) { return std::get<std::int64_t>(r.last_payload.at("seq")); }

TEST(DeviceRecordStoreTest, FirstReportCreatesOnlineRecord) {
  DeviceRecordStore store;
  std::vector<TransitionEvent> events;
  const auto res = store.Upsert("dev-1", Payload(1), 100, [&](const TransitionEvent& e) { events.push_back(e); });

  EXPECT_TRUE(res.created);
  EXPECT_TRUE(res.applied);
  EXPECT_TRUE(res.transitioned);
  EXPECT_EQ(res.from, DeviceState::Offline);
  EXPECT_EQ(res.record.state, DeviceState::Online);
  EXPECT_EQ(res.record.created_at_ms, 100);
  EXPECT_EQ(res.record.last_seen_ms, 100);
  EXPECT_EQ(res.record.report_count, 1u);

  ASSERT_EQ(events.size(), 1u);
  EXPECT_TRUE(events[0].first_seen);
  EXPECT_EQ(events[0].to, DeviceState::Online);
  EXPECT_EQ(events[0].at, 100);
}

TEST(DeviceRecordStoreTest, EmptyIdIsRefused) {
  DeviceRecordStore store;
  const auto res = store.Upsert("", Payload(1), 100);
  EXPECT_FALSE(res.applied);
  EXPECT_EQ(store.Size(), 0u);
}

TEST(DeviceRecordStoreTest, FreshReportWhileOnlineEmitsNothing) {
  DeviceRecordStore store;
  store.Upsert("dev-1", Payload(1), 100);

  int calls = 0;
  const auto res = store.Upsert("dev-1", Payload(2), 200, [&](const TransitionEvent&) { ++calls; });
  EXPECT_TRUE(res.applied);
  EXPECT_FALSE(res.transitioned);
  EXPECT_EQ(calls, 0);
  EXPECT_EQ(Seq(res.record), 2);
  EXPECT_EQ(res.record.report_count, 2u);
  EXPECT_EQ(res.record.created_at_ms, 100);
}

TEST(DeviceRecordStoreTest, EqualTimestampIsApplied) {
  DeviceRecordStore store;
  store.Upsert("dev-1", Payload(1), 100);
  const auto res = store.Upsert("dev-1", Payload(2), 100);
  EXPECT_TRUE(res.applied);
  EXPECT_EQ(Seq(res.record), 2);
}

TEST(DeviceRecordStoreTest, OlderReportRejected) {
  DeviceRecordStore store;
  store.Upsert("dev-1", Payload(2), 200);
  ASSERT_TRUE(store.MarkStale("dev-1", 300));

  int calls = 0;
  const auto res = store.Upsert("dev-1", Payload(1), 150, [&](const TransitionEvent&) { ++calls; });
  EXPECT_FALSE(res.applied);
  EXPECT_FALSE(res.transitioned);
  EXPECT_FALSE(res.payload_merged);
  EXPECT_EQ(calls, 0);

  DeviceRecord r;
  ASSERT_TRUE(store.Get("dev-1", r));
  EXPECT_EQ(r.state, DeviceState::Stale);
  EXPECT_EQ(r.last_seen_ms, 200);
  EXPECT_EQ(Seq(r), 2);
  EXPECT_EQ(r.report_count, 1u);
}

TEST(DeviceRecordStoreTest, OlderReportMergesPayloadWhenConfigured) {
  DeviceRecordStore store(4, OutOfOrderPolicy::MergePayload);
  StatusPayload first;
  first["seq"] = std::int64_t{2};
  first["fw"] = std::string("1.0");
  store.Upsert("dev-1", first, 200);

  StatusPayload late;
  late["seq"] = std::int64_t{1};
  late["battery"] = 0.5;
  const auto res = store.Upsert("dev-1", late, 150);
  EXPECT_FALSE(res.applied);
  EXPECT_TRUE(res.payload_merged);
  EXPECT_EQ(res.record.last_seen_ms, 200);
  EXPECT_EQ(Seq(res.record), 1);
  EXPECT_EQ(std::get<std::string>(res.record.last_payload.at("fw")), "1.0");
  EXPECT_DOUBLE_EQ(std::get<double>(res.record.last_payload.at("battery")), 0.5);
  EXPECT_EQ(store.Policy(), OutOfOrderPolicy::MergePayload);
}

TEST(DeviceRecordStoreTest, TransitionsFollowTheStateMachine) {
  DeviceRecordStore store;
  store.Upsert("dev-1", Payload(1), 0);

  EXPECT_FALSE(store.MarkOffline("dev-1", 10));
  EXPECT_TRUE(store.MarkStale("dev-1", 10));
  EXPECT_FALSE(store.MarkStale("dev-1", 11));
  EXPECT_TRUE(store.MarkOffline("dev-1", 20));
  EXPECT_FALSE(store.MarkOffline("dev-1", 21));
  EXPECT_FALSE(store.MarkStale("missing", 10));

  DeviceRecord r;
  ASSERT_TRUE(store.Get("dev-1", r));
  EXPECT_EQ(r.state, DeviceState::Offline);
  EXPECT_EQ(r.state_since_ms, 20);

  std::vector<TransitionEvent> events;
  const auto res = store.Upsert("dev-1", Payload(2), 30, [&](const TransitionEvent& e) { events.push_back(e); });
  EXPECT_TRUE(res.transitioned);
  EXPECT_EQ(res.from, DeviceState::Offline);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_FALSE(events[0].first_seen);
  EXPECT_EQ(events[0].from, DeviceState::Offline);
  EXPECT_EQ(events[0].to, DeviceState::Online);
}

TEST(DeviceRecordStoreTest, CutoffProtectsRecentReports) {
  DeviceRecordStore store;
  store.Upsert("dev-1", Payload(1), 1000);
  EXPECT_FALSE(store.MarkStale("dev-1", 2000, 1000));
  EXPECT_TRUE(store.MarkStale("dev-1", 2000, 1001));
}

TEST(DeviceRecordStoreTest, ListIsSortedAndIncludesEveryState) {
  DeviceRecordStore store(3);
  for (const char* id : {"c", "a", "d", "b"}) store.Upsert(id, {}, 0);
  store.MarkStale("b", 1);
  store.MarkStale("d", 1);
  store.MarkOffline("d", 2);

  const auto all = store.List();
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all[0].id, "a");
  EXPECT_EQ(all[1].id, "b");
  EXPECT_EQ(all[2].id, "c");
  EXPECT_EQ(all[3].id, "d");
  EXPECT_EQ(all[3].state, DeviceState::Offline);
  EXPECT_EQ(store.Ids().size(), 4u);
  EXPECT_EQ(store.Size(), 4u);
  EXPECT_TRUE(store.Has("c"));
  EXPECT_FALSE(store.Has("e"));
}

TEST(DeviceRecordStoreTest, ConcurrentReportsKeepTheLatestPayload) {
  DeviceRecordStore store(8);
  constexpr int kThreads = 8;
  constexpr int kReports = 500;

  std::atomic<int> first_seen{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      const std::string own = "dev-" + std::to_string(t);
      for (int i = 1; i <= kReports; ++i) {
        store.Upsert(own, Payload(i), i);
        store.Upsert("shared", Payload(i), i, [&](const TransitionEvent& e) {
          if (e.first_seen) first_seen.fetch_add(1);
        });
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(store.Size(), static_cast<std::size_t>(kThreads + 1));
  EXPECT_EQ(first_seen.load(), 1);
  for (int t = 0; t < kThreads; ++t) {
    DeviceRecord r;
    ASSERT_TRUE(store.Get("dev-" + std::to_string(t), r));
    EXPECT_EQ(Seq(r), kReports);
    EXPECT_EQ(r.last_seen_ms, kReports);
  }
  DeviceRecord shared;
  ASSERT_TRUE(store.Get("shared", shared));
  EXPECT_EQ(shared.last_seen_ms, kReports);
  EXPECT_EQ(Seq(shared), kReports);
}

TEST(DeviceRecordStoreTest, HeldRecordDoesNotBlockOtherDevices) {
  // One shard, so both ids share the map lock.
  DeviceRecordStore store(1);
  store.Upsert("busy", Payload(1), 0);
  store.Upsert("idle", Payload(1), 0);
  ASSERT_TRUE(store.MarkStale("busy", 1));

  std::promise<void> entered;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  std::future<void> in_hook = entered.get_future();

  std::thread holder([&] {
    store.Upsert("busy", Payload(2), 10, [&](const TransitionEvent&) {
      entered.set_value();
      released.wait();
    });
  });
  in_hook.wait();

  auto other = std::async(std::launch::async, [&] {
    const bool updated = store.Upsert("idle", Payload(2), 10).applied;
    const bool created = store.Upsert("fresh", Payload(1), 10).created;
    DeviceRecord r;
    return updated && created && store.Get("idle", r) && store.MarkStale("idle", 20);
  });
  const bool finished = other.wait_for(2s) == std::future_status::ready;

  release.set_value();
  holder.join();
  ASSERT_TRUE(finished);
  EXPECT_TRUE(other.get());
}

TEST(DeviceRecordStoreTest, ListIsASingleInstant) {
  DeviceRecordStore store(4);
  store.Upsert("a", Payload(0), 0);
  store.Upsert("b", Payload(0), 0);

  // "a" is always written before "b", so no instant has b ahead of a.
  constexpr int kRounds = 5'000;
  std::thread writer([&] {
    for (int i = 1; i <= kRounds; ++i) {
      store.Upsert("a", Payload(i), i);
      store.Upsert("b", Payload(i), i);
    }
  });

  int checked = 0;
  int torn = 0;
  for (bool done = false; !done; ++checked) {
    const auto all = store.List();
    if (all.size() != 2u) {
      ++torn;
      break;
    }
    const std::int64_t a = Seq(all[0]);
    const std::int64_t b = Seq(all[1]);
    if (a < b || a - b > 1) ++torn;
    done = b == kRounds;
  }
  writer.join();
  EXPECT_EQ(torn, 0) << "after " << checked << " snapshots";
}

}  // namespace
}  // namespace devstatus::core::device::manager
