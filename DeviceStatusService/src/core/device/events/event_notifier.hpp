#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "core/common/logger/logger.hpp"
#include "core/device/model/device_record.hpp"

namespace devstatus::core::device::events {

enum class OverflowPolicy : std::uint8_t {
  DropOldest = 0,
  DropNewest = 1
};

struct SubscriberOptions {
  std::size_t queue_capacity = 1024;
  OverflowPolicy overflow = OverflowPolicy::DropOldest;
  std::string name;  // shows up in log lines
};

struct SubscriberStats {
  std::uint64_t delivered = 0;
  std::uint64_t dropped = 0;
  std::uint64_t failed = 0;
  std::size_t queued = 0;
};

using SubscriptionId = std::uint64_t;
using Listener = std::function<void(const model::TransitionEvent&)>;

// Fans transition events out to subscribers. Every subscriber gets its own
// bounded queue and delivery thread, so a slow or throwing listener only
// hurts itself. Publish never blocks on a listener.
//
// Listeners report failure by throwing a std::exception; the failure is
// counted and logged, and delivery continues with the next event.
class EventNotifier {
public:
  explicit EventNotifier(std::shared_ptr<common::log::Logger> logger = nullptr);
  ~EventNotifier();

  EventNotifier(const EventNotifier&) = delete;
  EventNotifier& operator=(const EventNotifier&) = delete;

  // Returns 0 when the listener is empty, the capacity is zero, or the
  // notifier has been stopped.
  SubscriptionId Subscribe(Listener listener, SubscriberOptions opt = {});

  // Discards anything still queued. Once this returns the listener is not
  // called again. May be called from inside the listener itself.
  bool Unsubscribe(SubscriptionId id);

  void Publish(const model::TransitionEvent& e);

  bool Stats(SubscriptionId id, SubscriberStats& out) const;
  std::uint64_t TotalDropped() const { return dropped_total_.load(); }
  std::size_t SubscriberCount() const;

  // Blocks until every queue is empty and no listener is running.
  bool WaitIdle(std::chrono::milliseconds timeout) const;

  // Refuses new subscribers and events, delivers what is already queued,
  // then joins every delivery thread.
  void Stop();

private:
  struct Subscriber;

  // Worker body. Takes everything it needs by value so a worker detached by
  // a self-unsubscribe never touches the notifier again.
  static void Deliver(std::shared_ptr<Subscriber> sub, std::shared_ptr<common::log::Logger> logger);
  static void Shutdown(const std::shared_ptr<Subscriber>& sub, bool drain);

private:
  mutable std::mutex mu_;
  std::map<SubscriptionId, std::shared_ptr<Subscriber>> subs_;
  SubscriptionId next_id_ = 1;
  bool stopped_ = false;
  std::atomic<std::uint64_t> dropped_total_{0};
  std::shared_ptr<common::log::Logger> logger_;
};

}  // namespace devstatus::core::device::events
