#include "core/device/events/event_notifier.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace devstatus::core::device::events {

using common::log::Level;

struct EventNotifier::Subscriber {
  SubscriptionId id = 0;
  SubscriberOptions opt;
  Listener listener;

  std::mutex mu;
  std::condition_variable cv;
  std::condition_variable idle_cv;
  std::deque<model::TransitionEvent> queue;
  bool active = true;    // cleared by Unsubscribe: stop now, drop the queue
  bool closing = false;  // set by Stop: drain the queue, then exit
  bool busy = false;     // listener currently running

  std::uint64_t delivered = 0;
  std::uint64_t dropped = 0;
  std::uint64_t failed = 0;

  std::thread worker;
};

EventNotifier::EventNotifier(std::shared_ptr<common::log::Logger> logger) : logger_(std::move(logger)) {}

EventNotifier::~EventNotifier() { Stop(); }

SubscriptionId EventNotifier::Subscribe(Listener listener, SubscriberOptions opt) {
  if (!listener || opt.queue_capacity == 0) return 0;

  auto sub = std::make_shared<Subscriber>();
  sub->opt = std::move(opt);
  sub->listener = std::move(listener);

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopped_) return 0;
    sub->id = next_id_++;
    if (sub->opt.name.empty()) sub->opt.name = "subscriber-" + std::to_string(sub->id);
    sub->worker = std::thread(&EventNotifier::Deliver, sub, logger_);
    subs_.emplace(sub->id, sub);
  }

  if (logger_) {
    logger_->Log(Level::Debug, "events",
                 "subscribed " + sub->opt.name + " capacity=" + std::to_string(sub->opt.queue_capacity));
  }
  return sub->id;
}

bool EventNotifier::Unsubscribe(SubscriptionId id) {
  std::shared_ptr<Subscriber> sub;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = subs_.find(id);
    if (it == subs_.end()) return false;
    sub = it->second;
    subs_.erase(it);
  }

  Shutdown(sub, false);
  if (logger_) logger_->Log(Level::Debug, "events", "unsubscribed " + sub->opt.name);
  return true;
}

void EventNotifier::Publish(const model::TransitionEvent& e) {
  std::vector<std::shared_ptr<Subscriber>> targets;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopped_) return;
    targets.reserve(subs_.size());
    for (const auto& kv : subs_) targets.push_back(kv.second);
  }

  for (const auto& sub : targets) {
    bool dropped = false;
    std::uint64_t sub_dropped = 0;
    {
      std::lock_guard<std::mutex> lk(sub->mu);
      if (!sub->active || sub->closing) continue;
      if (sub->queue.size() >= sub->opt.queue_capacity) {
        dropped = true;
        sub_dropped = ++sub->dropped;
        if (sub->opt.overflow == OverflowPolicy::DropOldest) {
          sub->queue.pop_front();
          sub->queue.push_back(e);
        }
      } else {
        sub->queue.push_back(e);
      }
    }
    sub->cv.notify_one();

    if (dropped) {
      dropped_total_.fetch_add(1);
      if (logger_ && (sub_dropped == 1 || sub_dropped % 1000 == 0)) {
        logger_->Log(Level::Warn, "events",
                     "subscriber " + sub->opt.name + " queue full, dropped=" + std::to_string(sub_dropped));
      }
    }
  }
}

bool EventNotifier::Stats(SubscriptionId id, SubscriberStats& out) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = subs_.find(id);
  if (it == subs_.end()) return false;

  const auto& sub = it->second;
  std::lock_guard<std::mutex> sub_lk(sub->mu);
  out.delivered = sub->delivered;
  out.dropped = sub->dropped;
  out.failed = sub->failed;
  out.queued = sub->queue.size();
  return true;
}

std::size_t EventNotifier::SubscriberCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  return subs_.size();
}

bool EventNotifier::WaitIdle(std::chrono::milliseconds timeout) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  std::vector<std::shared_ptr<Subscriber>> targets;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : subs_) targets.push_back(kv.second);
  }

  for (const auto& sub : targets) {
    std::unique_lock<std::mutex> lk(sub->mu);
    const bool idle = sub->idle_cv.wait_until(lk, deadline, [&sub] {
      return !sub->active || (sub->queue.empty() && !sub->busy);
    });
    if (!idle) return false;
  }
  return true;
}

void EventNotifier::Stop() {
  std::map<SubscriptionId, std::shared_ptr<Subscriber>> subs;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopped_ = true;
    subs.swap(subs_);
  }
  for (const auto& kv : subs) Shutdown(kv.second, true);
}

void EventNotifier::Shutdown(const std::shared_ptr<Subscriber>& sub, bool drain) {
  {
    std::lock_guard<std::mutex> lk(sub->mu);
    if (drain) {
      sub->closing = true;
    } else {
      sub->active = false;
      sub->queue.clear();
    }
  }
  sub->cv.notify_all();

  if (!sub->worker.joinable()) return;
  if (sub->worker.get_id() == std::this_thread::get_id()) {
    sub->worker.detach();
  } else {
    sub->worker.join();
  }
}

void EventNotifier::Deliver(std::shared_ptr<Subscriber> sub, std::shared_ptr<common::log::Logger> logger) {
  std::unique_lock<std::mutex> lk(sub->mu);
  for (;;) {
    sub->cv.wait(lk, [&sub] { return !sub->active || sub->closing || !sub->queue.empty(); });
    if (!sub->active) break;
    if (sub->queue.empty()) break;  // closing and drained

    model::TransitionEvent e = std::move(sub->queue.front());
    sub->queue.pop_front();
    sub->busy = true;
    lk.unlock();

    bool ok = true;
    std::string error;
    try {
      sub->listener(e);
    } catch (const std::exception& ex) {
      ok = false;
      error = ex.what();
    } catch (...) {
      ok = false;
      error = "non-standard exception";
    }

    lk.lock();
    sub->busy = false;
    if (ok) {
      ++sub->delivered;
    } else {
      ++sub->failed;
      if (logger) {
        logger->Log(Level::Warn, "events",
                    "subscriber " + sub->opt.name + " failed on " + e.device_id + ": " + error);
      }
    }
    sub->idle_cv.notify_all();
  }
  sub->busy = false;
  sub->idle_cv.notify_all();
}

}  // namespace devstatus::core::device::events
