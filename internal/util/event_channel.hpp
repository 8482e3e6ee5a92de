#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace vidpipe::util {

/*
  Broadcast channel of typed events.

  Producers Publish(); every live Subscription receives its own copy
  in publish order. Subscriptions are owned by the consumer; dropping
  the shared_ptr unsubscribes. Publish never blocks on consumers.
*/
template <typename Event>
class EventChannel {
 public:
  class Subscription {
   public:
    std::optional<Event> TryReceive() {
      std::lock_guard lock(mutex_);
      if (events_.empty()) {
        return std::nullopt;
      }
      Event event = std::move(events_.front());
      events_.pop_front();
      return event;
    }

    // Blocks until an event arrives, the channel closes, or the timeout passes.
    std::optional<Event> Receive(std::chrono::milliseconds timeout) {
      std::unique_lock lock(mutex_);
      cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
      if (events_.empty()) {
        return std::nullopt;
      }
      Event event = std::move(events_.front());
      events_.pop_front();
      return event;
    }

    std::vector<Event> Drain() {
      std::lock_guard    lock(mutex_);
      std::vector<Event> out(std::make_move_iterator(events_.begin()), std::make_move_iterator(events_.end()));
      events_.clear();
      return out;
    }

   private:
    friend class EventChannel;

    void Push(const Event& event) {
      {
        std::lock_guard lock(mutex_);
        events_.push_back(event);
      }
      cv_.notify_all();
    }

    void Close() {
      {
        std::lock_guard lock(mutex_);
        closed_ = true;
      }
      cv_.notify_all();
    }

    std::mutex              mutex_;
    std::condition_variable cv_;
    std::deque<Event>       events_;
    bool                    closed_ = false;
  };

  std::shared_ptr<Subscription> Subscribe() {
    auto            subscription = std::make_shared<Subscription>();
    std::lock_guard lock(mutex_);
    if (closed_) {
      subscription->Close();
    } else {
      subscribers_.push_back(subscription);
    }
    return subscription;
  }

  void Publish(const Event& event) {
    std::vector<std::shared_ptr<Subscription>> live;
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return;
      }
      auto it = subscribers_.begin();
      while (it != subscribers_.end()) {
        if (auto subscription = it->lock()) {
          live.push_back(std::move(subscription));
          ++it;
        } else {
          it = subscribers_.erase(it);
        }
      }
    }
    for (const auto& subscription : live) {
      subscription->Push(event);
    }
  }

  void Close() {
    std::vector<std::weak_ptr<Subscription>> subscribers;
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
      subscribers.swap(subscribers_);
    }
    for (const auto& weak : subscribers) {
      if (auto subscription = weak.lock()) {
        subscription->Close();
      }
    }
  }

 private:
  std::mutex                               mutex_;
  std::vector<std::weak_ptr<Subscription>> subscribers_;
  bool                                     closed_ = false;
};

} // namespace vidpipe::util
