#pragma once
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

/**
 * Bounded, thread-safe event history with an optional subscriber that sees
 * every event as it is added. The oldest events are dropped once the queue
 * holds more than maxQueueSize.
 */
template <typename T> class EventQueue {
public:
  using SubscriberCallback = std::function<void(const T &)>;
  EventQueue(size_t maxQueueSize) : maxQueueSize_(maxQueueSize) {}

  void addEvent(const T &event) {
    SubscriberCallback callback;
    {
      std::lock_guard<std::recursive_mutex> lock(mutex_);
      eventQueue.push_back(event);
      while (eventQueue.size() > maxQueueSize_) {
        eventQueue.pop_front();
      }
      callback = subscriber;
    }

    if (callback) {
      callback(event);
    }
  }

  void setSubscriber(SubscriberCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    subscriber = callback;
  }

  std::vector<T> snapshot() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return std::vector<T>(eventQueue.begin(), eventQueue.end());
  }

  void clear() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    eventQueue.clear();
  }

protected:
  SubscriberCallback subscriber;
  std::deque<T> eventQueue;
  std::recursive_mutex mutex_;
  size_t maxQueueSize_;
};
