#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace a2a {

// In-process event bus for task lifecycle notifications.
//
// Delivery is synchronous on the publishing thread, outside the bus lock.
// A subscriber that throws is logged and skipped; the publisher never sees it.
class Bus {
 public:
  using SubscriptionId = uint64_t;

  // Unsubscribes on destruction
  class ScopedSubscription {
   public:
    ScopedSubscription() = default;
    ScopedSubscription(Bus& bus, SubscriptionId id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() {
      reset();
    }

    ScopedSubscription(ScopedSubscription&& other) noexcept : bus_(std::exchange(other.bus_, nullptr)), id_(other.id_) {}
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
      if (this != &other) {
        reset();
        bus_ = std::exchange(other.bus_, nullptr);
        id_ = other.id_;
      }
      return *this;
    }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    void reset() {
      if (bus_) {
        bus_->unsubscribe(id_);
        bus_ = nullptr;
      }
    }

   private:
    Bus* bus_ = nullptr;
    SubscriptionId id_ = 0;
  };

  static Bus& instance();

  template <typename T>
  SubscriptionId subscribe(std::function<void(const T&)> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    subscribers_[std::type_index(typeid(T))].push_back(Subscriber{id, typeid(T).name(), [handler](const std::any& event) {
                                                                    handler(std::any_cast<const T&>(event));
                                                                  }});
    return id;
  }

  template <typename T>
  ScopedSubscription subscribe_scoped(std::function<void(const T&)> handler) {
    return ScopedSubscription(*this, subscribe<T>(std::move(handler)));
  }

  void unsubscribe(SubscriptionId id);

  template <typename T>
  void publish(const T& event) {
    std::vector<Subscriber> targets;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = subscribers_.find(std::type_index(typeid(T)));
      if (it == subscribers_.end() || it->second.empty()) return;
      targets = it->second;
    }

    const std::any wrapped = event;
    for (const auto& subscriber : targets) {
      deliver(subscriber, wrapped);
    }
  }

  template <typename T>
  size_t subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(std::type_index(typeid(T)));
    return it == subscribers_.end() ? 0 : it->second.size();
  }

 private:
  Bus() = default;

  struct Subscriber {
    SubscriptionId id;
    const char* event_type;
    std::function<void(const std::any&)> fn;
  };

  static void deliver(const Subscriber& subscriber, const std::any& event);

  mutable std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<std::type_index, std::vector<Subscriber>> subscribers_;
};

namespace events {

// A task entered the store in state submitted
struct TaskCreated {
  std::string task_id;
  std::string context_id;
};

// Any later transition (working, completed, failed)
struct TaskUpdated {
  std::string task_id;
  std::string state;
  size_t history_size;
};

// Removed by the retention or capacity policy
struct TaskEvicted {
  std::string task_id;
};

// One coordinator step finished, successfully or not
struct StepFinished {
  std::string coordinator_task_id;
  std::string step;
  bool success;
};

}  // namespace events

}  // namespace a2a
