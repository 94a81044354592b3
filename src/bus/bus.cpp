#include "a2a/bus/bus.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace a2a {

Bus& Bus::instance() {
  static Bus bus;
  return bus;
}

void Bus::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = subscribers_.begin(); it != subscribers_.end();) {
    auto& list = it->second;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [id](const Subscriber& s) {
                                return s.id == id;
                              }),
               list.end());
    it = list.empty() ? subscribers_.erase(it) : std::next(it);
  }
}

void Bus::deliver(const Subscriber& subscriber, const std::any& event) {
  try {
    subscriber.fn(event);
  } catch (const std::exception& e) {
    spdlog::error("[Bus] Subscriber {} for {} threw: {}", subscriber.id, subscriber.event_type, e.what());
  }
}

}  // namespace a2a
