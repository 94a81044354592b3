#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "a2a/bus/bus.hpp"

using namespace a2a;

namespace {

// 测试专用事件，避免与任务存储的事件互相干扰
struct PingEvent {
  int n;
};

struct OtherEvent {};

}  // namespace

// --- BusTest ---

TEST(BusTest, DeliversToTypedSubscribers) {
  std::vector<int> seen;
  int others = 0;

  auto ping = Bus::instance().subscribe_scoped<PingEvent>([&](const PingEvent& e) {
    seen.push_back(e.n);
  });
  auto other = Bus::instance().subscribe_scoped<OtherEvent>([&](const OtherEvent&) {
    others++;
  });

  Bus::instance().publish(PingEvent{1});
  Bus::instance().publish(PingEvent{2});

  EXPECT_EQ(seen, (std::vector<int>{1, 2}));
  EXPECT_EQ(others, 0);
}

TEST(BusTest, ScopedSubscriptionUnsubscribes) {
  int count = 0;
  {
    auto sub = Bus::instance().subscribe_scoped<PingEvent>([&](const PingEvent&) {
      count++;
    });
    EXPECT_EQ(Bus::instance().subscriber_count<PingEvent>(), 1u);
    Bus::instance().publish(PingEvent{1});
  }

  Bus::instance().publish(PingEvent{2});

  EXPECT_EQ(count, 1);
  EXPECT_EQ(Bus::instance().subscriber_count<PingEvent>(), 0u);
}

TEST(BusTest, MovedSubscriptionStaysActive) {
  int count = 0;
  Bus::ScopedSubscription outer;
  {
    auto inner = Bus::instance().subscribe_scoped<PingEvent>([&](const PingEvent&) {
      count++;
    });
    outer = std::move(inner);
  }

  Bus::instance().publish(PingEvent{1});
  outer.reset();
  Bus::instance().publish(PingEvent{2});

  EXPECT_EQ(count, 1);
}

TEST(BusTest, ThrowingSubscriberIsIsolated) {
  int count = 0;
  auto bad = Bus::instance().subscribe_scoped<PingEvent>([](const PingEvent&) {
    throw std::runtime_error("boom");
  });
  auto good = Bus::instance().subscribe_scoped<PingEvent>([&](const PingEvent&) {
    count++;
  });

  EXPECT_NO_THROW(Bus::instance().publish(PingEvent{1}));
  EXPECT_EQ(count, 1);
}

TEST(BusTest, UnsubscribeById) {
  int count = 0;
  auto id = Bus::instance().subscribe<PingEvent>([&](const PingEvent&) {
    count++;
  });

  Bus::instance().publish(PingEvent{1});
  Bus::instance().unsubscribe(id);
  Bus::instance().publish(PingEvent{2});

  EXPECT_EQ(count, 1);
}
