#include "tamma/core/lockfree_queue.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace tamma;

TEST(BoundedMPSCQueueTest, PushPop_PreservesOrder) {
  BoundedMPSCQueue<int> queue(8);
  for (int i = 0; i < 5; ++i) {
    int v = i;
    ASSERT_TRUE(queue.push(v));
  }
  for (int i = 0; i < 5; ++i) {
    auto v = queue.try_pop();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, i);
  }
  EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(BoundedMPSCQueueTest, Capacity_RoundsUpAndRejectsWhenFull) {
  BoundedMPSCQueue<std::string> queue(5);
  EXPECT_EQ(queue.capacity(), 8u);

  for (std::size_t i = 0; i < queue.capacity(); ++i) {
    std::string line = "line";
    ASSERT_TRUE(queue.push(line));
  }
  std::string overflow = "overflow";
  EXPECT_FALSE(queue.push(overflow));
  EXPECT_EQ(overflow, "overflow");
}

TEST(BoundedMPSCQueueTest, ConcurrentProducers_DeliverEveryItem) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 1000;
  BoundedMPSCQueue<int> queue(256);
  std::atomic<int> done{0};

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&] {
      for (int i = 1; i <= kPerProducer; ++i) {
        int v = i;
        while (!queue.push(v)) {
          std::this_thread::yield();
        }
      }
      done.fetch_add(1);
    });
  }

  long long sum = 0;
  int received = 0;
  while (received < kProducers * kPerProducer) {
    if (auto v = queue.try_pop()) {
      sum += *v;
      ++received;
    } else {
      std::this_thread::yield();
    }
  }
  for (auto& t : producers) {
    t.join();
  }

  EXPECT_EQ(done.load(), kProducers);
  EXPECT_EQ(sum, static_cast<long long>(kProducers) * kPerProducer *
                     (kPerProducer + 1) / 2);
}
