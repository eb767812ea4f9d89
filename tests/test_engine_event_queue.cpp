/**
 * @file test_engine_event_queue.cpp
 * @brief Event queue ordering and deadline tests
 */

#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "media_convert/engine_event_queue.hpp"

using namespace media_convert;

TEST(EngineEventQueueTest, PreservesOrder) {
  EngineEventQueue queue;
  queue.push({EngineEvent::Kind::Progress, 10, 0, {}});
  queue.push({EngineEvent::Kind::Log, 0, 0, "line"});
  queue.push({EngineEvent::Kind::Exit, 0, 3, {}});

  EngineEvent event;
  queue.pop(event);
  EXPECT_EQ(event.kind, EngineEvent::Kind::Progress);
  EXPECT_EQ(event.elapsed_ms, 10);
  queue.pop(event);
  EXPECT_EQ(event.text, "line");
  queue.pop(event);
  EXPECT_EQ(event.kind, EngineEvent::Kind::Exit);
  EXPECT_EQ(event.status, 3);
  EXPECT_TRUE(queue.empty());
}

TEST(EngineEventQueueTest, PopUntilTimesOut) {
  EngineEventQueue queue;
  EngineEvent event;
  auto start = EngineEventQueue::Clock::now();
  EXPECT_FALSE(queue.pop_until(event, start + std::chrono::milliseconds(50)));
  EXPECT_GE(EngineEventQueue::Clock::now() - start,
            std::chrono::milliseconds(50));
}

TEST(EngineEventQueueTest, PopWakesOnPushFromAnotherThread) {
  EngineEventQueue queue;
  std::thread producer([&queue] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.push({EngineEvent::Kind::Exit, 0, 0, {}});
  });

  EngineEvent event;
  EXPECT_TRUE(queue.pop_until(event, EngineEventQueue::Clock::now() +
                                         std::chrono::seconds(5)));
  EXPECT_EQ(event.kind, EngineEvent::Kind::Exit);
  producer.join();
}
