/**
 * @file engine_event_queue.cpp
 * @brief Engine event queue implementation
 */

#include "media_convert/engine_event_queue.hpp"

namespace media_convert {

void EngineEventQueue::push(EngineEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push(std::move(event));
  }
  cv_.notify_one();
}

void EngineEventQueue::pop(EngineEvent &event) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !events_.empty(); });

  event = std::move(events_.front());
  events_.pop();
}

bool EngineEventQueue::pop_until(EngineEvent &event,
                                 Clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_until(lock, deadline, [this] { return !events_.empty(); })) {
    return false;
  }

  event = std::move(events_.front());
  events_.pop();
  return true;
}

} // namespace media_convert
