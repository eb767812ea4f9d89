/**
 * @file engine_event_queue.hpp
 * @brief Thread-safe event queue feeding a job's coordination context
 *
 * @details Engine threads (producers) push telemetry, log lines and the exit
 *          status; the controller thread (consumer) pops them in order and is
 *          the only place job state is advanced.
 *
 * @attention USAGE:
 *
 *   - EngineListener callbacks call push()
 *
 *   - cancel() pushes a wake-up so a blocked pop_until() returns
 *
 *   - The controller calls pop_until() with a deadline while cancelling
 */

#ifndef MEDIA_CONVERT_ENGINE_EVENT_QUEUE_HPP
#define MEDIA_CONVERT_ENGINE_EVENT_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>

namespace media_convert {

/**
 * @struct EngineEvent
 * @brief A single notification from the engine or the cancel path.
 */
struct EngineEvent {
  enum class Kind { Progress, Log, Exit, CancelRequested };

  Kind kind = Kind::Progress;
  int64_t elapsed_ms = 0; //< Progress
  int status = 0;         //< Exit
  std::string text;       //< Log
};

/**
 * @class EngineEventQueue
 * @brief Unbounded FIFO with blocking and deadline-bounded pops.
 */
class EngineEventQueue {
public:
  using Clock = std::chrono::steady_clock;

  /**
   * @brief Push an event to the queue.
   * @param event The event to deliver
   */
  void push(EngineEvent event);

  /**
   * @brief Pop an event (blocking).
   * @param event Output: the next event
   */
  void pop(EngineEvent &event);

  /**
   * @brief Pop an event, waiting at most until deadline.
   * @param event Output: the next event
   * @param deadline Latest time to wait until
   * @return true if an event was retrieved, false on timeout
   */
  bool pop_until(EngineEvent &event, Clock::time_point deadline);

  /**
   * @brief Check if queue is empty.
   */
  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<EngineEvent> events_;
};

} // namespace media_convert

#endif // MEDIA_CONVERT_ENGINE_EVENT_QUEUE_HPP
