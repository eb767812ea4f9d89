/**
 * @file job_session.cpp
 * @brief Job lifecycle and progress normalisation implementation
 */

#include "media_convert/job_session.hpp"

#include <algorithm>

namespace media_convert {

JobSession::JobSession(int job_id, size_t log_tail_lines)
    : job_id_(job_id), log_tail_lines_(std::max<size_t>(1, log_tail_lines)) {}

// **---- State Machine ----**

bool JobSession::transition(JobStatus from, JobStatus to) {
  return status_.compare_exchange_strong(from, to);
}

bool JobSession::begin_probing() {
  return transition(JobStatus::Idle, JobStatus::Probing);
}

bool JobSession::start_running(ProcessHandle handle) {
  /// Handle must be visible before anyone can observe Running
  process_.store(handle);
  return transition(JobStatus::Probing, JobStatus::Running);
}

CancelEffect JobSession::request_cancel() {
  JobStatus current = status_.load();
  while (true) {
    switch (current) {
    case JobStatus::Idle:
    case JobStatus::Probing:
      if (status_.compare_exchange_weak(current, JobStatus::Cancelled))
        return CancelEffect::CancelledBeforeStart;
      break;
    case JobStatus::Running:
      if (status_.compare_exchange_weak(current, JobStatus::Cancelling))
        return CancelEffect::TerminateProcess;
      break;
    case JobStatus::Cancelling:
    case JobStatus::Completed:
    case JobStatus::Failed:
    case JobStatus::Cancelled:
      return CancelEffect::None;
    }
  }
}

JobStatus JobSession::finish(int exit_status) {
  JobStatus target =
      (exit_status == kEngineSuccess) ? JobStatus::Completed : JobStatus::Failed;
  if (transition(JobStatus::Running, target))
    return target;

  /// Cancel got there first: the engine's status is discarded
  transition(JobStatus::Cancelling, JobStatus::Cancelled);
  return status_.load();
}

bool JobSession::force_cancelled() {
  return transition(JobStatus::Cancelling, JobStatus::Cancelled);
}

bool JobSession::cancel_requested() const {
  JobStatus s = status_.load();
  return s == JobStatus::Cancelling || s == JobStatus::Cancelled;
}

bool JobSession::is_running() const {
  JobStatus s = status_.load();
  return s == JobStatus::Running || s == JobStatus::Cancelling;
}

bool JobSession::is_terminal() const {
  JobStatus s = status_.load();
  return s == JobStatus::Completed || s == JobStatus::Failed ||
         s == JobStatus::Cancelled;
}

// **---- Progress ----**

void JobSession::set_denominator(std::optional<int64_t> duration_ms) {
  if (duration_ms && *duration_ms > 0) {
    denominator_ms_ = duration_ms;
  } else {
    denominator_ms_.reset();
  }
}

std::optional<double> JobSession::on_progress_sample(int64_t elapsed_ms) {
  if (!denominator_ms_ || status_.load() != JobStatus::Running)
    return std::nullopt;

  double value = static_cast<double>(elapsed_ms) /
                 static_cast<double>(*denominator_ms_);
  value = std::clamp(value, 0.0, 1.0);

  if (value <= last_emitted_)
    return std::nullopt;

  last_emitted_ = value;
  return value;
}

std::optional<double> JobSession::final_progress() {
  if (!denominator_ms_ || last_emitted_ >= 1.0)
    return std::nullopt;
  last_emitted_ = 1.0;
  return 1.0;
}

// **---- Diagnostics ----**

void JobSession::append_log(const std::string &line) {
  log_lines_.push_back(line);
  while (log_lines_.size() > log_tail_lines_) {
    log_lines_.pop_front();
  }
}

std::string JobSession::log_tail() const {
  std::string tail;
  for (const auto &line : log_lines_) {
    if (!tail.empty())
      tail += '\n';
    tail += line;
  }
  return tail;
}

} // namespace media_convert
