/**
 * @file outcome_classifier.cpp
 * @brief Terminal outcome classification
 */

#include "media_convert/outcome_classifier.hpp"

namespace media_convert {

Outcome classify(std::optional<int> terminal_status, bool cancel_requested,
                 const std::string &diagnostic_log) {
  Outcome outcome;
  outcome.exit_status = terminal_status.value_or(-1);

  /// Cancellation pre-empts status interpretation
  if (cancel_requested) {
    outcome.succeeded = false;
    outcome.error = ErrorCode::Cancelled;
    return outcome;
  }

  if (terminal_status && *terminal_status == kEngineSuccess) {
    outcome.succeeded = true;
    outcome.error = ErrorCode::None;
    return outcome;
  }

  outcome.succeeded = false;
  outcome.error = ErrorCode::EngineFailure;
  if (!diagnostic_log.empty())
    outcome.diagnostic = diagnostic_log;
  return outcome;
}

Outcome rejected(ErrorCode error, const std::string &reason) {
  Outcome outcome;
  outcome.succeeded = false;
  outcome.error = error;
  if (!reason.empty())
    outcome.diagnostic = reason;
  return outcome;
}

} // namespace media_convert
