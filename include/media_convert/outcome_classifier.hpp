/**
 * @file outcome_classifier.hpp
 * @brief Maps a terminal engine status to a job Outcome
 */

#ifndef MEDIA_CONVERT_OUTCOME_CLASSIFIER_HPP
#define MEDIA_CONVERT_OUTCOME_CLASSIFIER_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace media_convert {

/**
 * @brief Classify the end of a job.
 *
 * @param terminal_status Engine status, or nullopt if the engine never
 *        reported one (cancel timeout)
 * @param cancel_requested True if the caller cancelled the job
 * @param diagnostic_log Captured engine log tail
 * @return Cancellation always yields a failed Outcome with
 *         ErrorCode::Cancelled, whatever the status. Otherwise success is
 *         exactly terminal_status == kEngineSuccess; failures carry the log
 *         tail as diagnostic.
 */
Outcome classify(std::optional<int> terminal_status, bool cancel_requested,
                 const std::string &diagnostic_log);

/// Failed Outcome for a request rejected before any process started
Outcome rejected(ErrorCode error, const std::string &reason);

} // namespace media_convert

#endif // MEDIA_CONVERT_OUTCOME_CLASSIFIER_HPP
