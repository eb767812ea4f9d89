/**
 * @file test_outcome_classifier.cpp
 * @brief Terminal outcome classification tests
 */

#include <gtest/gtest.h>

#include "media_convert/outcome_classifier.hpp"

using namespace media_convert;

TEST(OutcomeClassifierTest, SuccessStatus) {
  Outcome outcome = classify(kEngineSuccess, false, "noise");
  EXPECT_TRUE(outcome.succeeded);
  EXPECT_EQ(outcome.error, ErrorCode::None);
  EXPECT_FALSE(outcome.diagnostic);
  EXPECT_EQ(outcome.exit_status, 0);
}

TEST(OutcomeClassifierTest, FailureCarriesLogTail) {
  Outcome outcome = classify(1, false, "Invalid data found");
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_EQ(outcome.error, ErrorCode::EngineFailure);
  ASSERT_TRUE(outcome.diagnostic);
  EXPECT_EQ(*outcome.diagnostic, "Invalid data found");
  EXPECT_EQ(outcome.exit_status, 1);
}

TEST(OutcomeClassifierTest, FailureWithoutLogHasNoDiagnostic) {
  Outcome outcome = classify(137, false, "");
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_FALSE(outcome.diagnostic);
}

TEST(OutcomeClassifierTest, CancelWinsOverSuccess) {
  Outcome outcome = classify(kEngineSuccess, true, "");
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_EQ(outcome.error, ErrorCode::Cancelled);
}

TEST(OutcomeClassifierTest, MissingStatusIsFailure) {
  Outcome outcome = classify(std::nullopt, false, "");
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_EQ(outcome.exit_status, -1);

  outcome = classify(std::nullopt, true, "");
  EXPECT_EQ(outcome.error, ErrorCode::Cancelled);
}

TEST(OutcomeClassifierTest, RejectedCarriesReason) {
  Outcome outcome = rejected(ErrorCode::UnsupportedFormat, "ogg");
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_EQ(outcome.error, ErrorCode::UnsupportedFormat);
  ASSERT_TRUE(outcome.diagnostic);
  EXPECT_EQ(*outcome.diagnostic, "ogg");
}
