#include "manager/comparator.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using manager::Aggregate;
using manager::Classify;
using manager::Compare;
using manager::CompareOptions;
using manager::Normalize;

proto::ExecutionResult Exited(int exit_code) {
  proto::ExecutionResult result;
  result.set_exit_code(exit_code);
  return result;
}

// NOLINTNEXTLINE
TEST(CompareTest, ExactByDefault) {
  CompareOptions exact;
  EXPECT_TRUE(Compare("4", "4", exact));
  EXPECT_FALSE(Compare("4\n", "4", exact));
  EXPECT_FALSE(Compare("a b", "a  b", exact));
  EXPECT_FALSE(Compare("A", "a", exact));
}

// NOLINTNEXTLINE
TEST(CompareTest, IgnoreWhitespace) {
  CompareOptions options;
  options.ignore_whitespace = true;
  EXPECT_TRUE(Compare("4\n", "4", options));
  EXPECT_TRUE(Compare("  1   2\t3 \n", "1 2 3", options));
  EXPECT_TRUE(Compare("1\n2\n", "1 2", options));
  EXPECT_FALSE(Compare("12", "1 2", options));
  EXPECT_EQ(Normalize(" a \n\n b ", options), "a b");
}

// NOLINTNEXTLINE
TEST(CompareTest, CrLfIsAlwaysLf) {
  CompareOptions exact;
  EXPECT_TRUE(Compare("1\r\n2\r\n", "1\n2\n", exact));
  EXPECT_FALSE(Compare("1\r2", "1\n2", exact));
}

// NOLINTNEXTLINE
TEST(CompareTest, IgnoreCase) {
  CompareOptions options;
  options.ignore_case = true;
  EXPECT_TRUE(Compare("YES", "yes", options));
  EXPECT_FALSE(Compare("YES ", "yes", options));
}

// NOLINTNEXTLINE
TEST(CompareTest, SubmissionPolicy) {
  CompareOptions options = CompareOptions::ForSubmission();
  EXPECT_TRUE(Compare("4\n", "4", options));
  EXPECT_TRUE(Compare("4\r\n\r\n", "4\n", options));
  EXPECT_FALSE(Compare("4 \n", "4", options));
  EXPECT_FALSE(Compare("\n4", "4", options));
  EXPECT_FALSE(Compare("Yes", "yes", options));
}

// NOLINTNEXTLINE
TEST(CompareTest, RunPolicy) {
  CompareOptions options = CompareOptions::ForRun();
  EXPECT_TRUE(Compare("1  2\n", "1 2", options));
  EXPECT_FALSE(Compare("Yes", "yes", options));
}

// NOLINTNEXTLINE
TEST(ClassifyTest, TestCaseVerdicts) {
  EXPECT_EQ(Classify(Exited(0), true), proto::ACCEPTED);
  EXPECT_EQ(Classify(Exited(0), false), proto::WRONG_ANSWER);
  EXPECT_EQ(Classify(Exited(1), true), proto::RUNTIME_ERROR);
  EXPECT_EQ(Classify(Exited(139), false), proto::RUNTIME_ERROR);
  EXPECT_EQ(Classify(Exited(124), true), proto::TIME_LIMIT_EXCEEDED);
  proto::ExecutionResult timed_out = Exited(124);
  timed_out.set_timed_out(true);
  EXPECT_EQ(Classify(timed_out, false), proto::TIME_LIMIT_EXCEEDED);
}

// NOLINTNEXTLINE
TEST(AggregateTest, MostSevereWins) {
  EXPECT_EQ(Aggregate({}), proto::ACCEPTED);
  EXPECT_EQ(Aggregate({proto::ACCEPTED, proto::ACCEPTED}), proto::ACCEPTED);
  EXPECT_EQ(Aggregate({proto::ACCEPTED, proto::WRONG_ANSWER}),
            proto::WRONG_ANSWER);
  EXPECT_EQ(Aggregate({proto::WRONG_ANSWER, proto::RUNTIME_ERROR,
                       proto::ACCEPTED}),
            proto::RUNTIME_ERROR);
  EXPECT_EQ(Aggregate({proto::RUNTIME_ERROR, proto::TIME_LIMIT_EXCEEDED,
                       proto::WRONG_ANSWER}),
            proto::TIME_LIMIT_EXCEEDED);
  EXPECT_EQ(Aggregate({proto::TIME_LIMIT_EXCEEDED, proto::COMPILATION_ERROR}),
            proto::COMPILATION_ERROR);
}

}  // namespace
