#include "manager/sanitizer.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

proto::TestCaseResult ResultFor(const proto::TestCase& test_case,
                                const std::string& actual, bool passed) {
  proto::TestCaseResult result;
  result.set_input(test_case.input());
  result.set_expected_output(test_case.expected_output());
  result.set_actual_output(actual);
  result.set_passed(passed);
  result.set_status(passed ? proto::ACCEPTED : proto::WRONG_ANSWER);
  return result;
}

proto::TestCase Case(const std::string& input, const std::string& expected,
                     bool hidden) {
  proto::TestCase test_case;
  test_case.set_input(input);
  test_case.set_expected_output(expected);
  test_case.set_hidden(hidden);
  return test_case;
}

// NOLINTNEXTLINE
TEST(SanitizerTest, VisibleCasesAreUntouched) {
  proto::TestCase test_case = Case("1 2", "3", false);
  proto::TestCaseResult result = ResultFor(test_case, "4", false);
  proto::TestCaseResult original = result;
  manager::Sanitize(test_case, &result);
  EXPECT_EQ(result.SerializeAsString(), original.SerializeAsString());
}

// NOLINTNEXTLINE
TEST(SanitizerTest, HiddenPassed) {
  proto::TestCase test_case = Case("secret input", "secret output", true);
  proto::TestCaseResult result = ResultFor(test_case, "secret output", true);
  manager::Sanitize(test_case, &result);
  EXPECT_EQ(result.input(), "Hidden");
  EXPECT_EQ(result.expected_output(), "Hidden");
  EXPECT_EQ(result.actual_output(), "Correct");
  EXPECT_TRUE(result.passed());
  EXPECT_FALSE(result.has_error());
}

// NOLINTNEXTLINE
TEST(SanitizerTest, HiddenFailedDoesNotLeakThroughErrors) {
  proto::TestCase test_case = Case("secret input", "secret output", true);
  proto::TestCaseResult result = ResultFor(test_case, "", false);
  result.set_status(proto::RUNTIME_ERROR);
  result.set_exit_code(1);
  result.set_error("ValueError: invalid literal: 'secret input'");
  manager::Sanitize(test_case, &result);
  EXPECT_EQ(result.input(), "Hidden");
  EXPECT_EQ(result.expected_output(), "Hidden");
  EXPECT_EQ(result.actual_output(), "Incorrect");
  EXPECT_EQ(result.error(), "Runtime Error");
  EXPECT_EQ(result.exit_code(), 1);
}

}  // namespace
