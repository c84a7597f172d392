#include "manager/sanitizer.hpp"

#include "manager/comparator.hpp"

namespace manager {

void Sanitize(const proto::TestCase& test_case, proto::TestCaseResult* result) {
  if (!test_case.hidden()) return;
  result->set_input(kHiddenPlaceholder);
  result->set_expected_output(kHiddenPlaceholder);
  result->set_actual_output(result->passed() ? "Correct" : "Incorrect");
  if (result->has_error()) result->set_error(StatusMessage(result->status()));
}

}  // namespace manager
