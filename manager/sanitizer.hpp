#ifndef MANAGER_SANITIZER_HPP
#define MANAGER_SANITIZER_HPP

#include "proto/judge.pb.h"

namespace manager {

static const constexpr char* kHiddenPlaceholder = "Hidden";

// Removes everything that could reveal the data of a hidden test case from
// its result: input and expected output become "Hidden", the actual output
// "Correct" or "Incorrect", and error messages are replaced by the name of
// the verdict. Results of visible test cases are left untouched.
void Sanitize(const proto::TestCase& test_case, proto::TestCaseResult* result);

}  // namespace manager

#endif
