#ifndef MANAGER_COMPARATOR_HPP
#define MANAGER_COMPARATOR_HPP

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "proto/judge.pb.h"

namespace manager {

// How program output is matched against the expected output. CRLF line
// endings are always treated as LF.
struct CompareOptions {
  // Collapse every run of whitespace to a single space and trim both ends.
  bool ignore_whitespace = false;
  // Compare ASCII letters case-insensitively.
  bool ignore_case = false;
  // Drop newlines at the end of the output.
  bool trim_trailing_newlines = false;

  // Judging policy for submissions: exact up to trailing newlines.
  static CompareOptions ForSubmission();
  // Policy for trying code against sample cases: whitespace-insensitive.
  static CompareOptions ForRun();
};

// Applies the normalizations selected by options.
std::string Normalize(absl::string_view text, const CompareOptions& options);

bool Compare(absl::string_view actual, absl::string_view expected,
             const CompareOptions& options);

// Verdict of a single test case.
proto::Status Classify(const proto::ExecutionResult& result, bool matched);

// Verdict of a submission from the verdicts of all its test cases: the most
// severe one, or ACCEPTED if there are none.
proto::Status Aggregate(const std::vector<proto::Status>& statuses);

// Human readable name of a verdict, e.g. "Time Limit Exceeded".
std::string StatusMessage(proto::Status status);

}  // namespace manager

#endif
