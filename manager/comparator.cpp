#include "manager/comparator.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_replace.h"
#include "executor/executor.hpp"

namespace manager {

namespace {
// Higher is more severe.
int Severity(proto::Status status) {
  switch (status) {
    case proto::SYSTEM_ERROR:
      return 6;
    case proto::COMPILATION_ERROR:
      return 5;
    case proto::TIME_LIMIT_EXCEEDED:
      return 4;
    case proto::RUNTIME_ERROR:
      return 3;
    case proto::WRONG_ANSWER:
      return 2;
    case proto::ACCEPTED:
      return 1;
    default:
      return 0;
  }
}
}  // namespace

CompareOptions CompareOptions::ForSubmission() {
  CompareOptions options;
  options.trim_trailing_newlines = true;
  return options;
}

CompareOptions CompareOptions::ForRun() {
  CompareOptions options;
  options.ignore_whitespace = true;
  return options;
}

std::string Normalize(absl::string_view text, const CompareOptions& options) {
  std::string normalized = absl::StrReplaceAll(text, {{"\r\n", "\n"}});
  if (options.trim_trailing_newlines) {
    size_t end = normalized.find_last_not_of('\n');
    normalized.resize(end == std::string::npos ? 0 : end + 1);
  }
  if (options.ignore_whitespace) {
    std::string collapsed;
    bool pending_space = false;
    for (char c : normalized) {
      if (absl::ascii_isspace(c)) {
        pending_space = true;
        continue;
      }
      if (pending_space && !collapsed.empty()) collapsed += ' ';
      pending_space = false;
      collapsed += c;
    }
    normalized = std::move(collapsed);
  }
  if (options.ignore_case) absl::AsciiStrToLower(&normalized);
  return normalized;
}

bool Compare(absl::string_view actual, absl::string_view expected,
             const CompareOptions& options) {
  return Normalize(actual, options) == Normalize(expected, options);
}

proto::Status Classify(const proto::ExecutionResult& result, bool matched) {
  if (result.timed_out() || result.exit_code() == executor::kTimeoutExitCode)
    return proto::TIME_LIMIT_EXCEEDED;
  if (result.exit_code() != 0) return proto::RUNTIME_ERROR;
  if (!matched) return proto::WRONG_ANSWER;
  return proto::ACCEPTED;
}

proto::Status Aggregate(const std::vector<proto::Status>& statuses) {
  proto::Status worst = proto::ACCEPTED;
  for (proto::Status status : statuses) {
    if (Severity(status) > Severity(worst)) worst = status;
  }
  return worst;
}

std::string StatusMessage(proto::Status status) {
  switch (status) {
    case proto::ACCEPTED:
      return "Accepted";
    case proto::WRONG_ANSWER:
      return "Wrong Answer";
    case proto::TIME_LIMIT_EXCEEDED:
      return "Time Limit Exceeded";
    case proto::RUNTIME_ERROR:
      return "Runtime Error";
    case proto::COMPILATION_ERROR:
      return "Compilation Error";
    case proto::SYSTEM_ERROR:
      return "System Error";
    default:
      return "Unknown";
  }
}

}  // namespace manager
