#ifndef MANAGER_EVALUATION_HPP
#define MANAGER_EVALUATION_HPP

#include <memory>
#include <utility>
#include <vector>

#include "executor/executor.hpp"
#include "manager/comparator.hpp"
#include "manager/language.hpp"
#include "manager/source_file.hpp"
#include "proto/judge.pb.h"
#include "util/file.hpp"

namespace manager {

struct EvaluationOptions {
  int64_t run_timeout_ms = 3000;
  int64_t compile_timeout_ms = 8000;
  CompareOptions compare = CompareOptions::ForSubmission();
  // Maximum number of test cases run at the same time by Run.
  int32_t parallelism = 1;
};

// Evaluation of one submission against its test cases. The submission is
// saved and built by Prepare, then every test case is run with RunTestCase or
// Run, and Finish produces the verdict. Everything written to disk is removed
// when the evaluation is destroyed.
class Evaluation {
 public:
  Evaluation(const LanguageSpec& language, executor::Executor* executor,
             std::string temp_directory, EvaluationOptions options);

  // Saves and compiles code. Returns false if the submission cannot be run,
  // because its toolchain is missing or it does not compile; in that case
  // Finish reports why and no test case may be run.
  bool Prepare(const std::string& code);

  // Runs a single test case and records its result. Callers may stop
  // whenever they want, e.g. at the first failure. The returned result is
  // masked like the ones in the verdict if the test case is hidden.
  proto::TestCaseResult RunTestCase(const proto::TestCase& test_case);

  // Runs every test case, possibly in parallel, and records the results in
  // the same order. A failing test case does not stop the others.
  void Run(const std::vector<proto::TestCase>& test_cases);

  // Classifies the recorded results and hides the data of hidden test cases.
  proto::SubmissionVerdict Finish() const;

  Evaluation(const Evaluation&) = delete;
  Evaluation& operator=(const Evaluation&) = delete;

 private:
  proto::TestCaseResult Evaluate(const proto::TestCase& test_case) const;

  const LanguageSpec& language_;
  executor::Executor* executor_;
  std::string temp_directory_;
  EvaluationOptions options_;

  std::unique_ptr<util::TempDir> scratch_;
  std::unique_ptr<SourceFile> source_;
  // Set if Prepare failed.
  proto::Status failure_ = proto::STATUS_UNSPECIFIED;
  std::string compile_output_;
  std::string system_error_;
  std::vector<std::pair<proto::TestCase, proto::TestCaseResult>> results_;
};

}  // namespace manager

#endif  // MANAGER_EVALUATION_HPP
