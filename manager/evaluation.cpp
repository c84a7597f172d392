#include "manager/evaluation.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "glog/logging.h"
#include "manager/sanitizer.hpp"

namespace manager {

namespace {
const constexpr char* kBoxDir = "box";
}  // namespace

Evaluation::Evaluation(const LanguageSpec& language,
                       executor::Executor* executor,
                       std::string temp_directory, EvaluationOptions options)
    : language_(language),
      executor_(executor),
      temp_directory_(std::move(temp_directory)),
      options_(std::move(options)) {}

bool Evaluation::Prepare(const std::string& code) {
  std::string missing = executor_->CheckAvailable(language_.Tools());
  if (!missing.empty()) {
    LOG(ERROR) << "Cannot run " << language_.Id() << " on "
               << executor_->Id() << ": " << missing;
    failure_ = proto::SYSTEM_ERROR;
    system_error_ = missing;
    return false;
  }
  try {
    scratch_ = std::unique_ptr<util::TempDir>(new util::TempDir(temp_directory_));
    std::string box = util::File::JoinPath(scratch_->Path(), kBoxDir);
    util::File::MakeDirs(box);
    source_ = SourceFile::Create(language_, code, box);
    CompileOutcome outcome =
        source_->Compile(executor_, options_.compile_timeout_ms);
    if (!outcome.success) {
      failure_ = proto::COMPILATION_ERROR;
      compile_output_ = std::move(outcome.output);
      return false;
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << "Compilation of a " << language_.Id()
               << " submission failed: " << e.what();
    throw;
  }
  return true;
}

proto::TestCaseResult Evaluation::Evaluate(
    const proto::TestCase& test_case) const {
  proto::ExecutionResult run;
  try {
    run = executor_->Run(
        source_->Execute(test_case.input(), options_.run_timeout_ms));
  } catch (const std::exception& e) {
    LOG(ERROR) << "Running a " << language_.Id()
               << " submission failed: " << e.what();
    throw;
  }
  bool matched =
      Compare(run.stdout(), test_case.expected_output(), options_.compare);

  proto::TestCaseResult result;
  result.set_input(test_case.input());
  result.set_expected_output(test_case.expected_output());
  result.set_actual_output(run.stdout());
  result.set_status(Classify(run, matched));
  result.set_passed(result.status() == proto::ACCEPTED);
  result.set_runtime_ms(run.runtime_ms());
  if (run.has_memory_kb()) result.set_memory_kb(run.memory_kb());
  result.set_exit_code(run.exit_code());
  if (run.exit_code() != 0) {
    result.set_error(run.stderr().empty() ? StatusMessage(result.status())
                                          : run.stderr());
  }
  return result;
}

proto::TestCaseResult Evaluation::RunTestCase(
    const proto::TestCase& test_case) {
  if (!source_ || failure_ != proto::STATUS_UNSPECIFIED)
    throw std::logic_error("RunTestCase called on an unprepared evaluation");
  proto::TestCaseResult result = Evaluate(test_case);
  LOG(INFO) << "Test case " << results_.size() + 1 << ": "
            << StatusMessage(result.status()) << " in " << result.runtime_ms()
            << "ms";
  results_.emplace_back(test_case, result);
  Sanitize(test_case, &result);
  return result;
}

void Evaluation::Run(const std::vector<proto::TestCase>& test_cases) {
  size_t workers = std::min<size_t>(std::max(options_.parallelism, 1),
                                    test_cases.size());
  if (workers <= 1) {
    for (const proto::TestCase& test_case : test_cases) RunTestCase(test_case);
    return;
  }
  if (!source_ || failure_ != proto::STATUS_UNSPECIFIED)
    throw std::logic_error("Run called on an unprepared evaluation");

  std::vector<proto::TestCaseResult> slots(test_cases.size());
  std::vector<std::exception_ptr> errors(test_cases.size());
  std::atomic<size_t> next{0};
  auto worker = [&]() {
    for (size_t idx = next++; idx < test_cases.size(); idx = next++) {
      try {
        slots[idx] = Evaluate(test_cases[idx]);
      } catch (const std::exception&) {
        errors[idx] = std::current_exception();
      }
    }
  };
  // The calling thread is one of the workers. If fewer threads can be
  // started, the ones running take the remaining test cases.
  std::vector<std::thread> threads;
  try {
    for (size_t i = 1; i < workers; i++) threads.emplace_back(worker);
  } catch (const std::system_error& e) {
    LOG(WARNING) << "Running test cases on " << threads.size() + 1
                 << " threads instead of " << workers << ": " << e.what();
  }
  worker();
  for (std::thread& thread : threads) thread.join();
  for (const std::exception_ptr& error : errors) {
    if (error) std::rethrow_exception(error);
  }
  for (size_t i = 0; i < test_cases.size(); i++) {
    LOG(INFO) << "Test case " << results_.size() + 1 << ": "
              << StatusMessage(slots[i].status()) << " in "
              << slots[i].runtime_ms() << "ms";
    results_.emplace_back(test_cases[i], std::move(slots[i]));
  }
}

proto::SubmissionVerdict Evaluation::Finish() const {
  proto::SubmissionVerdict verdict;
  verdict.set_language(language_.Language());
  if (failure_ != proto::STATUS_UNSPECIFIED) {
    verdict.set_status(failure_);
    verdict.set_compile_output(compile_output_);
    verdict.set_system_error(system_error_);
    return verdict;
  }
  std::vector<proto::Status> statuses;
  bool passed = true;
  bool visible_passed = true;
  int32_t tests_passed = 0;
  int64_t execution_time_ms = 0;
  for (const auto& entry : results_) {
    const proto::TestCase& test_case = entry.first;
    proto::TestCaseResult* result = verdict.add_results();
    *result = entry.second;
    statuses.push_back(result->status());
    execution_time_ms += result->runtime_ms();
    if (result->passed()) {
      tests_passed++;
    } else {
      passed = false;
      if (!test_case.hidden()) visible_passed = false;
    }
    Sanitize(test_case, result);
  }
  verdict.set_status(Aggregate(statuses));
  verdict.set_passed(passed && !results_.empty());
  verdict.set_visible_passed(visible_passed);
  verdict.set_execution_time_ms(execution_time_ms);
  verdict.set_tests_passed(tests_passed);
  verdict.set_total_tests(results_.size());
  return verdict;
}

}  // namespace manager
