#include "manager/engine.hpp"

#include <limits.h>
#include <unistd.h>

#include "absl/strings/ascii.h"
#include "glog/logging.h"
#include "manager/evaluation.hpp"
#include "manager/source_file.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace manager {

namespace {

std::string AbsolutePath(const std::string& path) {
  if (!path.empty() && path[0] == '/') return path;
  char cwd[PATH_MAX] = {};
  if (getcwd(cwd, PATH_MAX) == nullptr)
    throw std::system_error(errno, std::system_category(), "getcwd");
  return util::File::JoinPath(cwd, path);
}

LanguageSettings SettingsFromFlags(const std::string& image, double cpus,
                                   int64_t memory_mb, int32_t max_processes) {
  LanguageSettings settings;
  settings.image = image;
  settings.limits.cpus = cpus;
  settings.limits.memory_kb = memory_mb * 1024;
  settings.limits.max_procs = max_processes;
  return settings;
}

}  // namespace

// static
EngineConfig EngineConfig::FromFlags() {
  EngineConfig config;
  config.executor.kind = executor::ExecutorBuilder::ParseKind(FLAGS_sandbox_mode);
  // Containers mount directories by absolute path.
  config.executor.temp_directory = AbsolutePath(FLAGS_temp_directory);
  config.executor.max_output_bytes = FLAGS_max_output_kb * 1024;
  config.executor.isolate_network = FLAGS_host_network_isolation;
  config.executor.container.runtime = FLAGS_container_runtime;
  config.executor.container.overhead_ms = FLAGS_container_overhead_ms;
  config.executor.container.accounting_wrapper = FLAGS_accounting_wrapper;
  config.run_timeout_ms = FLAGS_run_timeout_ms;
  config.compile_timeout_ms = FLAGS_compile_timeout_ms;
  config.parallel_test_cases = FLAGS_parallel_test_cases;
  config.toolchain_cache_ttl_ms = FLAGS_toolchain_cache_ttl_ms;
  config.languages[proto::JAVASCRIPT] = SettingsFromFlags(
      FLAGS_javascript_image, FLAGS_javascript_cpus, FLAGS_javascript_memory_mb,
      FLAGS_javascript_max_processes);
  config.languages[proto::PYTHON] =
      SettingsFromFlags(FLAGS_python_image, FLAGS_python_cpus,
                        FLAGS_python_memory_mb, FLAGS_python_max_processes);
  config.languages[proto::CPP] =
      SettingsFromFlags(FLAGS_cpp_image, FLAGS_cpp_cpus, FLAGS_cpp_memory_mb,
                        FLAGS_cpp_max_processes);
  config.languages[proto::JAVA] =
      SettingsFromFlags(FLAGS_java_image, FLAGS_java_cpus,
                        FLAGS_java_memory_mb, FLAGS_java_max_processes);
  config.languages[proto::CSHARP] =
      SettingsFromFlags(FLAGS_csharp_image, FLAGS_csharp_cpus,
                        FLAGS_csharp_memory_mb, FLAGS_csharp_max_processes);
  return config;
}

Engine::Engine(EngineConfig config)
    : config_(std::move(config)),
      registry_(config_.languages),
      checker_(new executor::ToolchainChecker(
          absl::Milliseconds(config_.toolchain_cache_ttl_ms))) {
  executor_ = executor::ExecutorBuilder::Get(config_.executor, checker_.get());
}

Engine::Engine(EngineConfig config,
               std::unique_ptr<executor::Executor> executor)
    : config_(std::move(config)),
      registry_(config_.languages),
      executor_(std::move(executor)) {}

const LanguageSpec& Engine::ResolveRequest(const std::string& code,
                                           const std::string& language) const {
  const LanguageSpec& spec = registry_.Resolve(language);
  if (absl::StripAsciiWhitespace(code).empty())
    throw invalid_request("Code is required");
  return spec;
}

proto::SubmissionVerdict Engine::Execute(
    const std::string& code, const std::string& language,
    const std::vector<proto::TestCase>& test_cases,
    const proto::ExecuteOptions& options) {
  const LanguageSpec& spec = ResolveRequest(code, language);
  if (test_cases.empty())
    throw invalid_request("At least one test case is required");
  if (options.has_timeout_ms() && options.timeout_ms() <= 0)
    throw invalid_request("The timeout must be positive");

  EvaluationOptions evaluation_options;
  evaluation_options.run_timeout_ms =
      options.has_timeout_ms() ? options.timeout_ms() : config_.run_timeout_ms;
  evaluation_options.compile_timeout_ms = config_.compile_timeout_ms;
  evaluation_options.parallelism = config_.parallel_test_cases;
  evaluation_options.compare = options.mode() == proto::RUN
                                   ? CompareOptions::ForRun()
                                   : CompareOptions::ForSubmission();
  if (options.has_ignore_whitespace())
    evaluation_options.compare.ignore_whitespace = options.ignore_whitespace();
  if (options.has_ignore_case())
    evaluation_options.compare.ignore_case = options.ignore_case();

  LOG(INFO) << "Judging a " << spec.Id() << " submission on "
            << test_cases.size() << " test cases";
  Evaluation evaluation(spec, executor_.get(),
                        config_.executor.temp_directory, evaluation_options);
  if (evaluation.Prepare(code)) evaluation.Run(test_cases);
  proto::SubmissionVerdict verdict = evaluation.Finish();
  verdict.set_total_tests(test_cases.size());
  LOG(INFO) << "Verdict: " << StatusMessage(verdict.status()) << " ("
            << verdict.tests_passed() << "/" << verdict.total_tests() << ")";
  return verdict;
}

proto::ExecutionResult Engine::RunOnce(const std::string& code,
                                       const std::string& language,
                                       const std::string& stdin_data) {
  const LanguageSpec& spec = ResolveRequest(code, language);
  proto::ExecutionResult result;
  std::string missing = executor_->CheckAvailable(spec.Tools());
  if (!missing.empty()) {
    LOG(ERROR) << "Cannot run " << spec.Id() << " on " << executor_->Id()
               << ": " << missing;
    result.set_exit_code(executor::kNotFoundExitCode);
    result.set_stderr(missing);
    return result;
  }

  try {
    util::TempDir scratch(config_.executor.temp_directory);
    std::string box = util::File::JoinPath(scratch.Path(), "box");
    util::File::MakeDirs(box);
    std::unique_ptr<SourceFile> source = SourceFile::Create(spec, code, box);
    CompileOutcome outcome =
        source->Compile(executor_.get(), config_.compile_timeout_ms);
    if (!outcome.success) {
      result.set_exit_code(outcome.result.exit_code() ? outcome.result.exit_code()
                                                      : 1);
      result.set_stderr(outcome.output);
      result.set_runtime_ms(outcome.result.runtime_ms());
      result.set_timed_out(outcome.result.timed_out());
      return result;
    }
    return executor_->Run(source->Execute(stdin_data, config_.run_timeout_ms));
  } catch (const std::exception& e) {
    LOG(ERROR) << "Running a " << spec.Id() << " program failed: " << e.what();
    throw;
  }
}

proto::EnvironmentReport Engine::CheckEnvironment() {
  proto::EnvironmentReport report;
  report.set_mode(absl::AsciiStrToLower(executor_->Id()));
  report.set_network_isolation(executor_->IsolatesNetwork());
  for (const LanguageSpec* spec : registry_.All()) {
    proto::LanguageReport* language = report.add_languages();
    language->set_language(spec->Id());
    bool available = true;
    for (proto::ToolStatus& tool : executor_->Locate(spec->Tools())) {
      available = available && tool.available();
      *language->add_tools() = std::move(tool);
    }
    language->set_available(available);
  }
  return report;
}

}  // namespace manager
