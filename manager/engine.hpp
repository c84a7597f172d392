#ifndef MANAGER_ENGINE_HPP
#define MANAGER_ENGINE_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "executor/executor_builder.hpp"
#include "executor/toolchain_checker.hpp"
#include "manager/errors.hpp"
#include "manager/language.hpp"
#include "proto/judge.pb.h"

namespace manager {

struct EngineConfig {
  executor::ExecutorOptions executor;
  // Languages without an entry use LanguageRegistry::DefaultSettings.
  std::map<proto::Language, LanguageSettings> languages;
  int64_t run_timeout_ms = 3000;
  int64_t compile_timeout_ms = 8000;
  int32_t parallel_test_cases = 1;
  int64_t toolchain_cache_ttl_ms = 30 * 1000;

  // Reads the configuration from the command line flags.
  static EngineConfig FromFlags();
};

// Entry point of the execution engine. Thread-safe: concurrent requests use
// separate scratch directories.
class Engine {
 public:
  explicit Engine(EngineConfig config);
  // Uses the given executor instead of building one from the configuration.
  Engine(EngineConfig config, std::unique_ptr<executor::Executor> executor);

  // Judges code against test_cases. Throws client_error for requests that
  // cannot be judged (unsupported language, no code, no test cases); every
  // judging outcome, including a missing toolchain, is a verdict.
  proto::SubmissionVerdict Execute(
      const std::string& code, const std::string& language,
      const std::vector<proto::TestCase>& test_cases,
      const proto::ExecuteOptions& options = proto::ExecuteOptions());

  // Compiles (if needed) and runs code once with the given input. Failures,
  // including compilation errors, are reported in the result.
  proto::ExecutionResult RunOnce(const std::string& code,
                                 const std::string& language,
                                 const std::string& stdin_data);

  // Reports which languages can be run in the current configuration.
  proto::EnvironmentReport CheckEnvironment();

  const LanguageRegistry& Languages() const { return registry_; }

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

 private:
  // Validates the parts common to every request.
  const LanguageSpec& ResolveRequest(const std::string& code,
                                     const std::string& language) const;

  EngineConfig config_;
  LanguageRegistry registry_;
  std::unique_ptr<executor::ToolchainChecker> checker_;
  std::unique_ptr<executor::Executor> executor_;
};

}  // namespace manager

#endif
