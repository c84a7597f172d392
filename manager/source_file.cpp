#include "manager/source_file.hpp"

#include "absl/memory/memory.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/shell.hpp"

namespace manager {

namespace {

class CompiledSourceFile : public SourceFile {
 public:
  CompiledSourceFile(const LanguageSpec& language, std::string name,
                     std::string directory)
      : SourceFile(language, std::move(name), std::move(directory)) {}

  CompileOutcome Compile(executor::Executor* executor,
                         int64_t timeout_ms) override;
};

class NotCompiledSourceFile : public SourceFile {
 public:
  NotCompiledSourceFile(const LanguageSpec& language, std::string name,
                        std::string directory)
      : SourceFile(language, std::move(name), std::move(directory)) {}

  CompileOutcome Compile(executor::Executor* executor,
                         int64_t timeout_ms) override {
    CompileOutcome outcome;
    outcome.success = true;
    return outcome;
  }
};

}  // namespace

// static
std::unique_ptr<SourceFile> SourceFile::Create(const LanguageSpec& language,
                                               const std::string& code,
                                               const std::string& directory) {
  std::string name = language.SourceFileName(code);
  util::File::Write(util::File::JoinPath(directory, name), code);
  if (language.NeedsCompilation()) {
    return absl::make_unique<CompiledSourceFile>(language, std::move(name),
                                                 directory);
  }
  return absl::make_unique<NotCompiledSourceFile>(language, std::move(name),
                                                  directory);
}

executor::Request SourceFile::Execute(const std::string& stdin_data,
                                      int64_t timeout_ms) const {
  executor::Request request;
  request.args = language_.RunArgs(name_);
  request.stdin_data = stdin_data;
  request.timeout_ms = timeout_ms;
  request.workdir = directory_;
  request.limits = language_.Limits();
  request.image = language_.Image();
  return request;
}

CompileOutcome CompiledSourceFile::Compile(executor::Executor* executor,
                                           int64_t timeout_ms) {
  LOG(INFO) << "Compiling " << name_ << " (" << language_.Id() << ")";
  // The compiler may be a wrapper script that loses its exit code, so success
  // also requires the sentinel.
  executor::Request request;
  request.args = {"sh", "-c",
                  absl::StrCat(util::ShellJoin(language_.CompileArgs(name_)),
                               " && echo ", kCompiledSentinel)};
  request.timeout_ms = timeout_ms;
  request.workdir = directory_;
  request.limits = language_.Limits();
  request.image = language_.Image();
  request.accounting = false;

  CompileOutcome outcome;
  outcome.result = executor->Run(request);
  outcome.success = outcome.result.exit_code() == 0 &&
                    absl::StrContains(outcome.result.stdout(),
                                      kCompiledSentinel);
  if (!outcome.success) {
    if (!outcome.result.stderr().empty()) {
      outcome.output = outcome.result.stderr();
    } else if (!outcome.result.stdout().empty()) {
      outcome.output = outcome.result.stdout();
    } else {
      outcome.output = "Compilation failed";
    }
  }
  LOG(INFO) << "Compilation of " << name_
            << (outcome.success ? " succeeded" : " failed") << " in "
            << outcome.result.runtime_ms() << "ms";
  return outcome;
}

}  // namespace manager
