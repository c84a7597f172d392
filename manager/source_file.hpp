#ifndef MANAGER_SOURCE_FILE_HPP
#define MANAGER_SOURCE_FILE_HPP

#include <memory>
#include <string>

#include "executor/executor.hpp"
#include "manager/language.hpp"
#include "proto/judge.pb.h"

namespace manager {

// Marker printed by the compile command only if the compiler succeeded.
static const constexpr char* kCompiledSentinel = "__JUDGEBOX_COMPILED__";

struct CompileOutcome {
  bool success = false;
  // Compiler diagnostics if the compilation failed.
  std::string output;
  proto::ExecutionResult result;
};

// A submitted program, saved in a directory together with everything built
// from it.
class SourceFile {
 public:
  // Saves code to directory, naming the file as its language requires.
  static std::unique_ptr<SourceFile> Create(const LanguageSpec& language,
                                            const std::string& code,
                                            const std::string& directory);

  // Builds the program. Languages that are not compiled always succeed.
  virtual CompileOutcome Compile(executor::Executor* executor,
                                 int64_t timeout_ms) = 0;

  // A request that runs the program with the given input.
  executor::Request Execute(const std::string& stdin_data,
                            int64_t timeout_ms) const;

  const std::string& Name() const { return name_; }
  const std::string& Directory() const { return directory_; }
  const LanguageSpec& Language() const { return language_; }

  virtual ~SourceFile() = default;
  SourceFile(const SourceFile&) = delete;
  SourceFile(SourceFile&&) = delete;
  SourceFile& operator=(const SourceFile&) = delete;
  SourceFile& operator=(SourceFile&&) = delete;

 protected:
  SourceFile(const LanguageSpec& language, std::string name,
             std::string directory)
      : language_(language),
        name_(std::move(name)),
        directory_(std::move(directory)) {}

  const LanguageSpec& language_;
  std::string name_;
  std::string directory_;
};

}  // namespace manager

#endif
