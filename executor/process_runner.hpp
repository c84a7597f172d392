#ifndef EXECUTOR_PROCESS_RUNNER_HPP
#define EXECUTOR_PROCESS_RUNNER_HPP

#include <string>

#include "proto/judge.pb.h"
#include "sandbox/sandbox.hpp"

namespace executor {

// What happened to a program run by ProcessRunner.
struct ProcessOutput {
  // False if the program could not be started; error_msg tells why.
  bool started = false;
  std::string error_msg;
  sandbox::ExecutionInfo info;
  std::string stdout_data;
  std::string stderr_data;
  bool output_truncated = false;
};

// Runs one program in the sandbox, feeding it stdin from a file and capturing
// its output to files, all inside a scratch directory that exists only for
// the duration of Run.
class ProcessRunner {
 public:
  ProcessRunner(std::string temp_directory, int64_t max_output_bytes)
      : temp_directory_(std::move(temp_directory)),
        max_output_bytes_(max_output_bytes) {}

  // The stdin/stdout/stderr files of options are overwritten. Throws only if
  // the scratch files cannot be created or read.
  ProcessOutput Run(sandbox::ExecutionOptions options,
                    const std::string& stdin_data) const;

 private:
  std::string temp_directory_;
  int64_t max_output_bytes_;
};

// Fills exit code, output, timing and the timeout flag of result from what
// happened to the program, following the exit code conventions of
// proto::ExecutionResult. program is the name used in error messages.
void FillResult(const ProcessOutput& output, const std::string& program,
                proto::ExecutionResult* result);

// Appends a line to the stderr of result, after any partial output.
void AppendError(const std::string& message, proto::ExecutionResult* result);

}  // namespace executor

#endif
