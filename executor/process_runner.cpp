#include "executor/process_runner.hpp"

#include <memory>

#include "absl/strings/match.h"
#include "executor/executor.hpp"
#include "glog/logging.h"
#include "util/file.hpp"

namespace executor {

ProcessOutput ProcessRunner::Run(sandbox::ExecutionOptions options,
                                 const std::string& stdin_data) const {
  util::TempDir tmp(temp_directory_);
  options.stdin_file = util::File::JoinPath(tmp.Path(), "stdin");
  options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
  options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");
  util::File::Write(options.stdin_file, stdin_data);

  ProcessOutput output;
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  output.started = sb->Execute(options, &output.info, &output.error_msg);
  if (!output.started) return output;

  bool stdout_truncated = false;
  bool stderr_truncated = false;
  output.stdout_data =
      util::File::Read(options.stdout_file, max_output_bytes_, &stdout_truncated);
  output.stderr_data =
      util::File::Read(options.stderr_file, max_output_bytes_, &stderr_truncated);
  output.output_truncated = stdout_truncated || stderr_truncated;
  if (output.output_truncated) {
    LOG(WARNING) << "Output of " << options.executable << " truncated to "
                 << max_output_bytes_ << " bytes";
  }
  return output;
}

void AppendError(const std::string& message, proto::ExecutionResult* result) {
  std::string* stderr_data = result->mutable_stderr();
  if (!stderr_data->empty() && stderr_data->back() != '\n') *stderr_data += '\n';
  *stderr_data += message;
}

void FillResult(const ProcessOutput& output, const std::string& program,
                proto::ExecutionResult* result) {
  if (!output.started) {
    // The sandbox reports exec failures as "exec: <strerror>".
    if (absl::StartsWith(output.error_msg, "exec:") &&
        absl::StrContains(output.error_msg, "No such file or directory")) {
      result->set_exit_code(kNotFoundExitCode);
      result->set_stderr(program + ": command not found");
    } else {
      result->set_exit_code(1);
      result->set_stderr("Execution error: " + output.error_msg);
    }
    return;
  }
  const sandbox::ExecutionInfo& info = output.info;
  result->set_stdout(output.stdout_data);
  result->set_stderr(output.stderr_data);
  result->set_output_truncated(output.output_truncated);
  result->set_runtime_ms(info.wall_time_millis);
  if (info.wall_limit_exceeded) {
    result->set_exit_code(kTimeoutExitCode);
    result->set_timed_out(true);
    AppendError("Time limit exceeded", result);
  } else if (info.memory_limit_exceeded) {
    result->set_exit_code(128 + info.signal);
    AppendError("Memory limit exceeded", result);
  } else if (info.signal) {
    result->set_exit_code(128 + info.signal);
  } else {
    result->set_exit_code(info.status_code);
  }
}

}  // namespace executor
