#include "executor/host_executor.hpp"

#include <stdexcept>

#include "absl/strings/str_join.h"
#include "glog/logging.h"

namespace executor {

namespace {
// Programs may not write files bigger than this, including their output.
const constexpr int64_t kMaxFileSizeKb = 64 * 1024;
// The wall clock limit normally fires first; the CPU limit only stops
// programs that burn several cores at once.
const constexpr int64_t kCpuLimitMarginMillis = 1000;
}  // namespace

HostExecutor::HostExecutor(ToolchainChecker* checker,
                           std::string temp_directory,
                           int64_t max_output_bytes, bool isolate_network)
    : Executor(checker),
      runner_(std::move(temp_directory), max_output_bytes),
      isolate_network_(isolate_network) {}

proto::ExecutionResult HostExecutor::Run(const Request& request) {
  if (request.args.empty()) throw std::invalid_argument("Empty command line");
  VLOG(1) << "Running " << absl::StrJoin(request.args, " ") << " in "
          << request.workdir;

  proto::ExecutionResult result;
  const std::string& program = request.args[0];
  std::string executable = program;
  if (program.find('/') == std::string::npos) {
    executable = checker_->Find(program);
    if (executable.empty()) {
      result.set_exit_code(kNotFoundExitCode);
      result.set_stderr(program + ": command not found");
      return result;
    }
  }

  sandbox::ExecutionOptions options(request.workdir, executable);
  options.args.assign(request.args.begin() + 1, request.args.end());
  options.wall_limit_millis = request.timeout_ms;
  if (request.timeout_ms)
    options.cpu_limit_millis = request.timeout_ms + kCpuLimitMarginMillis;
  options.memory_limit_kb = request.limits.memory_kb;
  options.max_procs = request.limits.max_procs;
  options.max_file_size_kb = kMaxFileSizeKb;
  options.isolate_network = isolate_network_;

  ProcessOutput output = runner_.Run(options, request.stdin_data);
  FillResult(output, program, &result);
  if (output.started && request.accounting) {
    // The kernel accounts resources of the process and of the children it
    // waited for.
    if (output.info.memory_usage_kb > 0)
      result.set_memory_kb(output.info.memory_usage_kb);
    result.set_cpu_time_ms(output.info.cpu_time_millis +
                           output.info.sys_time_millis);
  }
  return result;
}

}  // namespace executor
