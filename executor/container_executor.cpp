#include "executor/container_executor.hpp"

#include <unistd.h>
#include <stdexcept>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/time/clock.h"
#include "executor/telemetry.hpp"
#include "glog/logging.h"
#include "util/file.hpp"

namespace executor {

namespace {
const constexpr char* kMountPoint = "/code";
const constexpr int64_t kMaxFileSizeKb = 64 * 1024;
const constexpr int64_t kRemoveTimeoutMillis = 10 * 1000;
const constexpr int64_t kMaxAccountingBytes = 64 * 1024;
// Exit code of docker run when the runtime itself fails.
const constexpr int kRuntimeErrorExitCode = 125;

// Whether a failed run means that the accounting wrapper is not in the image.
// The runtime reports it as "exec: ...: no such file or directory", a shell
// as "...: not found". The wrapper writes its report even when the program
// fails, so a report means that the program itself exited with 127.
bool WrapperMissing(const proto::ExecutionResult& result,
                    const std::string& accounting_file) {
  if (result.exit_code() != kNotFoundExitCode) return false;
  if (util::File::Exists(accounting_file)) return false;
  std::string error = absl::AsciiStrToLower(result.stderr());
  return absl::StrContains(error, "not found") ||
         absl::StrContains(error, "no such file or directory");
}
}  // namespace

constexpr const char* ContainerExecutor::kAccountingFile;

ContainerExecutor::ContainerExecutor(ToolchainChecker* checker,
                                     std::string temp_directory,
                                     int64_t max_output_bytes,
                                     ContainerOptions options)
    : Executor(checker),
      runner_(std::move(temp_directory), max_output_bytes),
      options_(std::move(options)),
      remover_(&ContainerExecutor::RemovalLoop, this) {}

ContainerExecutor::~ContainerExecutor() {
  {
    absl::MutexLock lock(&removal_mutex_);
    stopping_ = true;
  }
  remover_.join();
}

proto::ExecutionResult ContainerExecutor::Run(const Request& request) {
  if (request.args.empty()) throw std::invalid_argument("Empty command line");
  if (request.image.empty()) throw std::invalid_argument("No image to run");

  std::string runtime = checker_->Find(options_.runtime);
  if (runtime.empty()) {
    proto::ExecutionResult result;
    result.set_exit_code(kNotFoundExitCode);
    result.set_stderr(options_.runtime + ": command not found");
    return result;
  }

  bool use_wrapper = request.accounting && !options_.accounting_wrapper.empty();
  proto::ExecutionResult result = RunOnce(request, runtime, use_wrapper);
  if (use_wrapper &&
      WrapperMissing(result, util::File::JoinPath(request.workdir,
                                                  kAccountingFile))) {
    LOG(WARNING) << options_.accounting_wrapper << " is missing in "
                 << request.image << ", running without resource accounting";
    result = RunOnce(request, runtime, false);
  }
  return result;
}

std::vector<std::string> ContainerExecutor::CommandLine(
    const Request& request, const std::string& name, bool use_wrapper) const {
  std::string memory = absl::StrCat(request.limits.memory_kb, "k");
  std::vector<std::string> args = {
      "run", "--rm", "-i", "--name", name, "--network", "none",
      "--cpus", absl::StrCat(request.limits.cpus),
      "--user", absl::StrCat(getuid(), ":", getgid()),
      "-v", absl::StrCat(request.workdir, ":", kMountPoint, ":rw"),
      "-w", kMountPoint};
  if (request.limits.memory_kb) {
    args.insert(args.end(), {"--memory", memory, "--memory-swap", memory});
  }
  if (request.limits.max_procs) {
    args.insert(args.end(),
                {"--pids-limit", absl::StrCat(request.limits.max_procs)});
  }
  args.push_back(request.image);
  if (use_wrapper) {
    args.insert(args.end(),
                {options_.accounting_wrapper, "-v", "-o", kAccountingFile});
  }
  args.insert(args.end(), request.args.begin(), request.args.end());
  return args;
}

proto::ExecutionResult ContainerExecutor::RunOnce(const Request& request,
                                                  const std::string& runtime,
                                                  bool use_wrapper) {
  std::string name =
      absl::StrCat("judgebox-", getpid(), "-", next_id_++, "-",
                   absl::ToUnixNanos(absl::Now()));
  std::string accounting_file =
      util::File::JoinPath(request.workdir, kAccountingFile);
  if (util::File::Exists(accounting_file)) util::File::Remove(accounting_file);

  sandbox::ExecutionOptions options(request.workdir, runtime);
  options.args = CommandLine(request, name, use_wrapper);
  if (request.timeout_ms)
    options.wall_limit_millis = request.timeout_ms + options_.overhead_ms;
  options.max_file_size_kb = kMaxFileSizeKb;
  VLOG(1) << "Running " << runtime << " " << absl::StrJoin(options.args, " ");

  ProcessOutput output = runner_.Run(options, request.stdin_data);
  proto::ExecutionResult result;
  FillResult(output, options_.runtime, &result);
  if (!output.started) return result;

  if (output.info.wall_limit_exceeded) ScheduleRemoval(runtime, name);
  if (!result.timed_out() && result.exit_code() == kRuntimeErrorExitCode) {
    result.set_exit_code(1);
    result.set_stderr("Execution error: " + result.stderr());
    return result;
  }

  if (use_wrapper && util::File::Exists(accounting_file)) {
    Telemetry telemetry =
        ParseTelemetry(util::File::Read(accounting_file, kMaxAccountingBytes));
    util::File::Remove(accounting_file);
    if (telemetry.memory_kb) result.set_memory_kb(*telemetry.memory_kb);
    if (telemetry.cpu_time_ms) result.set_cpu_time_ms(*telemetry.cpu_time_ms);
    result.set_runtime_ms(ResolveRuntime(telemetry, result.runtime_ms()));
    // The deadline includes the container startup; the program itself must
    // still fit in the requested time.
    if (!result.timed_out() && request.timeout_ms &&
        telemetry.wall_time_ms && *telemetry.wall_time_ms > request.timeout_ms) {
      result.set_exit_code(kTimeoutExitCode);
      result.set_timed_out(true);
      AppendError("Time limit exceeded", &result);
    }
  }
  return result;
}

void ContainerExecutor::ScheduleRemoval(const std::string& runtime,
                                        const std::string& name) {
  absl::MutexLock lock(&removal_mutex_);
  pending_removals_.emplace_back(runtime, name);
}

void ContainerExecutor::RemovalLoop() {
  for (;;) {
    std::pair<std::string, std::string> container;
    {
      absl::MutexLock lock(&removal_mutex_);
      removal_mutex_.Await(
          absl::Condition(this, &ContainerExecutor::HasRemovalWork));
      // Pending removals are completed before stopping.
      if (pending_removals_.empty()) return;
      container = std::move(pending_removals_.front());
      pending_removals_.pop_front();
    }
    RemoveContainer(container.first, container.second);
  }
}

void ContainerExecutor::RemoveContainer(const std::string& runtime,
                                        const std::string& name) {
  sandbox::ExecutionOptions options("/", runtime);
  options.args = {"rm", "-f", name};
  options.wall_limit_millis = kRemoveTimeoutMillis;
  ProcessOutput output = runner_.Run(options, "");
  if (!output.started) {
    LOG(WARNING) << "Unable to remove container " << name << ": "
                 << output.error_msg;
  } else if (output.info.status_code != 0 || output.info.signal != 0) {
    LOG(WARNING) << "Unable to remove container " << name << ": "
                 << output.stderr_data;
  }
}

}  // namespace executor
