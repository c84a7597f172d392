#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <stdint.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// What to run and within which limits. Limits left at zero are not applied.
struct ExecutionOptions {
  // Working directory of the program.
  std::string root;
  // Path of the program, relative to root unless absolute.
  std::string executable;
  // Arguments after argv[0].
  std::vector<std::string> args;

  // Files for the standard streams, relative to the caller's directory.
  // Without a stdin file the program reads from /dev/null; without an output
  // file the stream is inherited.
  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;

  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  // Resident set size ceiling, enforced by polling.
  int64_t memory_limit_kb = 0;
  int32_t max_procs = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_stack_kb = 0;
  // Leaves the program with an unconfigured loopback interface only.
  bool isolate_network = false;

  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// What happened to the program.
struct ExecutionInfo {
  int32_t status_code = 0;
  // Terminating signal, 0 if the program exited.
  int32_t signal = 0;
  // The sandbox killed the program because of the wall or memory limit.
  bool wall_limit_exceeded = false;
  bool memory_limit_exceeded = false;

  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
};

class Sandbox {
 public:
  static std::unique_ptr<Sandbox> Create();

  // Runs one program to completion. Returns false, with error_msg set to
  // "<operation>: <reason>", if it could not be started or supervised.
  // Instances are not thread-safe.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  Sandbox() = default;
  virtual ~Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
};

}  // namespace sandbox

#endif
