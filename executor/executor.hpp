#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP
#include <string>
#include <vector>

#include "executor/toolchain_checker.hpp"
#include "proto/judge.pb.h"

namespace executor {

// Exit codes with a fixed meaning in proto::ExecutionResult.
static const constexpr int kTimeoutExitCode = 124;
static const constexpr int kNotFoundExitCode = 127;

struct ResourceLimits {
  // Share of CPUs the program may use. Only containers can enforce fractions.
  double cpus = 1.0;
  // Zero means no limit.
  int64_t memory_kb = 0;
  int32_t max_procs = 0;
};

// A single program to run.
struct Request {
  // args[0] is the program, looked up in PATH (or in the image) if it does not
  // contain a slash.
  std::vector<std::string> args;
  std::string stdin_data;
  int64_t timeout_ms = 0;
  // Directory that contains the program files. The program runs inside it and
  // may write to it.
  std::string workdir;
  ResourceLimits limits;
  // Container image, ignored by executors that do not use containers.
  std::string image;
  // Whether fine-grained resource accounting should be collected.
  bool accounting = true;
};

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Runs a request. Failures of the program, including a program that cannot
  // be started, are reported in the result; only faults of the executor
  // itself (e.g. scratch files that cannot be created) throw.
  virtual proto::ExecutionResult Run(const Request& request) = 0;

  // Programs that must be installed on this machine to run the given
  // language tools.
  virtual std::vector<std::string> HostPrograms(
      const std::vector<std::string>& tools) const = 0;

  // Whether programs are run without network access.
  virtual bool IsolatesNetwork() const = 0;

  // Looks up every program returned by HostPrograms(tools).
  std::vector<proto::ToolStatus> Locate(const std::vector<std::string>& tools);

  // Returns an empty string if everything needed to run the given tools is
  // installed, otherwise a message naming the first missing program.
  std::string CheckAvailable(const std::vector<std::string>& tools);

  explicit Executor(ToolchainChecker* checker) : checker_(checker) {}
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;

 protected:
  ToolchainChecker* checker_;
};

}  // namespace executor

#endif
