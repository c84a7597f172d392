#ifndef EXECUTOR_HOST_EXECUTOR_HPP
#define EXECUTOR_HOST_EXECUTOR_HPP

#include "executor/executor.hpp"
#include "executor/process_runner.hpp"

namespace executor {

// Runs programs directly on this machine, using the toolchains installed on
// it, confined by the UNIX sandbox.
class HostExecutor : public Executor {
 public:
  HostExecutor(ToolchainChecker* checker, std::string temp_directory,
               int64_t max_output_bytes, bool isolate_network);

  std::string Id() const override { return "HOST"; }
  proto::ExecutionResult Run(const Request& request) override;
  std::vector<std::string> HostPrograms(
      const std::vector<std::string>& tools) const override {
    return tools;
  }
  bool IsolatesNetwork() const override { return isolate_network_; }

 private:
  ProcessRunner runner_;
  bool isolate_network_;
};

}  // namespace executor

#endif
