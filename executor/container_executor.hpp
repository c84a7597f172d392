#ifndef EXECUTOR_CONTAINER_EXECUTOR_HPP
#define EXECUTOR_CONTAINER_EXECUTOR_HPP

#include <atomic>
#include <deque>
#include <string>
#include <thread>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

#include "executor/executor.hpp"
#include "executor/process_runner.hpp"

namespace executor {

struct ContainerOptions {
  // Container runtime CLI, docker or a compatible one.
  std::string runtime = "docker";
  // Extra wall time granted to the runtime for starting the container. The
  // program's own time is still checked against the timeout when the
  // accounting wrapper reports it.
  int64_t overhead_ms = 250;
  // GNU time binary inside the image; empty to disable resource accounting.
  std::string accounting_wrapper = "/usr/bin/time";
};

// Runs every program in a disposable container, with no network access and
// the work directory mounted as /code.
class ContainerExecutor : public Executor {
 public:
  ContainerExecutor(ToolchainChecker* checker, std::string temp_directory,
                    int64_t max_output_bytes, ContainerOptions options);
  // Waits for the removal of the containers killed so far.
  ~ContainerExecutor() override;

  std::string Id() const override { return "CONTAINER"; }
  proto::ExecutionResult Run(const Request& request) override;
  // The language tools are inside the images; only the runtime is needed
  // here.
  std::vector<std::string> HostPrograms(
      const std::vector<std::string>& tools) const override {
    return {options_.runtime};
  }
  bool IsolatesNetwork() const override { return true; }

  // Name of the file, inside the work directory, where the accounting wrapper
  // writes its report.
  static const constexpr char* kAccountingFile = ".judgebox_time";

 private:
  // Runs the request once, with or without the accounting wrapper.
  proto::ExecutionResult RunOnce(const Request& request,
                                 const std::string& runtime,
                                 bool use_wrapper);

  // Builds the full command line of the runtime.
  std::vector<std::string> CommandLine(const Request& request,
                                       const std::string& name,
                                       bool use_wrapper) const;

  // Containers that outlived their deadline are removed in the background,
  // so that the caller does not wait for the runtime.
  void ScheduleRemoval(const std::string& runtime, const std::string& name);
  void RemovalLoop();
  bool HasRemovalWork() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(removal_mutex_) {
    return stopping_ || !pending_removals_.empty();
  }
  void RemoveContainer(const std::string& runtime, const std::string& name);

  ProcessRunner runner_;
  ContainerOptions options_;
  std::atomic<int64_t> next_id_{0};

  absl::Mutex removal_mutex_;
  // (runtime, container name)
  std::deque<std::pair<std::string, std::string>> pending_removals_
      ABSL_GUARDED_BY(removal_mutex_);
  bool stopping_ ABSL_GUARDED_BY(removal_mutex_) = false;
  std::thread remover_;
};

}  // namespace executor

#endif
