#include "executor/executor_builder.hpp"

#include "executor/host_executor.hpp"
#include "glog/logging.h"

#include <memory>
#include <stdexcept>

namespace executor {

ExecutorOptions::Kind ExecutorBuilder::ParseKind(const std::string& name) {
  if (name == "host") return ExecutorOptions::Kind::HOST;
  if (name == "container") return ExecutorOptions::Kind::CONTAINER;
  throw std::invalid_argument("Unknown sandbox mode: " + name);
}

std::unique_ptr<Executor> ExecutorBuilder::Get(const ExecutorOptions& options,
                                               ToolchainChecker* checker) {
  if (options.kind == ExecutorOptions::Kind::CONTAINER) {
    LOG(INFO) << "Running submissions in " << options.container.runtime
              << " containers";
    return std::unique_ptr<Executor>(
        new ContainerExecutor(checker, options.temp_directory,
                              options.max_output_bytes, options.container));
  }
  LOG(INFO) << "Running submissions on the host"
            << (options.isolate_network ? " without network access" : "");
  return std::unique_ptr<Executor>(
      new HostExecutor(checker, options.temp_directory,
                       options.max_output_bytes, options.isolate_network));
}
}  // namespace executor
