#ifndef EXECUTOR_EXECUTOR_BUILDER_HPP
#define EXECUTOR_EXECUTOR_BUILDER_HPP
#include "executor/container_executor.hpp"
#include "executor/executor.hpp"

#include <memory>

namespace executor {

struct ExecutorOptions {
  enum class Kind { HOST, CONTAINER };
  Kind kind = Kind::HOST;
  // Where per-invocation scratch files are created.
  std::string temp_directory;
  int64_t max_output_bytes = 1024 * 1024;
  // Only used by the host executor; containers never have network access.
  bool isolate_network = true;
  ContainerOptions container;
};

class ExecutorBuilder {
 public:
  // Parses the name of an executor kind ("host" or "container"). Throws
  // std::invalid_argument for unknown names.
  static ExecutorOptions::Kind ParseKind(const std::string& name);

  static std::unique_ptr<Executor> Get(const ExecutorOptions& options,
                                       ToolchainChecker* checker);
};

}  // namespace executor

#endif
