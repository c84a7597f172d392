#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <sys/types.h>

#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs programs in their own session with resource limits, killing their
// process group when they are done. Network isolation uses an unprivileged
// user namespace, so it needs a kernel that allows them.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;

 private:
  // Builds argv and the error pipe. Nothing is allocated after fork.
  bool Setup(std::string* error_msg);
  bool DoFork(std::string* error_msg);
  [[noreturn]] void Child();
  // Returns true if the child failed before exec, with its message.
  bool ReadChildError(std::string* error_msg);
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  int pipe_fds_[2] = {};
  pid_t child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> args_;
};

}  // namespace sandbox
#endif
