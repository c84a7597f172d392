#include "executor/executor.hpp"

namespace executor {

std::vector<proto::ToolStatus> Executor::Locate(
    const std::vector<std::string>& tools) {
  std::vector<proto::ToolStatus> statuses;
  for (const std::string& program : HostPrograms(tools)) {
    proto::ToolStatus status;
    status.set_name(program);
    status.set_path(checker_->Find(program));
    status.set_available(!status.path().empty());
    statuses.push_back(std::move(status));
  }
  return statuses;
}

std::string Executor::CheckAvailable(const std::vector<std::string>& tools) {
  for (const proto::ToolStatus& status : Locate(tools)) {
    if (!status.available()) return status.name() + ": command not found";
  }
  return "";
}

}  // namespace executor
