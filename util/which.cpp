#include "util/which.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
bool is_executable(const std::string& path) {
  struct stat buffer {};
  if (stat(path.c_str(), &buffer) != 0) return false;
  return S_ISREG(buffer.st_mode) && access(path.c_str(), X_OK) == 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd) {
  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");
  if (cmd.find('/') != std::string::npos) {
    return is_executable(cmd) ? cmd : "";
  }
  const std::vector<std::string> dirs =
      absl::StrSplit(path, ':', absl::SkipEmpty());

  for (const std::string& dir : dirs) {
    std::string fullpath = util::File::JoinPath(dir, cmd);
    if (is_executable(fullpath)) return fullpath;
  }
  return "";
}

}  // namespace util
