#ifndef EXECUTOR_TOOLCHAIN_CHECKER_HPP
#define EXECUTOR_TOOLCHAIN_CHECKER_HPP

#include <functional>
#include <map>
#include <string>

#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace executor {

// Finds the programs needed to run submissions, caching the answers for a
// while so that every request does not scan PATH again. Thread-safe.
class ToolchainChecker {
 public:
  // Returns the full path of a program, or an empty string if it is missing.
  using Lookup = std::function<std::string(const std::string&)>;
  using Clock = std::function<absl::Time()>;

  explicit ToolchainChecker(absl::Duration ttl);
  ToolchainChecker(absl::Duration ttl, Lookup lookup, Clock clock);

  // Returns the full path of program, or an empty string if it is not
  // installed.
  std::string Find(const std::string& program);

  // Forgets every cached answer, e.g. after a toolchain has been installed.
  void Invalidate();

  ToolchainChecker(const ToolchainChecker&) = delete;
  ToolchainChecker& operator=(const ToolchainChecker&) = delete;

 private:
  struct Entry {
    std::string path;
    absl::Time expires;
  };

  absl::Duration ttl_;
  Lookup lookup_;
  Clock clock_;
  absl::Mutex mutex_;
  std::map<std::string, Entry> cache_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace executor

#endif
