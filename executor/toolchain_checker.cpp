#include "executor/toolchain_checker.hpp"

#include "glog/logging.h"
#include "util/which.hpp"

namespace executor {

ToolchainChecker::ToolchainChecker(absl::Duration ttl)
    : ToolchainChecker(ttl, util::which, absl::Now) {}

ToolchainChecker::ToolchainChecker(absl::Duration ttl, Lookup lookup,
                                   Clock clock)
    : ttl_(ttl), lookup_(std::move(lookup)), clock_(std::move(clock)) {}

std::string ToolchainChecker::Find(const std::string& program) {
  absl::Time now = clock_();
  {
    absl::MutexLock lock(&mutex_);
    auto it = cache_.find(program);
    if (it != cache_.end() && it->second.expires > now) return it->second.path;
  }
  // The lookup touches the filesystem, so it runs without the lock; two
  // concurrent misses just look the program up twice.
  std::string path = lookup_(program);
  if (path.empty()) {
    LOG(WARNING) << program << " not found";
  } else {
    VLOG(1) << program << " found at " << path;
  }
  absl::MutexLock lock(&mutex_);
  cache_[program] = Entry{path, now + ttl_};
  return path;
}

void ToolchainChecker::Invalidate() {
  absl::MutexLock lock(&mutex_);
  cache_.clear();
}

}  // namespace executor
