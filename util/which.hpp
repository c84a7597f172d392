#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the full path of the
// first executable named cmd in the directories listed in PATH, or an empty
// string if there is none. Throws if PATH is not set. Lookups are not cached,
// see executor::ToolchainChecker for that.
std::string which(const std::string& cmd);

}  // namespace util

#endif
