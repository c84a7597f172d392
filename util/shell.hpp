#ifndef UTIL_SHELL_HPP
#define UTIL_SHELL_HPP

#include <string>
#include <vector>

namespace util {

// Quotes a single word for a POSIX shell. The result is always single-quoted,
// so no character of the input is interpreted by the shell.
std::string ShellQuote(const std::string& word);

// Quotes every word of args and joins them with spaces.
std::string ShellJoin(const std::vector<std::string>& args);

}  // namespace util

#endif
