#ifndef MANAGER_ERRORS_HPP
#define MANAGER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace manager {

// A request that can never succeed, whatever the state of the machine. These
// are rejected before anything is run.
class client_error : public std::invalid_argument {
 public:
  explicit client_error(const std::string& msg) : std::invalid_argument(msg) {}
};

class unsupported_language : public client_error {
 public:
  explicit unsupported_language(const std::string& language)
      : client_error("Language not supported: " + language) {}
};

class invalid_request : public client_error {
 public:
  explicit invalid_request(const std::string& msg) : client_error(msg) {}
};

}  // namespace manager

#endif
