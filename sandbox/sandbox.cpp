#include "sandbox/sandbox.hpp"

#include "sandbox/unix.hpp"

namespace sandbox {

std::unique_ptr<Sandbox> Sandbox::Create() {
  return std::unique_ptr<Sandbox>(new Unix());
}

}  // namespace sandbox
