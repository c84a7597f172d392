#ifndef EXECUTOR_TELEMETRY_HPP
#define EXECUTOR_TELEMETRY_HPP

#include <string>

#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace executor {

// Resource usage of a finished program. Every field is missing when the
// accounting source did not report it.
struct Telemetry {
  absl::optional<int64_t> memory_kb;
  absl::optional<int64_t> cpu_time_ms;
  absl::optional<int64_t> wall_time_ms;
};

// Parses the report written by GNU time -v. Unknown lines and malformed values
// are ignored; CPU time is the sum of user and system time and is only set if
// both are present.
Telemetry ParseTelemetry(absl::string_view text);

// The runtime to report: the measured wall time if known, the coarse timing of
// the caller otherwise.
int64_t ResolveRuntime(const Telemetry& telemetry, int64_t coarse_ms);

}  // namespace executor

#endif
