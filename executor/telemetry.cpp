#include "executor/telemetry.hpp"

#include <cmath>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

namespace executor {

namespace {

const constexpr char* kMaxRss = "Maximum resident set size (kbytes)";
const constexpr char* kUserTime = "User time (seconds)";
const constexpr char* kSystemTime = "System time (seconds)";
const constexpr char* kWallTime = "Elapsed (wall clock) time";

absl::optional<int64_t> SecondsToMillis(absl::string_view value) {
  double seconds = 0;
  if (!absl::SimpleAtod(value, &seconds) || seconds < 0) return absl::nullopt;
  return static_cast<int64_t>(std::llround(seconds * 1000));
}

// Parses [[h:]m:]s.ss into milliseconds.
absl::optional<int64_t> ClockToMillis(absl::string_view value) {
  std::vector<absl::string_view> parts = absl::StrSplit(value, ':');
  if (parts.empty() || parts.size() > 3) return absl::nullopt;
  absl::optional<int64_t> millis = SecondsToMillis(parts.back());
  if (!millis) return absl::nullopt;
  int64_t multiplier = 60 * 1000;
  for (size_t i = parts.size() - 1; i-- > 0;) {
    int64_t amount = 0;
    if (!absl::SimpleAtoi(parts[i], &amount) || amount < 0)
      return absl::nullopt;
    *millis += amount * multiplier;
    multiplier *= 60;
  }
  return millis;
}

}  // namespace

Telemetry ParseTelemetry(absl::string_view text) {
  Telemetry telemetry;
  absl::optional<int64_t> user_ms;
  absl::optional<int64_t> system_ms;
  for (absl::string_view line : absl::StrSplit(text, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    // Keys may contain colons (e.g. "h:mm:ss or m:ss").
    size_t sep = line.rfind(": ");
    if (sep == absl::string_view::npos) continue;
    absl::string_view key = line.substr(0, sep);
    absl::string_view value = absl::StripAsciiWhitespace(line.substr(sep + 2));
    if (key == kMaxRss) {
      int64_t kb = 0;
      if (absl::SimpleAtoi(value, &kb) && kb >= 0) telemetry.memory_kb = kb;
    } else if (key == kUserTime) {
      user_ms = SecondsToMillis(value);
    } else if (key == kSystemTime) {
      system_ms = SecondsToMillis(value);
    } else if (absl::StartsWith(key, kWallTime)) {
      telemetry.wall_time_ms = ClockToMillis(value);
    }
  }
  if (user_ms && system_ms) telemetry.cpu_time_ms = *user_ms + *system_ms;
  return telemetry;
}

int64_t ResolveRuntime(const Telemetry& telemetry, int64_t coarse_ms) {
  return telemetry.wall_time_ms ? *telemetry.wall_time_ms : coarse_ms;
}

}  // namespace executor
