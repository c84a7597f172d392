#include "executor/host_executor.hpp"

#include <limits.h>
#include <unistd.h>

#include "absl/strings/str_split.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::EndsWith;
using ::testing::HasSubstr;

const constexpr char* kTmpDir = "/tmp/judgebox_host_executor_test";

// Absolute path of a helper program built beside the tests.
std::string Helper(const std::string& name) {
  char cwd[PATH_MAX] = {};
  if (getcwd(cwd, PATH_MAX) == nullptr) return name;
  return util::File::JoinPath(cwd, name);
}

class HostExecutorTest : public ::testing::Test {
 protected:
  HostExecutorTest()
      : checker_(absl::Seconds(30)),
        box_(kTmpDir),
        executor_(&checker_, kTmpDir, 1024 * 1024, /*isolate_network=*/false) {}

  executor::Request Shell(const std::string& script) {
    executor::Request request;
    request.args = {"sh", "-c", script};
    request.workdir = box_.Path();
    request.timeout_ms = 5000;
    return request;
  }

  executor::ToolchainChecker checker_;
  util::TempDir box_;
  executor::HostExecutor executor_;
};

// NOLINTNEXTLINE
TEST_F(HostExecutorTest, CapturesOutputAndExitCode) {
  proto::ExecutionResult result =
      executor_.Run(Shell("echo hi; echo err >&2; exit 3"));
  EXPECT_EQ(result.stdout(), "hi\n");
  EXPECT_EQ(result.stderr(), "err\n");
  EXPECT_EQ(result.exit_code(), 3);
  EXPECT_FALSE(result.timed_out());
  EXPECT_FALSE(result.output_truncated());
  EXPECT_TRUE(result.has_memory_kb());
  EXPECT_TRUE(result.has_cpu_time_ms());
}

// NOLINTNEXTLINE
TEST_F(HostExecutorTest, FeedsStdin) {
  executor::Request request = Shell("read a; echo $((a + 1))");
  request.stdin_data = "5\n";
  proto::ExecutionResult result = executor_.Run(request);
  EXPECT_EQ(result.stdout(), "6\n");
  EXPECT_EQ(result.exit_code(), 0);
}

// NOLINTNEXTLINE
TEST_F(HostExecutorTest, StdinIsClosed) {
  proto::ExecutionResult result = executor_.Run(Shell("cat; echo done"));
  EXPECT_EQ(result.stdout(), "done\n");
  EXPECT_FALSE(result.timed_out());
}

// NOLINTNEXTLINE
TEST_F(HostExecutorTest, RunsInWorkdir) {
  util::File::Write(util::File::JoinPath(box_.Path(), "data.txt"), "42");
  proto::ExecutionResult result =
      executor_.Run(Shell("cat data.txt && echo ok > out.txt"));
  EXPECT_EQ(result.stdout(), "42");
  EXPECT_TRUE(util::File::Exists(util::File::JoinPath(box_.Path(), "out.txt")));
}

// NOLINTNEXTLINE
TEST_F(HostExecutorTest, TimeoutKillsAndKeepsPartialOutput) {
  executor::Request request = Shell("echo partial; echo oops >&2; sleep 10");
  request.timeout_ms = 300;
  proto::ExecutionResult result = executor_.Run(request);
  EXPECT_TRUE(result.timed_out());
  EXPECT_EQ(result.exit_code(), executor::kTimeoutExitCode);
  EXPECT_EQ(result.stdout(), "partial\n");
  EXPECT_EQ(result.stderr(), "oops\nTime limit exceeded");
  EXPECT_GE(result.runtime_ms(), 300);
  EXPECT_LT(result.runtime_ms(), 800);
}

// NOLINTNEXTLINE
TEST_F(HostExecutorTest, MissingProgram) {
  executor::Request request;
  request.args = {"surely-not-an-installed-program"};
  request.workdir = box_.Path();
  proto::ExecutionResult result = executor_.Run(request);
  EXPECT_EQ(result.exit_code(), executor::kNotFoundExitCode);
  EXPECT_EQ(result.stderr(),
            "surely-not-an-installed-program: command not found");
}

// NOLINTNEXTLINE
TEST_F(HostExecutorTest, MissingProgramPath) {
  executor::Request request;
  request.args = {"/nonexistent/main"};
  request.workdir = box_.Path();
  proto::ExecutionResult result = executor_.Run(request);
  EXPECT_EQ(result.exit_code(), executor::kNotFoundExitCode);
  EXPECT_THAT(result.stderr(), HasSubstr("/nonexistent/main"));
}

// NOLINTNEXTLINE
TEST_F(HostExecutorTest, MissingWorkdirIsAnExecutionError) {
  executor::Request request = Shell("true");
  request.workdir = "/nonexistent/box";
  proto::ExecutionResult result = executor_.Run(request);
  EXPECT_EQ(result.exit_code(), 1);
  EXPECT_THAT(result.stderr(), HasSubstr("Execution error: chdir"));
}

// NOLINTNEXTLINE
TEST_F(HostExecutorTest, SignalExitCode) {
  proto::ExecutionResult result = executor_.Run(Shell("kill -9 $$"));
  EXPECT_EQ(result.exit_code(), 128 + 9);
}

// NOLINTNEXTLINE
TEST_F(HostExecutorTest, MemoryLimit) {
  executor::Request request;
  request.args = {Helper("sandbox/test/malloc_arg1"), "200"};
  request.workdir = box_.Path();
  request.timeout_ms = 5000;
  request.limits.memory_kb = 32 * 1024;
  proto::ExecutionResult result = executor_.Run(request);
  EXPECT_NE(result.exit_code(), 0);
  EXPECT_THAT(result.stderr(), EndsWith("Memory limit exceeded"));
}

// NOLINTNEXTLINE
TEST(HostExecutorOutputTest, OutputIsCapped) {
  executor::ToolchainChecker checker(absl::Seconds(30));
  util::TempDir box(kTmpDir);
  executor::HostExecutor executor(&checker, kTmpDir, 16, false);
  executor::Request request;
  request.args = {"sh", "-c", "printf 0123456789abcdefghij"};
  request.workdir = box.Path();
  request.timeout_ms = 5000;
  proto::ExecutionResult result = executor.Run(request);
  EXPECT_EQ(result.stdout(), "0123456789abcdef");
  EXPECT_TRUE(result.output_truncated());
}

// NOLINTNEXTLINE
TEST(HostExecutorNetworkTest, OnlyLoopbackIsVisible) {
  executor::ToolchainChecker checker(absl::Seconds(30));
  util::TempDir box(kTmpDir);
  executor::HostExecutor executor(&checker, kTmpDir, 1024 * 1024, true);
  executor::Request request;
  request.args = {"cat", "/proc/net/dev"};
  request.workdir = box.Path();
  request.timeout_ms = 5000;
  proto::ExecutionResult result = executor.Run(request);
  if (result.exit_code() == 1 &&
      result.stderr().find("unshare") != std::string::npos) {
    GTEST_SKIP() << "Unprivileged namespaces are not available: "
                 << result.stderr();
  }
  ASSERT_EQ(result.exit_code(), 0);
  std::vector<std::string> lines =
      absl::StrSplit(result.stdout(), '\n', absl::SkipEmpty());
  // Two header lines, then one line per interface.
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_THAT(lines[2], HasSubstr("lo:"));
}

}  // namespace
