#include "sandbox/unix.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <sched.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

const constexpr size_t kErrorBufSize = 1024;
const constexpr auto kPollInterval = std::chrono::milliseconds(10);
const constexpr auto kMemoryPollInterval = std::chrono::milliseconds(5);
// Attempts at exec while the executable is still busy (ETXTBSY).
const constexpr int kExecAttempts = 16;

// strerror_r has two incompatible signatures, pick the right one.
const char* ErrorString(int err, char* buf, size_t size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, size);
#else
  strerror_r(err, buf, size);
  return buf;
#endif
}

// Formats "<what>: <strerror(errno)>" in the parent process.
std::string SystemError(const char* what) {
  char buf[kErrorBufSize] = {};
  return std::string(what) + ": " + ErrorString(errno, buf, kErrorBufSize);
}

// Resident set size of pid, in KiB. /proc/<pid>/statm holds sizes in pages;
// the second one is the resident set.
bool ResidentSetKb(pid_t pid, int64_t page_kb, int64_t* rss_kb) {
  std::string path = "/proc/" + std::to_string(pid) + "/statm";
  int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd == -1) return false;
  char statm[256] = {};
  ssize_t len;
  do {
    len = read(fd, statm, sizeof(statm) - 1);
  } while (len == -1 && errno == EINTR);
  close(fd);
  if (len <= 0) return false;
  long long total_pages = 0;
  long long resident_pages = 0;
  if (sscanf(statm, "%lld %lld", &total_pages, &resident_pages) != 2)
    return false;
  *rss_kb = resident_pages * page_kb;
  return true;
}

int64_t ToMillis(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}

}  // namespace

namespace sandbox {

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  return Setup(error_msg) && DoFork(error_msg) && Wait(info, error_msg);
}

bool Unix::Setup(std::string* error_msg) {
  arg_storage_.clear();
  args_.clear();
  arg_storage_.emplace_back(options_->executable.c_str(),
                            options_->executable.c_str() +
                                options_->executable.size() + 1);
  for (const std::string& arg : options_->args)
    arg_storage_.emplace_back(arg.c_str(), arg.c_str() + arg.size() + 1);
  for (std::vector<char>& arg : arg_storage_) args_.push_back(arg.data());
  args_.push_back(nullptr);

  // The child reports failures before exec on this pipe, which closes by
  // itself when exec succeeds.
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = SystemError("pipe");
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  pid_t pid = fork();
  if (pid == -1) {
    *error_msg = SystemError("fork");
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (pid == 0) Child();
  child_pid_ = pid;
  return true;
}

void Unix::Child() {
  close(pipe_fds_[0]);
  // Only async-signal-safe calls from here on, and no allocations.
  auto die = [this](const char* what, int err) {
    char reason[kErrorBufSize] = {};
    char msg[kErrorBufSize + 64] = {};
    snprintf(msg, sizeof(msg), "%.60s: %s", what,
             ErrorString(err, reason, kErrorBufSize));
    int len = strlen(msg);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      ssize_t unused = write(pipe_fds_[1], msg, len);
      (void)unused;
    }
    _Exit(1);
  };

  // Own session and process group, so that the whole group can be killed and
  // terminal signals do not reach it.
  if (setsid() == -1) die("setsid", errno);

  const char* input =
      options_->stdin_file.empty() ? "/dev/null" : options_->stdin_file.c_str();
  int in_fd = open(input, O_RDONLY);
  if (in_fd == -1) die("open", errno);
  int out_fd = -1;
  if (!options_->stdout_file.empty()) {
    out_fd = creat(options_->stdout_file.c_str(), S_IRUSR | S_IWUSR);
    if (out_fd == -1) die("creat", errno);
  }
  int err_fd = -1;
  if (!options_->stderr_file.empty()) {
    err_fd = creat(options_->stderr_file.c_str(), S_IRUSR | S_IWUSR);
    if (err_fd == -1) die("creat", errno);
  }

  // Relative paths above are resolved against the caller's directory.
  if (chdir(options_->root.c_str()) == -1) die("chdir", errno);

  auto redirect = [&die](int fd, int target, const char* what) {
    if (fd == -1) return;
    if (dup2(fd, target) == -1) die(what, errno);
    close(fd);
  };
  redirect(in_fd, STDIN_FILENO, "redirect stdin");
  redirect(out_fd, STDOUT_FILENO, "redirect stdout");
  redirect(err_fd, STDERR_FILENO, "redirect stderr");

  if (options_->isolate_network &&
      unshare(CLONE_NEWUSER | CLONE_NEWNET) == -1) {
    die("unshare", errno);
  }

  // Zero leaves the limit unset, except for core dumps which are always off.
  auto limit = [&die](int resource, rlim_t value, const char* what,
                      bool force = false) {
    if (!value && !force) return;
    struct rlimit rlim;
    rlim.rlim_cur = value;
    rlim.rlim_max = value;
    if (setrlimit(resource, &rlim) == -1) die(what, errno);
  };
  limit(RLIMIT_CPU, (options_->cpu_limit_millis + 999) / 1000,
        "setrlimit CPU");
  limit(RLIMIT_FSIZE, options_->max_file_size_kb * 1024, "setrlimit FSIZE");
  limit(RLIMIT_NPROC, options_->max_procs, "setrlimit NPROC");
  limit(RLIMIT_STACK, options_->max_stack_kb * 1024, "setrlimit STACK");
  limit(RLIMIT_CORE, 0, "setrlimit CORE", true);

  // An executable that was just written may still be open for writing in a
  // process forked meanwhile; exec fails with ETXTBSY until it exits.
  for (int attempt = 0; attempt < kExecAttempts; attempt++) {
    execv(options_->executable.c_str(), args_.data());
    if (errno != ETXTBSY) break;
    usleep(100);
  }
  die("exec", errno);
  _Exit(1);
}

bool Unix::ReadChildError(std::string* error_msg) {
  close(pipe_fds_[1]);
  int len = 0;
  ssize_t got = read(pipe_fds_[0], &len, sizeof(len));
  if (got != sizeof(len)) {
    close(pipe_fds_[0]);
    return false;
  }
  char msg[PIPE_BUF] = {};
  len = std::max(0, std::min(len, PIPE_BUF - 1));
  got = read(pipe_fds_[0], msg, len);
  close(pipe_fds_[0]);
  error_msg->assign(msg, got > 0 ? got : 0);
  return true;
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  if (ReadChildError(error_msg)) {
    int status = 0;
    while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
    }
    return false;
  }

  const int64_t page_kb = sysconf(_SC_PAGESIZE) / 1024;
  std::atomic<int64_t> peak_rss_kb{0};
  std::atomic<bool> done{false};
  std::thread memory_watcher([this, &peak_rss_kb, &done, page_kb] {
    while (!done) {
      int64_t rss_kb = 0;
      if (ResidentSetKb(child_pid_, page_kb, &rss_kb) &&
          rss_kb > peak_rss_kb) {
        peak_rss_kb = rss_kb;
      }
      std::this_thread::sleep_for(kMemoryPollInterval);
    }
  });

  const auto start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&start] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  int status = 0;
  struct rusage usage = {};
  bool exited = false;
  bool failed = false;
  for (;;) {
    if (options_->wall_limit_millis &&
        elapsed_millis() >= options_->wall_limit_millis) {
      info->wall_limit_exceeded = true;
      break;
    }
    if (options_->memory_limit_kb &&
        peak_rss_kb > options_->memory_limit_kb) {
      info->memory_limit_exceeded = true;
      break;
    }
    pid_t ret = wait4(child_pid_, &status, WNOHANG, &usage);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = SystemError("wait4");
      failed = true;
      break;
    }
    if (ret == child_pid_) {
      exited = true;
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }
  info->wall_time_millis = elapsed_millis();

  // Processes the program left behind are killed even if it exited.
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH && !failed) {
    *error_msg = SystemError("kill");
    failed = true;
  }
  if (!exited) {
    pid_t ret;
    do {
      ret = wait4(child_pid_, &status, 0, &usage);
    } while (ret == -1 && errno == EINTR);
    if (ret != child_pid_ && !failed) {
      *error_msg = SystemError("wait4");
      failed = true;
    }
  }
  done = true;
  memory_watcher.join();
  if (failed) return false;

  // ru_maxrss is in KiB on Linux.
  info->memory_usage_kb = std::max<int64_t>(usage.ru_maxrss, peak_rss_kb);
  info->status_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
  info->signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  info->cpu_time_millis = ToMillis(usage.ru_utime);
  info->sys_time_millis = ToMillis(usage.ru_stime);
  return true;
}

}  // namespace sandbox
