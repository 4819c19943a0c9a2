#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <thread>

#include <kj/debug.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

std::vector<char> ToCString(const std::string& s) {
  std::vector<char> ret(s.size() + 1);
  std::copy(s.begin(), s.end(), ret.begin());
  ret.back() = '\0';
  return ret;
}

int64_t MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

int MillisUntil(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - std::chrono::steady_clock::now())
                  .count();
  return left < 0 ? 0 : static_cast<int>(std::min<int64_t>(left, INT_MAX));
}

const constexpr int kTickMillis = 10;
const constexpr size_t kReadSize = 64 * 1024;
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                           std::string* error_msg) {
  if (!Launch(options, error_msg)) return false;
  Supervise(info);
  return true;
}

bool Unix::Launch(const ExecutionOptions& options, std::string* error_msg) {
  options_ = &options;
  if (!Setup(error_msg)) return false;
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    return false;
  }
  if (fork_result == 0) Child();
  child_pid_ = fork_result;
  return WaitForExec(error_msg);
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  auto make_pipe = [&](kj::AutoCloseFd* read_end, kj::AutoCloseFd* write_end) {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) == -1) {  // NOLINT
      *error_msg = "pipe2: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
      return false;
    }
    *read_end = kj::AutoCloseFd(fds[0]);
    *write_end = kj::AutoCloseFd(fds[1]);
    return true;
  };
  if (!make_pipe(&error_read_, &error_write_)) return false;
  if (!make_pipe(&stdout_read_, &stdout_write_)) return false;
  if (!make_pipe(&stderr_read_, &stderr_write_)) return false;

  int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_fd == -1) {
    *error_msg = "open: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);  // NOLINT
    return false;
  }
  null_fd_ = kj::AutoCloseFd(null_fd);

  arg_storage_.clear();
  env_storage_.clear();
  arg_storage_.push_back(ToCString(options_->executable));
  for (const std::string& arg : options_->args) {
    arg_storage_.push_back(ToCString(arg));
  }
  for (const std::string& var : options_->env) {
    env_storage_.push_back(ToCString(var));
  }
  argv_.clear();
  envp_.clear();
  for (auto& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);
  for (auto& var : env_storage_) envp_.push_back(var.data());
  envp_.push_back(nullptr);
  return true;
}

void Unix::Child() {
  int error_fd = error_write_.get();
  auto die2 = [error_fd](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);             // NOLINT
    strncat(buf, ": ", 3);                // NOLINT
    strncat(buf, err, kStrErrorBufSize);  // NOLINT
    ssize_t len = strlen(buf);            // NOLINT
    if (write(error_fd, &len, sizeof(len)) == sizeof(len)) {
      if (write(error_fd, buf, len) != len) _Exit(1);
    }
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));  // NOLINT
  };

  // New session and process group: the whole tree can be killed at once, and
  // we do not receive Ctrl-Cs in the terminal.
  if (setsid() == -1) die("setsid", errno);

  // Undo anything the server did to signal handling.
  sigset_t empty_set;
  sigemptyset(&empty_set);
  if (sigprocmask(SIG_SETMASK, &empty_set, nullptr) == -1) {
    die("sigprocmask", errno);
  }
  struct sigaction dfl {};
  dfl.sa_handler = SIG_DFL;
  sigemptyset(&dfl.sa_mask);
  for (int sig : {SIGPIPE, SIGCHLD, SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
    if (sigaction(sig, &dfl, nullptr) == -1) die("sigaction", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection. dup2 clears FD_CLOEXEC on the new descriptor, the
  // originals are closed by exec.
#define DUP(field, fd)                          \
  if (dup2(field.get(), fd) == -1) {            \
    die("redir " #fd, errno);                   \
  }
  DUP(null_fd_, STDIN_FILENO);
  DUP(stdout_write_, STDOUT_FILENO);
  DUP(stderr_write_, STDERR_FILENO);
#undef DUP

  struct rlimit rlim {};
  rlim.rlim_cur = rlim.rlim_max = 0;
  if (setrlimit(RLIMIT_CORE, &rlim) < 0) die("setrlim CORE", errno);

  execve(argv_[0], argv_.data(), envp_.data());
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::WaitForExec(std::string* error_msg) {
  error_write_ = nullptr;
  stdout_write_ = nullptr;
  stderr_write_ = nullptr;
  null_fd_ = nullptr;
  ssize_t error_len = 0;
  ssize_t got = 0;
  do {
    got = read(error_read_.get(), &error_len, sizeof(error_len));
  } while (got == -1 && errno == EINTR);
  if (got != sizeof(error_len)) {
    // EOF: exec closed the pipe.
    error_read_ = nullptr;
    return true;
  }
  char error[PIPE_BUF] = {};
  error_len = std::min<ssize_t>(error_len, PIPE_BUF - 1);
  KJ_SYSCALL(read(error_read_.get(), error, error_len),
             "Failed to read from fd");
  *error_msg = error;
  error_read_ = nullptr;
  // The child already called _Exit.
  int status = 0;
  while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
  }
  child_pid_ = 0;
  return false;
}

void Unix::Pump(int timeout_millis, ExecutionInfo* info) {
  struct pollfd fds[2] = {};
  kj::AutoCloseFd* owners[2] = {};
  std::string* sinks[2] = {};
  bool* truncated[2] = {};
  nfds_t nfds = 0;
  if (stdout_read_.get() != -1) {
    owners[nfds] = &stdout_read_;
    sinks[nfds] = &info->stdout_data;
    truncated[nfds] = &info->stdout_truncated;
    fds[nfds].fd = stdout_read_.get();
    fds[nfds++].events = POLLIN;
  }
  if (stderr_read_.get() != -1) {
    owners[nfds] = &stderr_read_;
    sinks[nfds] = &info->stderr_data;
    truncated[nfds] = &info->stderr_truncated;
    fds[nfds].fd = stderr_read_.get();
    fds[nfds++].events = POLLIN;
  }
  int ready = poll(fds, nfds, timeout_millis);
  if (ready <= 0) {
    if (ready == -1 && errno != EINTR) {
      KJ_LOG(WARNING, "poll failed", errno);
    }
    return;
  }
  char buf[kReadSize];
  for (nfds_t i = 0; i < nfds; i++) {
    if (!fds[i].revents) continue;
    ssize_t n = read(fds[i].fd, buf, kReadSize);
    if (n == -1 && errno == EINTR) continue;
    if (n <= 0) {
      *owners[i] = nullptr;
      continue;
    }
    size_t keep = static_cast<size_t>(n);
    if (options_->max_output_bytes != 0) {
      size_t room = options_->max_output_bytes > sinks[i]->size()
                        ? options_->max_output_bytes - sinks[i]->size()
                        : 0;
      if (keep > room) {
        keep = room;
        *truncated[i] = true;
      }
    }
    sinks[i]->append(buf, keep);
  }
}

void Unix::Supervise(ExecutionInfo* info) {
  auto program_start = std::chrono::steady_clock::now();
  while (true) {
    if (options_->wall_limit_millis != 0 &&
        MillisSince(program_start) >= options_->wall_limit_millis) {
      info->killed = true;
      break;
    }
    // WNOWAIT keeps the leader as a zombie, so that its pid (and the process
    // group id) cannot be reused before the group is killed.
    siginfo_t status{};
    int ret = waitid(P_PID, child_pid_, &status, WEXITED | WNOHANG | WNOWAIT);
    if (ret == -1 && errno != EINTR) {
      KJ_LOG(ERROR, "waitid failed", child_pid_, errno);
      break;
    }
    if (ret == 0 && status.si_pid == child_pid_) break;
    Pump(kTickMillis, info);
  }

  // Descendants may still be running even if the leader exited.
  TerminateGroup();

  auto drain_deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(options_->drain_limit_millis);
  while ((stdout_read_.get() != -1 || stderr_read_.get() != -1) &&
         std::chrono::steady_clock::now() < drain_deadline) {
    Pump(std::min(kTickMillis, MillisUntil(drain_deadline)), info);
  }
  if (stdout_read_.get() != -1 || stderr_read_.get() != -1) {
    KJ_LOG(WARNING, "Output still open after killing the process group",
           child_pid_);
  }
  stdout_read_ = nullptr;
  stderr_read_ = nullptr;

  if (!Reap(drain_deadline, info)) {
    pid_t pid = child_pid_;
    KJ_LOG(ERROR, "Process could not be reaped, leaving it to a background "
                  "reaper", pid);
    std::thread([pid]() {
      int status = 0;
      while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
      }
    }).detach();
    info->signal = SIGKILL;
    info->status_code = 0;
  }
  child_pid_ = 0;
  info->wall_time_millis = MillisSince(program_start);
}

bool Unix::Reap(std::chrono::steady_clock::time_point deadline,
                ExecutionInfo* info) {
  int child_status = 0;
  struct rusage rusage {};
  while (true) {
    pid_t ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == child_pid_) break;
    if (ret == -1 && errno != EINTR) {
      KJ_LOG(ERROR, "wait4 failed", child_pid_, errno);
      return false;
    }
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(kTickMillis));
  }
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->cpu_time_millis =
      rusage.ru_utime.tv_sec * 1000LL + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      rusage.ru_stime.tv_sec * 1000LL + rusage.ru_stime.tv_usec / 1000;
  return true;
}

void Unix::TerminateGroup() {
  if (child_pid_ <= 0) return;
  if (kill(-child_pid_, SIGKILL) == 0) return;
  char buf[kStrErrorBufSize] = {};
  std::string group_error = mystrerror(errno, buf, kStrErrorBufSize);
  // No group: the child may have died, or not reached setsid yet.
  if (kill(child_pid_, SIGKILL) == 0) return;
  KJ_LOG(WARNING, "Failed to kill process group", child_pid_, group_error,
         mystrerror(errno, buf, kStrErrorBufSize));
}

namespace {
Sandbox::Register<Unix> r;  // NOLINT
}  // namespace

}  // namespace sandbox
