#include "exec/unix.hpp"

#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

bool SetCloexec(int fd) { return fcntl(fd, F_SETFD, FD_CLOEXEC) != -1; }

pid_t WaitPid(pid_t pid, int* status, int options) {
  pid_t ret = 0;
  do {
    ret = waitpid(pid, status, options);
  } while (ret == -1 && errno == EINTR);
  return ret;
}

// Signals ignored while a child runs in the foreground, then signals passed on
// to it. saved_actions_ follows this order.
const int kIgnoredSignals[] = {SIGINT, SIGQUIT};
const int kForwardedSignals[] = {SIGTERM, SIGHUP};

volatile sig_atomic_t forward_pid = 0;

void ForwardSignal(int sig) {
  int saved_errno = errno;
  if (forward_pid > 0) kill(forward_pid, sig);
  errno = saved_errno;
}
}  // namespace

namespace exec {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr size_t kReadBufSize = 4096;

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  child_pid_ = 0;
  bool ok = Setup(error_msg) && BlockSignals(error_msg) &&
            DoFork(error_msg) && Wait(info, error_msg);
  RestoreSignals();
  ClosePipes();
  return ok;
}

bool Unix::Setup(std::string* error_msg) {
  arg_storage_.clear();
  argv_.clear();
  auto add_arg = [this](const std::string& arg) {
    arg_storage_.emplace_back(arg.begin(), arg.end());
    arg_storage_.back().push_back(0);
  };
  add_arg(options_->executable);
  for (const std::string& arg : options_->args) add_arg(arg);
  for (std::vector<char>& arg : arg_storage_) argv_.push_back(arg.data());
  argv_.push_back(nullptr);

  char buf[kStrErrorBufSize] = {};
  if (pipe(error_fds_) == -1) {
    *error_msg = "pipe: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (!SetCloexec(error_fds_[0]) || !SetCloexec(error_fds_[1])) {
    *error_msg = "fcntl: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (options_->capture_stdout) {
    if (pipe(stdout_fds_) == -1) {
      *error_msg = "pipe: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
    if (!SetCloexec(stdout_fds_[0]) || !SetCloexec(stdout_fds_[1])) {
      *error_msg = "fcntl: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      return false;
    }
  }
  return true;
}

bool Unix::BlockSignals(std::string* error_msg) {
  if (!options_->forward_signals) return true;
  sigset_t block;
  sigemptyset(&block);
  for (int sig : kIgnoredSignals) sigaddset(&block, sig);
  for (int sig : kForwardedSignals) sigaddset(&block, sig);
  if (sigprocmask(SIG_BLOCK, &block, &saved_mask_) == -1) {
    char buf[kStrErrorBufSize] = {};
    *error_msg = "sigprocmask: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  signals_blocked_ = true;
  return true;
}

bool Unix::ForwardSignals(std::string* error_msg) {
  if (!signals_blocked_) return true;
  forward_pid = child_pid_;
  struct sigaction ignore = {};
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  struct sigaction forward = {};
  forward.sa_handler = ForwardSignal;
  forward.sa_flags = SA_RESTART;
  sigemptyset(&forward.sa_mask);
  bool ok = true;
  int i = 0;
  for (int sig : kIgnoredSignals)
    ok = sigaction(sig, &ignore, &saved_actions_[i++]) != -1 && ok;
  for (int sig : kForwardedSignals)
    ok = sigaction(sig, &forward, &saved_actions_[i++]) != -1 && ok;
  handlers_installed_ = true;
  if (!ok) {
    char buf[kStrErrorBufSize] = {};
    *error_msg = "sigaction: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  // Signals received since BlockSignals are delivered here.
  if (sigprocmask(SIG_SETMASK, &saved_mask_, nullptr) == -1) {
    char buf[kStrErrorBufSize] = {};
    *error_msg = "sigprocmask: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  signals_blocked_ = false;
  return true;
}

void Unix::RestoreSignals() {
  // Only values obtained from sigaction and sigprocmask are put back, which
  // cannot fail.
  if (handlers_installed_) {
    int i = 0;
    for (int sig : kIgnoredSignals)
      sigaction(sig, &saved_actions_[i++], nullptr);
    for (int sig : kForwardedSignals)
      sigaction(sig, &saved_actions_[i++], nullptr);
    handlers_installed_ = false;
    forward_pid = 0;
  }
  if (signals_blocked_) {
    sigprocmask(SIG_SETMASK, &saved_mask_, nullptr);
    signals_blocked_ = false;
  }
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Unix::Child() {
  close(error_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strcat(buf, ": ");
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    ssize_t written = write(error_fds_[1], &len, sizeof(len));
    if (written == sizeof(len)) written = write(error_fds_[1], buf, len);
    close(error_fds_[1]);
    _exit(written == len ? 127 : 126);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // The child starts with the signal mask claw had.
  if (signals_blocked_ && sigprocmask(SIG_SETMASK, &saved_mask_, nullptr) == -1)
    die("sigprocmask", errno);

  // Handle I/O redirection.
  if (options_->capture_stdout) {
    close(stdout_fds_[0]);
    if (dup2(stdout_fds_[1], STDOUT_FILENO) == -1) die("redir stdout", errno);
  }
  if (options_->discard_stderr) {
    int null_fd = open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (null_fd == -1) die("open", errno);
    if (dup2(null_fd, STDERR_FILENO) == -1) die("redir stderr", errno);
  }

  int count = 0;
  do {
    execv(options_->executable.c_str(), argv_.data());
    usleep(100);
    // A freshly written executable may still be open for writing somewhere.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _exit(127);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (!ForwardSignals(error_msg)) {
    int child_status = 0;
    if (kill(child_pid_, SIGKILL) == -1 ||
        WaitPid(child_pid_, &child_status, 0) == -1) {
      *error_msg += " (child not reaped)";
    }
    return false;
  }
  close(error_fds_[1]);
  error_fds_[1] = -1;
  if (stdout_fds_[1] != -1) {
    close(stdout_fds_[1]);
    stdout_fds_[1] = -1;
  }

  // The error pipe is closed on a successful exec, so this read returns 0.
  int error_len = 0;
  ssize_t ret = 0;
  do {
    ret = read(error_fds_[0], &error_len, sizeof(error_len));
  } while (ret == -1 && errno == EINTR);
  if (ret == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    ssize_t got = read(error_fds_[0], error, error_len);
    *error_msg = got > 0 ? std::string(error, got) : "exec: unknown error";
    int child_status = 0;
    if (WaitPid(child_pid_, &child_status, 0) == -1) {
      *error_msg += " (waitpid failed)";
    }
    return false;
  }

  auto program_start = std::chrono::high_resolution_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::high_resolution_clock::now() - program_start)
        .count();
  };
  const int64_t limit = options_->wall_limit_millis;

  // Kills and reaps the child after an unexpected failure.
  auto fail = [this, &buf, error_msg](const char* prefix) {
    *error_msg = prefix;
    *error_msg += ": ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    int child_status = 0;
    if (kill(child_pid_, SIGKILL) == -1 ||
        WaitPid(child_pid_, &child_status, 0) == -1) {
      *error_msg += " (child not reaped)";
    }
    return false;
  };

  if (stdout_fds_[0] != -1) {
    char data[kReadBufSize];
    while (true) {
      int timeout = -1;
      if (limit) {
        int64_t remaining = limit - elapsed_millis();
        if (remaining <= 0) break;
        timeout = static_cast<int>(remaining);
      }
      struct pollfd pfd = {stdout_fds_[0], POLLIN, 0};
      int ready = poll(&pfd, 1, timeout);
      if (ready == -1) {
        if (errno == EINTR) continue;
        return fail("poll");
      }
      if (ready == 0) break;
      ssize_t num_read = read(stdout_fds_[0], data, kReadBufSize);
      if (num_read == -1) {
        if (errno == EINTR) continue;
        return fail("read");
      }
      if (num_read == 0) break;
      info->stdout_data.append(data, num_read);
    }
  }

  int child_status = 0;
  bool has_exited = false;
  if (limit) {
    while (elapsed_millis() < limit) {
      pid_t pid = WaitPid(child_pid_, &child_status, WNOHANG);
      if (pid == -1) return fail("waitpid");
      if (pid == child_pid_) {
        has_exited = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!has_exited) {
      if (kill(child_pid_, SIGKILL) == -1) return fail("kill");
      info->killed = true;
    }
  }
  if (!has_exited && WaitPid(child_pid_, &child_status, 0) != child_pid_) {
    *error_msg = "waitpid: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }

  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  return true;
}

void Unix::ClosePipes() {
  for (int* fd : {&error_fds_[0], &error_fds_[1], &stdout_fds_[0],
                  &stdout_fds_[1]}) {
    if (*fd != -1) close(*fd);
    *fd = -1;
  }
}

}  // namespace exec
