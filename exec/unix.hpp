#ifndef EXEC_UNIX_HPP
#define EXEC_UNIX_HPP

#include <memory>

#include <signal.h>

#include "exec/runner.hpp"

namespace exec {

// Runs programs with fork and execv. The child inherits the environment, the
// working directory, stdin and the process group of claw, so that terminal
// signals reach it as they would reach a program started by a shell.
class Unix : public Runner {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static std::unique_ptr<Runner> Create() {
    return std::unique_ptr<Runner>(new Unix());
  }

 protected:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and does not return.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process. It must not use dynamic
  // memory allocation.
  [[noreturn]] void Child();

  // Blocks the forwarded signals until the child exists, if forward_signals
  // is set.
  bool BlockSignals(std::string* error_msg);

  // Installs the forwarding handlers for child_pid_ and unblocks the signals.
  bool ForwardSignals(std::string* error_msg);

  // Puts back the signal mask and the handlers that were there before.
  void RestoreSignals();

  // Reads the captured stdout, if any, and waits for the termination of the
  // child, possibly killing it if it exceeds the wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Closes all the pipes that are still open.
  void ClosePipes();

  int error_fds_[2] = {-1, -1};
  int stdout_fds_[2] = {-1, -1};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
  bool signals_blocked_ = false;
  bool handlers_installed_ = false;
  sigset_t saved_mask_ = {};
  struct sigaction saved_actions_[4] = {};
  // Prepared by Setup, since the child must not allocate.
  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
};

}  // namespace exec
#endif
