#ifndef EXEC_RUNNER_HPP
#define EXEC_RUNNER_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace exec {

// Settings to execute a program.
struct ExecutionOptions {
  // Optional values
  int64_t wall_limit_millis = 0;
  bool capture_stdout = false;
  bool discard_stderr = false;
  // While waiting, ignore SIGINT and SIGQUIT (the child gets them from the
  // terminal) and pass SIGTERM and SIGHUP on to the child.
  bool forward_signals = false;
  std::vector<std::string> args;

  // Required values
  std::string executable = "";
  explicit ExecutionOptions(std::string executable)
      : executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t wall_time_millis = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  bool killed = false;
  // Only filled if capture_stdout was set.
  std::string stdout_data;
};

// Runs programs on behalf of claw. The config query and the launcher are both
// started through this interface, so that tests and dry runs can replace the
// actual process creation.
class Runner {
 public:
  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Constructor and destructors
  virtual ~Runner() = default;
  Runner() = default;
  Runner(const Runner&) = delete;
  Runner(Runner&&) = delete;
  Runner& operator=(const Runner&) = delete;
  Runner& operator=(Runner&&) = delete;
};

// Exit code a shell would report for info: the status code for a normal exit,
// 128 + signal number for a program killed by a signal.
int ExitCode(const ExecutionInfo& info);

}  // namespace exec

#endif
