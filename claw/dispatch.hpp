#ifndef CLAW_DISPATCH_HPP
#define CLAW_DISPATCH_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "exec/runner.hpp"

namespace claw {

// Exit code used when the launcher cannot be found or started, the same a
// shell uses for a missing command.
static const constexpr int kLauncherNotFoundExitCode = 127;

class launcher_not_found : public std::runtime_error {
 public:
  explicit launcher_not_found(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Escapes every '*' of arg as "\*". The launcher re-splits its command line
// through a shell, which would otherwise expand the wildcards.
std::string EscapeWildcards(const std::string& arg);

// The command line run inside the sandbox: command followed by args, with
// their wildcards escaped.
std::vector<std::string> LauncherArgs(const std::string& command,
                                      const std::vector<std::string>& args);

// Runs "<launcher> <sandbox> <launcher_args...>" through runner, waits for it
// and returns its exit code, 128 + signal if it was killed by a signal.
// Throws launcher_not_found if the launcher cannot be found or started.
int Dispatch(exec::Runner* runner, const std::string& launcher,
             const std::string& sandbox,
             const std::vector<std::string>& launcher_args);

}  // namespace claw

#endif
