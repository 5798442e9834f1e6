#ifndef CLAW_CLAW_HPP
#define CLAW_CLAW_HPP

#include <string>
#include <vector>

#include "claw/settings.hpp"
#include "exec/runner.hpp"

namespace claw {

// Resolves the sandbox and runs the command "<settings.command> <args...>"
// inside it through the launcher. Returns the exit code claw should exit with.
// query_runner starts the configuration tool and launch_runner the launcher.
int Run(const Settings& settings, const std::vector<std::string>& args,
        exec::Runner* query_runner, exec::Runner* launch_runner);

}  // namespace claw

#endif
