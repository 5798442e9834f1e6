#include "claw/claw.hpp"

#include "claw/config_query.hpp"
#include "claw/dispatch.hpp"
#include "claw/resolver.hpp"
#include "glog/logging.h"

namespace claw {

int Run(const Settings& settings, const std::vector<std::string>& args,
        exec::Runner* query_runner, exec::Runner* launch_runner) {
  ToolConfigQuery query(query_runner, settings.config_tool,
                        settings.query_timeout_millis);
  SandboxResolver resolver(settings, &query);
  std::string sandbox = resolver.Resolve();
  CHECK(!sandbox.empty());

  try {
    return Dispatch(launch_runner, settings.launcher, sandbox,
                    LauncherArgs(settings.command, args));
  } catch (const launcher_not_found& e) {
    LOG(ERROR) << e.what();
    return kLauncherNotFoundExitCode;
  }
}

}  // namespace claw
