#include "claw/dispatch.hpp"

#include "absl/strings/str_replace.h"
#include "glog/logging.h"
#include "util/which.hpp"

namespace claw {

std::string EscapeWildcards(const std::string& arg) {
  return absl::StrReplaceAll(arg, {{"*", "\\*"}});
}

std::vector<std::string> LauncherArgs(const std::string& command,
                                      const std::vector<std::string>& args) {
  std::vector<std::string> result = {command};
  result.reserve(args.size() + 1);
  for (const std::string& arg : args) result.push_back(EscapeWildcards(arg));
  return result;
}

int Dispatch(exec::Runner* runner, const std::string& launcher,
             const std::string& sandbox,
             const std::vector<std::string>& launcher_args) {
  std::string path;
  try {
    path = util::which(launcher);
  } catch (const std::runtime_error& e) {
    throw launcher_not_found(launcher + ": " + e.what());
  }
  if (path.empty()) throw launcher_not_found(launcher + ": command not found");

  exec::ExecutionOptions options(path);
  // claw only waits for the launcher, so signals meant for claw go to it.
  options.forward_signals = true;
  options.args.push_back(sandbox);
  options.args.insert(options.args.end(), launcher_args.begin(),
                      launcher_args.end());

  VLOG(1) << "Running " << path << " in sandbox " << sandbox;
  exec::ExecutionInfo info;
  std::string error_msg;
  if (!runner->Execute(options, &info, &error_msg)) {
    throw launcher_not_found(launcher + ": " + error_msg);
  }
  VLOG(1) << launcher << " exited with code " << exec::ExitCode(info);
  return exec::ExitCode(info);
}

}  // namespace claw
