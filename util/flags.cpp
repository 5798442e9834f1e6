#include "util/flags.hpp"

#include <string>
#include <vector>

#include "absl/strings/str_join.h"

DEFINE_string(launcher, "cf_sandbox",
              "Program that runs a command inside a sandbox");
DEFINE_string(config_tool, "law",
              "Program queried for the configured default sandbox");
DEFINE_string(config_key, "analysis.default_columnar_sandbox",
              "Configuration key holding the default sandbox");
DEFINE_string(default_sandbox, "venv_columnar_dev",
              "Sandbox used when neither the override nor the configuration "
              "provide one");
DEFINE_string(command, "law",
              "Command prepended to the forwarded arguments");
DEFINE_int32(query_timeout_millis, 0,
             "Kill the configuration query after this many milliseconds. If "
             "0, wait forever");
DEFINE_bool(dry_run, false,
            "Print the launcher command line instead of executing it");

namespace {
const std::vector<std::string> kEnvFlags = {
    "launcher", "config_tool",          "config_key", "default_sandbox",
    "command",  "query_timeout_millis", "dry_run"};
}  // namespace

namespace util {

void LoadFlagsFromEnv(const char* program_name) {
  std::vector<std::string> args = {
      program_name, "--tryfromenv=" + absl::StrJoin(kEnvFlags, ",")};
  std::vector<char*> argv;
  for (std::string& arg : args) argv.push_back(&arg[0]);
  argv.push_back(nullptr);
  int argc = static_cast<int>(args.size());
  char** argv_ptr = argv.data();
  gflags::ParseCommandLineFlags(&argc, &argv_ptr, true);
}

}  // namespace util
