#include "claw/settings.hpp"

#include <cstdlib>

#include "glog/logging.h"
#include "util/flags.hpp"

namespace claw {

Settings Settings::FromFlags() {
  Settings settings;
  const char* override_sandbox = std::getenv(kOverrideEnv);
  if (override_sandbox != nullptr) settings.override_sandbox = override_sandbox;
  settings.launcher = FLAGS_launcher;
  settings.config_tool = FLAGS_config_tool;
  settings.config_key = FLAGS_config_key;
  if (FLAGS_default_sandbox.empty()) {
    LOG(WARNING) << "Empty default sandbox, using " << kFallbackSandbox;
  } else {
    settings.default_sandbox = FLAGS_default_sandbox;
  }
  settings.command = FLAGS_command;
  settings.query_timeout_millis = FLAGS_query_timeout_millis;
  settings.dry_run = FLAGS_dry_run;
  return settings;
}

}  // namespace claw
