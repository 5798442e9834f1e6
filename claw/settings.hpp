#ifndef CLAW_SETTINGS_HPP
#define CLAW_SETTINGS_HPP

#include <cstdint>
#include <string>

namespace claw {

// Environment variable that, when non-empty, selects the sandbox directly.
static const constexpr char* kOverrideEnv = "CLAW_SANDBOX";

// Suffix identifying the development variant of a sandbox.
static const constexpr char* kDevSuffix = "_dev";

// Sandbox used when everything else fails.
static const constexpr char* kFallbackSandbox = "venv_columnar_dev";

// Everything claw reads from its environment, captured once at startup.
struct Settings {
  std::string override_sandbox;
  std::string launcher;
  std::string config_tool;
  std::string config_key;
  std::string default_sandbox = kFallbackSandbox;
  std::string command;
  int64_t query_timeout_millis = 0;
  bool dry_run = false;

  // Builds the settings from the flags and from $CLAW_SANDBOX.
  static Settings FromFlags();
};

}  // namespace claw

#endif
