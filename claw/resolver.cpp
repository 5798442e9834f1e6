#include "claw/resolver.hpp"

#include <functional>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "util/file.hpp"

namespace claw {

std::string NormalizeSandboxName(const std::string& value) {
  std::string name = util::File::StripExtension(util::File::BaseName(value));
  if (!absl::EndsWith(name, kDevSuffix)) absl::StrAppend(&name, kDevSuffix);
  return name;
}

std::string SandboxResolver::Resolve() {
  const std::vector<std::function<absl::optional<std::string>()>> sources = {
      [this]() { return FromOverride(); },
      [this]() { return FromConfig(); },
      [this]() { return FromDefault(); },
  };
  for (const auto& source : sources) {
    absl::optional<std::string> sandbox = source();
    if (sandbox && !sandbox->empty()) return *sandbox;
  }
  return kFallbackSandbox;
}

absl::optional<std::string> SandboxResolver::FromOverride() {
  if (settings_.override_sandbox.empty()) return absl::nullopt;
  VLOG(1) << "Sandbox from $" << kOverrideEnv << ": "
          << settings_.override_sandbox;
  return settings_.override_sandbox;
}

absl::optional<std::string> SandboxResolver::FromConfig() {
  absl::optional<std::string> value = query_->Get(settings_.config_key);
  if (!value) return absl::nullopt;
  std::string sandbox = NormalizeSandboxName(*value);
  VLOG(1) << "Sandbox from " << settings_.config_key << " (" << *value
          << "): " << sandbox;
  return sandbox;
}

absl::optional<std::string> SandboxResolver::FromDefault() {
  VLOG(1) << "Using the default sandbox " << settings_.default_sandbox;
  return settings_.default_sandbox;
}

}  // namespace claw
