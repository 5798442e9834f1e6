#ifndef CLAW_RESOLVER_HPP
#define CLAW_RESOLVER_HPP

#include <string>

#include "absl/types/optional.h"
#include "claw/config_query.hpp"
#include "claw/settings.hpp"

namespace claw {

// Turns a configured sandbox, possibly a path to a sandbox file, into the name
// of its development variant: "/path/to/foo.cfg" becomes "foo_dev" and
// "bar_dev.cfg" becomes "bar_dev".
std::string NormalizeSandboxName(const std::string& value);

// Computes the sandbox to use. The first source that provides a value wins:
//  1. the override from $CLAW_SANDBOX, verbatim;
//  2. the configured default sandbox, normalized;
//  3. the hardcoded default.
class SandboxResolver {
 public:
  // query must outlive this object.
  SandboxResolver(const Settings& settings, ConfigQuery* query)
      : settings_(settings), query_(query) {}

  // Never fails, and never returns an empty string.
  std::string Resolve();

 private:
  absl::optional<std::string> FromOverride();
  absl::optional<std::string> FromConfig();
  absl::optional<std::string> FromDefault();

  const Settings& settings_;
  ConfigQuery* query_;
};

}  // namespace claw

#endif
