#ifndef CLAW_CONFIG_QUERY_HPP
#define CLAW_CONFIG_QUERY_HPP

#include <cstdint>
#include <string>

#include "absl/types/optional.h"
#include "exec/runner.hpp"

namespace claw {

// Source of configured values, looked up by dotted key.
class ConfigQuery {
 public:
  // Returns the value configured for key, or nullopt if there is none or the
  // lookup failed in any way.
  virtual absl::optional<std::string> Get(const std::string& key) = 0;

  ConfigQuery() = default;
  virtual ~ConfigQuery() = default;
  ConfigQuery(const ConfigQuery&) = delete;
  ConfigQuery& operator=(const ConfigQuery&) = delete;
  ConfigQuery(ConfigQuery&&) = delete;
  ConfigQuery& operator=(ConfigQuery&&) = delete;
};

// Asks an external tool, invoked as "<tool> config <key>". The value is what
// the tool prints on stdout, without trailing newlines. A non-zero exit, an
// empty output or a tool that cannot be started all mean "no value"; the
// tool's stderr is discarded.
class ToolConfigQuery : public ConfigQuery {
 public:
  // runner must outlive this object. If timeout_millis is positive, the tool
  // is killed after that long and the lookup fails.
  ToolConfigQuery(exec::Runner* runner, std::string tool,
                  int64_t timeout_millis = 0);

  absl::optional<std::string> Get(const std::string& key) override;

 private:
  exec::Runner* runner_;
  std::string tool_;
  int64_t timeout_millis_;
};

}  // namespace claw

#endif
