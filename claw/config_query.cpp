#include "claw/config_query.hpp"

#include <stdexcept>
#include <utility>

#include "glog/logging.h"
#include "util/which.hpp"

namespace claw {

ToolConfigQuery::ToolConfigQuery(exec::Runner* runner, std::string tool,
                                 int64_t timeout_millis)
    : runner_(runner), tool_(std::move(tool)), timeout_millis_(timeout_millis) {}

absl::optional<std::string> ToolConfigQuery::Get(const std::string& key) {
  std::string path;
  try {
    path = util::which(tool_);
  } catch (const std::runtime_error& e) {
    VLOG(1) << "Cannot look up " << tool_ << ": " << e.what();
    return absl::nullopt;
  }
  if (path.empty()) {
    VLOG(1) << tool_ << " not found, cannot query " << key;
    return absl::nullopt;
  }

  exec::ExecutionOptions options(path);
  options.args = {"config", key};
  options.capture_stdout = true;
  options.discard_stderr = true;
  options.wall_limit_millis = timeout_millis_ > 0 ? timeout_millis_ : 0;

  exec::ExecutionInfo info;
  std::string error_msg;
  if (!runner_->Execute(options, &info, &error_msg)) {
    VLOG(1) << "Query of " << key << " failed to start: " << error_msg;
    return absl::nullopt;
  }
  if (info.killed) {
    VLOG(1) << "Query of " << key << " timed out after " << timeout_millis_
            << "ms";
    return absl::nullopt;
  }
  if (info.signal || info.status_code) {
    VLOG(1) << "Query of " << key << " exited with code "
            << exec::ExitCode(info);
    return absl::nullopt;
  }

  std::string value = std::move(info.stdout_data);
  while (!value.empty() && value.back() == '\n') value.pop_back();
  if (value.empty()) {
    VLOG(1) << "No value configured for " << key;
    return absl::nullopt;
  }
  return value;
}

}  // namespace claw
