#include "exec/echo.hpp"

namespace exec {

bool Echo::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* /*error_msg*/) {
  *out_ << "[DRY-RUN] Executing ";
  *out_ << options.executable;
  for (const std::string& arg : options.args) *out_ << " " << arg;
  *out_ << std::endl;
  info->wall_time_millis = 0;
  info->signal = 0;
  info->status_code = 0;
  info->killed = false;
  return true;
}

}  // namespace exec
