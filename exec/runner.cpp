#include "exec/runner.hpp"

namespace exec {

int ExitCode(const ExecutionInfo& info) {
  if (info.signal) return 128 + info.signal;
  return info.status_code;
}

}  // namespace exec
