#include "util/which.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
std::unordered_map<std::string, std::string> cmd_cache;
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.empty()) return "";
  if (absl::StrContains(cmd, '/')) {
    return File::IsExecutable(cmd) ? cmd : "";
  }

  const char* path = std::getenv("PATH");
  if (path == nullptr) throw std::runtime_error("PATH is not set");

  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];
  std::vector<std::string> dirs =
      absl::StrSplit(path, ':', absl::SkipEmpty());

  for (const std::string& dir : dirs) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (File::IsExecutable(fullpath)) return cmd_cache[cmd] = fullpath;
  }

  return cmd_cache[cmd] = "";
}

}  // namespace util
