#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Uses caching to speed up
// lookups, unless explicitly disabled.
// A command containing a '/' is not searched in PATH: it is returned as-is if
// it is an executable file.
// Returns an empty string if the command cannot be found, and throws
// std::runtime_error if PATH is not set.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
