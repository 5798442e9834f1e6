#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

DECLARE_string(launcher);
DECLARE_string(config_tool);
DECLARE_string(config_key);
DECLARE_string(default_sandbox);
DECLARE_string(command);
DECLARE_int32(query_timeout_millis);
DECLARE_bool(dry_run);

namespace util {

// Every argument of claw is forwarded, so flags are never read from the
// command line. Instead, each flag "foo" is read from the FLAGS_foo
// environment variable, if set.
void LoadFlagsFromEnv(const char* program_name);

}  // namespace util

#endif
