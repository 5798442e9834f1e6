#ifndef EXEC_ECHO_HPP
#define EXEC_ECHO_HPP

#include <memory>
#include <ostream>

#include "exec/runner.hpp"

namespace exec {

// Fake runner: prints the command line instead of running it.
class Echo : public Runner {
 public:
  static std::unique_ptr<Runner> Create(std::ostream* out) {
    return std::unique_ptr<Runner>(new Echo(out));
  }

  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;

 private:
  explicit Echo(std::ostream* out) : out_(out) {}
  std::ostream* out_;
};

}  // namespace exec
#endif
