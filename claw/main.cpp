#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "claw/claw.hpp"
#include "claw/settings.hpp"
#include "exec/echo.hpp"
#include "exec/unix.hpp"
#include "glog/logging.h"
#include "util/flags.hpp"

int main(int argc, char** argv) {
  util::LoadFlagsFromEnv(argv[0]);
  FLAGS_logtostderr = true;
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  std::vector<std::string> args(argv + 1, argv + argc);
  claw::Settings settings = claw::Settings::FromFlags();

  std::unique_ptr<exec::Runner> query_runner = exec::Unix::Create();
  std::unique_ptr<exec::Runner> launch_runner =
      settings.dry_run ? exec::Echo::Create(&std::cout) : exec::Unix::Create();
  return claw::Run(settings, args, query_runner.get(), launch_runner.get());
}
