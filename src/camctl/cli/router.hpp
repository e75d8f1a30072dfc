#pragma once

#include "core/logging/logger.hpp"

#include <optional>
#include <string>

namespace camctl::cli {

// Flags shared by every camera subcommand.
struct CommonOptions {
  std::string backend = "v4l2";
  std::optional<std::string> device;
  std::string config_path = "config.json";
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Routes `camctl` subcommands and returns process exit codes with a stable
// contract for scripts and supervisors:
//   0 => success
//   1 => command failed after valid invocation
//   2 => usage error (unknown command / invalid args)
//   20 => camera could not be opened
//   21 => camera session faulted while the command ran
int Dispatch(int argc, char** argv);

} // namespace camctl::cli
