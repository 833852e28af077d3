#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace netstack::cli {

inline constexpr std::string_view kBackendAws = "aws";
inline constexpr std::string_view kBackendSim = "sim";

// Parsed flags shared by create, collect and teardown. Each command accepts
// only its own subset; anything else is a usage error.
struct CommandOptions {
  std::string region;
  std::string prefix;
  std::string key_name;
  std::string backend = std::string(kBackendAws);
  std::filesystem::path sim_state_path;
  std::optional<std::string> ssh_cidr;
  std::filesystem::path config_path;
  std::filesystem::path output_dir = ".";
  std::filesystem::path report_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Routes `netstack` subcommands and returns process exit codes with a stable
// contract for scripts (see core/errors/exit_codes.hpp):
//   0  => success (teardown also returns 0 when individual actions failed)
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => --config file has issues
//   20 => selected backend is not usable
//   30 => collect found no VPC for the prefix
//   31 => more than one VPC carries the prefix
//   40 => create stopped at a failed step
int Dispatch(int argc, char** argv);

} // namespace netstack::cli
