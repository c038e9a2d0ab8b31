#pragma once

#include "workflow/release_config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace diststage::cli {

enum class ParseStatus {
  kOk,
  // Malformed command line (unknown flag, missing value).
  kUsage,
  // Well-formed command line naming a config file that cannot be used.
  kConfig,
};

// Builds the release configuration for a goal from its arguments:
// defaults, then `--config <file.json>` (wherever it appears), then every
// other flag in order. Positional arguments are rejected.
ParseStatus ParseReleaseOptions(const std::vector<std::string_view>& args,
                                workflow::ReleaseConfig& config, std::string& error);

// Routes `diststage` subcommands and returns process exit codes with a stable
// contract for release scripts:
//   0  => success (including a goal that skipped because its gates are unmet)
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => invalid configuration
//   20 => filesystem failure
//   30 => site archive failure
//   40 => version control failure
int Dispatch(int argc, char** argv);

} // namespace diststage::cli
