#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace diststage::workflow {

// Goals a release configuration can drive.
enum class ReleaseGoal {
  kStage,
  kPromote,
  kCompressSite,
};

const char* ToString(ReleaseGoal goal);

// Everything one diststage invocation needs. Paths are used as given
// (relative paths resolve against the process working directory); nothing
// reads global state.
//
// The three checkout directories default to subdirectories of `working_dir`
// when left empty; use the accessors rather than the raw fields.
struct ReleaseConfig {
  bool is_dist_module = false;
  std::string staging_url;
  std::string release_url;
  bool dry_run = false;

  std::filesystem::path working_dir = "target/diststage";
  std::filesystem::path checkout_dir;
  std::filesystem::path staging_checkout_dir;
  std::filesystem::path release_checkout_dir;
  std::filesystem::path release_notes = "RELEASE-NOTES.txt";
  std::filesystem::path site_dir = "target/site";
  std::filesystem::path site_archive;

  std::string artifact_id;
  std::string version;
  std::string site_url;

  std::string username;
  std::string password;

  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;

  std::filesystem::path CheckoutDir() const;
  std::filesystem::path StagingCheckoutDir() const;
  std::filesystem::path ReleaseCheckoutDir() const;
  std::filesystem::path SiteZipPath() const;
};

// Overlays the members of a JSON object onto `config`. Keys not present keep
// their current value. Unknown keys and mistyped values are errors.
bool ApplyReleaseConfigJson(std::string_view json_text, ReleaseConfig& config,
                            std::string& error);

// Reads `path` and applies it with ApplyReleaseConfigJson.
bool LoadReleaseConfigFile(const std::filesystem::path& path, ReleaseConfig& config,
                           std::string& error);

// Goal-specific required fields. Called only after a goal's skip gates pass.
bool ValidateReleaseConfig(const ReleaseConfig& config, ReleaseGoal goal, std::string& error);

} // namespace diststage::workflow
