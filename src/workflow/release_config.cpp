#include "workflow/release_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <functional>
#include <map>
#include <utility>

namespace fs = std::filesystem;

namespace diststage::workflow {

namespace {

using JsonValue = core::json::Value;

bool ExpectType(const std::string& key, const JsonValue& value, JsonValue::Type expected,
                std::string& error) {
  if (value.type == expected) {
    return true;
  }
  error = "config key '" + key + "' must be a " + core::json::ToString(expected) + ", got " +
          core::json::ToString(value.type);
  return false;
}

using FieldSetter =
    std::function<bool(const std::string& key, const JsonValue& value, ReleaseConfig& config,
                       std::string& error)>;

FieldSetter StringField(std::string ReleaseConfig::*member) {
  return [member](const std::string& key, const JsonValue& value, ReleaseConfig& config,
                  std::string& error) {
    if (!ExpectType(key, value, JsonValue::Type::kString, error)) {
      return false;
    }
    config.*member = value.string_value;
    return true;
  };
}

FieldSetter PathField(fs::path ReleaseConfig::*member) {
  return [member](const std::string& key, const JsonValue& value, ReleaseConfig& config,
                  std::string& error) {
    if (!ExpectType(key, value, JsonValue::Type::kString, error)) {
      return false;
    }
    config.*member = fs::path(value.string_value);
    return true;
  };
}

FieldSetter BoolField(bool ReleaseConfig::*member) {
  return [member](const std::string& key, const JsonValue& value, ReleaseConfig& config,
                  std::string& error) {
    if (!ExpectType(key, value, JsonValue::Type::kBool, error)) {
      return false;
    }
    config.*member = value.bool_value;
    return true;
  };
}

const std::map<std::string, FieldSetter>& FieldSetters() {
  static const std::map<std::string, FieldSetter> setters = {
      {"is_dist_module", BoolField(&ReleaseConfig::is_dist_module)},
      {"staging_url", StringField(&ReleaseConfig::staging_url)},
      {"release_url", StringField(&ReleaseConfig::release_url)},
      {"dry_run", BoolField(&ReleaseConfig::dry_run)},
      {"working_dir", PathField(&ReleaseConfig::working_dir)},
      {"checkout_dir", PathField(&ReleaseConfig::checkout_dir)},
      {"staging_checkout_dir", PathField(&ReleaseConfig::staging_checkout_dir)},
      {"release_checkout_dir", PathField(&ReleaseConfig::release_checkout_dir)},
      {"release_notes", PathField(&ReleaseConfig::release_notes)},
      {"site_dir", PathField(&ReleaseConfig::site_dir)},
      {"site_archive", PathField(&ReleaseConfig::site_archive)},
      {"artifact_id", StringField(&ReleaseConfig::artifact_id)},
      {"version", StringField(&ReleaseConfig::version)},
      {"site_url", StringField(&ReleaseConfig::site_url)},
      {"username", StringField(&ReleaseConfig::username)},
      {"password", StringField(&ReleaseConfig::password)},
      {"log_level",
       [](const std::string& key, const JsonValue& value, ReleaseConfig& config,
          std::string& error) {
         if (!ExpectType(key, value, JsonValue::Type::kString, error)) {
           return false;
         }
         return core::logging::ParseLogLevel(value.string_value, config.log_level, error);
       }},
  };
  return setters;
}

} // namespace

const char* ToString(ReleaseGoal goal) {
  switch (goal) {
  case ReleaseGoal::kStage:
    return "stage";
  case ReleaseGoal::kPromote:
    return "promote";
  case ReleaseGoal::kCompressSite:
    return "compress-site";
  }
  return "unknown";
}

fs::path ReleaseConfig::CheckoutDir() const {
  return checkout_dir.empty() ? working_dir / "scm" : checkout_dir;
}

fs::path ReleaseConfig::StagingCheckoutDir() const {
  return staging_checkout_dir.empty() ? working_dir / "dist-staging-scm" : staging_checkout_dir;
}

fs::path ReleaseConfig::ReleaseCheckoutDir() const {
  return release_checkout_dir.empty() ? working_dir / "dist-release-scm" : release_checkout_dir;
}

fs::path ReleaseConfig::SiteZipPath() const {
  return working_dir / "site.zip";
}

bool ApplyReleaseConfigJson(std::string_view json_text, ReleaseConfig& config,
                            std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "invalid config JSON: " + error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "config root must be a JSON object";
    return false;
  }

  // Stage into a copy so a bad key leaves the caller's config untouched.
  ReleaseConfig updated = config;
  const auto& setters = FieldSetters();
  for (const auto& [key, value] : root.object_value) {
    const auto it = setters.find(key);
    if (it == setters.end()) {
      error = "unknown config key: '" + key + "'";
      return false;
    }
    if (!it->second(key, value, updated, error)) {
      return false;
    }
  }

  config = std::move(updated);
  return true;
}

bool LoadReleaseConfigFile(const fs::path& path, ReleaseConfig& config, std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ApplyReleaseConfigJson(text, config, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

bool ValidateReleaseConfig(const ReleaseConfig& config, ReleaseGoal goal, std::string& error) {
  switch (goal) {
  case ReleaseGoal::kStage:
    if (config.artifact_id.empty()) {
      error = "artifact id is required to stage a release (--artifact-id)";
      return false;
    }
    if (config.version.empty()) {
      error = "version is required to stage a release (--version)";
      return false;
    }
    if (config.release_notes.empty()) {
      error = "release notes path cannot be empty";
      return false;
    }
    return true;
  case ReleaseGoal::kPromote:
    if (config.release_url.empty()) {
      error = "release URL is required to promote a release (--release-url)";
      return false;
    }
    return true;
  case ReleaseGoal::kCompressSite:
    if (config.site_dir.empty()) {
      error = "site directory cannot be empty";
      return false;
    }
    return true;
  }
  error = "unsupported goal";
  return false;
}

} // namespace diststage::workflow
