#include "workflow/release_config.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using diststage::workflow::ApplyReleaseConfigJson;
using diststage::workflow::ReleaseConfig;
using diststage::workflow::ReleaseGoal;
using diststage::workflow::ValidateReleaseConfig;

TEST_CASE("Defaults derive checkout directories from the working directory",
          "[workflow][config]") {
  ReleaseConfig config;
  REQUIRE_FALSE(config.is_dist_module);
  REQUIRE_FALSE(config.dry_run);
  REQUIRE(config.working_dir == fs::path("target/diststage"));
  REQUIRE(config.CheckoutDir() == fs::path("target/diststage/scm"));
  REQUIRE(config.StagingCheckoutDir() == fs::path("target/diststage/dist-staging-scm"));
  REQUIRE(config.ReleaseCheckoutDir() == fs::path("target/diststage/dist-release-scm"));
  REQUIRE(config.SiteZipPath() == fs::path("target/diststage/site.zip"));

  config.working_dir = "/build/out";
  REQUIRE(config.CheckoutDir() == fs::path("/build/out/scm"));
  config.checkout_dir = "/elsewhere/co";
  REQUIRE(config.CheckoutDir() == fs::path("/elsewhere/co"));
}

TEST_CASE("JSON config overlays typed fields", "[workflow][config]") {
  ReleaseConfig config;
  std::string error;
  REQUIRE(ApplyReleaseConfigJson(R"({
    "is_dist_module": true,
    "staging_url": "scm:svn:https://dist.example.org/dev/foo",
    "dry_run": true,
    "working_dir": "/build/diststage",
    "artifact_id": "commons-foo",
    "version": "1.2",
    "site_url": "https://commons.example.org/foo",
    "log_level": "debug"
  })",
                                 config, error));
  REQUIRE(error.empty());
  REQUIRE(config.is_dist_module);
  REQUIRE(config.dry_run);
  REQUIRE(config.staging_url == "scm:svn:https://dist.example.org/dev/foo");
  REQUIRE(config.working_dir == fs::path("/build/diststage"));
  REQUIRE(config.artifact_id == "commons-foo");
  REQUIRE(config.version == "1.2");
  REQUIRE(config.log_level == diststage::core::logging::LogLevel::kDebug);
  // Untouched keys keep their defaults.
  REQUIRE(config.release_notes == fs::path("RELEASE-NOTES.txt"));
}

TEST_CASE("Unknown keys and wrong types are rejected without partial updates",
          "[workflow][config]") {
  ReleaseConfig config;
  std::string error;

  REQUIRE_FALSE(ApplyReleaseConfigJson(R"({"artifact_id": "foo", "stagingUrl": "x"})", config,
                                       error));
  REQUIRE(error.find("stagingUrl") != std::string::npos);
  REQUIRE(config.artifact_id.empty());

  REQUIRE_FALSE(ApplyReleaseConfigJson(R"({"dry_run": "yes"})", config, error));
  REQUIRE(error.find("dry_run") != std::string::npos);
  REQUIRE(error.find("boolean") != std::string::npos);

  REQUIRE_FALSE(ApplyReleaseConfigJson(R"({"log_level": "chatty"})", config, error));
  REQUIRE_FALSE(ApplyReleaseConfigJson(R"(["not", "an", "object"])", config, error));
  REQUIRE_FALSE(ApplyReleaseConfigJson(R"({"version": )", config, error));
  REQUIRE(error.find("invalid config JSON") != std::string::npos);
}

TEST_CASE("Goal validation names the missing field", "[workflow][config]") {
  ReleaseConfig config;
  std::string error;

  REQUIRE_FALSE(ValidateReleaseConfig(config, ReleaseGoal::kStage, error));
  REQUIRE(error.find("artifact id") != std::string::npos);
  config.artifact_id = "foo";
  REQUIRE_FALSE(ValidateReleaseConfig(config, ReleaseGoal::kStage, error));
  REQUIRE(error.find("version") != std::string::npos);
  config.version = "1.0";
  REQUIRE(ValidateReleaseConfig(config, ReleaseGoal::kStage, error));

  REQUIRE_FALSE(ValidateReleaseConfig(config, ReleaseGoal::kPromote, error));
  REQUIRE(error.find("release URL") != std::string::npos);
  config.release_url = "scm:svn:https://dist.example.org/release/foo";
  REQUIRE(ValidateReleaseConfig(config, ReleaseGoal::kPromote, error));

  REQUIRE(ValidateReleaseConfig(config, ReleaseGoal::kCompressSite, error));
}
