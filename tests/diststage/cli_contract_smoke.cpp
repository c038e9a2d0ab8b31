#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;
using namespace diststage::tests::common;

namespace {

void ExpectExit(const std::vector<std::string>& argv, int expected, std::string_view needle,
                bool in_stderr = true) {
  std::string out;
  std::string err;
  const int code = DispatchArgsCaptured(argv, out, err);
  if (code != expected) {
    Fail("unexpected exit code " + std::to_string(code) + " (expected " +
         std::to_string(expected) + ") for " + argv[1] + "\nstdout: " + out + "\nstderr: " + err);
  }
  if (!needle.empty()) {
    AssertContains(in_stderr ? err : out, needle);
  }
}

} // namespace

int main() {
  const fs::path root = CreateUniqueTempDir("diststage-cli");

  ExpectExit({"diststage"}, 2, "usage:");
  ExpectExit({"diststage", "publish"}, 2, "unknown subcommand: publish");
  ExpectExit({"diststage", "help"}, 0, "diststage stage", false);
  ExpectExit({"diststage", "version"}, 0, "diststage 0.1.0", false);
  ExpectExit({"diststage", "version", "--verbose"}, 2, "does not accept arguments");

  ExpectExit({"diststage", "stage", "--bogus"}, 2, "unknown option: --bogus");
  ExpectExit({"diststage", "stage", "--staging-url"}, 2, "missing value for --staging-url");
  ExpectExit({"diststage", "stage", "stray"}, 2, "unexpected argument: stray");
  ExpectExit({"diststage", "stage", "--log-level", "loud"}, 2, "invalid log level");

  // Config file problems are configuration errors, not usage errors.
  ExpectExit({"diststage", "stage", "--config", (root / "missing.json").string()}, 10,
             "missing.json");
  WriteFile(root / "bad.json", R"({"stagingUrl": "x"})");
  ExpectExit({"diststage", "stage", "--config", (root / "bad.json").string()}, 10,
             "unknown config key");

  // Not a distribution module: informational skip, exit 0, nothing created.
  const fs::path work = root / "work";
  WriteFile(work / "foo-1.0-src.zip", "src");
  ExpectExit({"diststage", "stage", "--staging-url", "scm:svn:https://example.org/dist",
              "--working-dir", work.string(), "--log-level", "error"},
             0, "skipped stage: not a distribution module", false);
  AssertNotExists(work / "scm");

  // The config file supplies a base that flags override.
  WriteFile(root / "release.json", R"({
    "is_dist_module": true,
    "staging_url": "",
    "working_dir": ")" + work.generic_string() + R"("
  })");
  ExpectExit({"diststage", "stage", "--config", (root / "release.json").string(), "--log-level",
              "error"},
             0, "skipped stage: staging URL is not set", false);

  // Boolean flags can switch off what the config file switched on.
  WriteFile(root / "dist.json", R"({
    "is_dist_module": true,
    "dry_run": true,
    "staging_url": "scm:svn:https://example.org/dist",
    "working_dir": ")" + work.generic_string() + R"("
  })");
  ExpectExit({"diststage", "stage", "--config", (root / "dist.json").string(), "--no-dist-module",
              "--log-level", "error"},
             0, "skipped stage: not a distribution module", false);
  AssertNotExists(work / "scm");

  diststage::workflow::ReleaseConfig parsed;
  std::string parse_error;
  const std::string dist_config = (root / "dist.json").string();
  if (diststage::cli::ParseReleaseOptions({"--no-dry-run", "--config", dist_config}, parsed,
                                          parse_error) != diststage::cli::ParseStatus::kOk) {
    Fail("option parsing failed: " + parse_error);
  }
  if (parsed.dry_run || !parsed.is_dist_module) {
    Fail("--no-dry-run must override the config file and keep its other settings");
  }

  // compress-site end to end through the CLI.
  WriteFile(root / "site" / "index.html", "<html/>");
  ExpectExit({"diststage", "compress-site", "--site-dir", (root / "site").string(),
              "--working-dir", (root / "out").string(), "--log-level", "error"},
             0, "site archive:", false);
  AssertExists(root / "out" / "site.zip");
  ExpectExit({"diststage", "compress-site", "--site-dir", (root / "no-site").string(),
              "--working-dir", (root / "out").string(), "--log-level", "error"},
             30, "site directory not found");

  // promote without a release URL.
  ExpectExit({"diststage", "promote", "--dist-module", "--staging-url",
              "scm:svn:https://example.org/dist", "--working-dir", (root / "promote").string(),
              "--log-level", "error"},
             10, "release URL");

  RemovePathBestEffort(root);
  return 0;
}
