#include "diststage/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "vcs/svn_exe_backend.hpp"
#include "workflow/promote_workflow.hpp"
#include "workflow/site_compression.hpp"
#include "workflow/stage_workflow.hpp"
#include "workflow/workflow_result.hpp"

#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace diststage::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);

using workflow::ReleaseConfig;
using workflow::ReleaseGoal;

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  diststage stage --dist-module --staging-url <scm:svn:url> --artifact-id <id> "
         "--version <v> [options]\n"
      << "  diststage compress-site [--site-dir <dir>] [--working-dir <dir>] [options]\n"
      << "  diststage promote --dist-module --staging-url <scm:svn:url> "
         "--release-url <scm:svn:url> [options]\n"
      << "  diststage version\n"
      << "  diststage help\n"
      << "\n"
      << "options:\n"
      << "  --config <file.json>           load settings from a JSON object (flags override)\n"
      << "  --working-dir <dir>            build output holding the artifacts "
         "(default target/diststage)\n"
      << "  --checkout-dir <dir>           staging checkout (default <working-dir>/scm)\n"
      << "  --staging-checkout-dir <dir>   promote staging checkout "
         "(default <working-dir>/dist-staging-scm)\n"
      << "  --release-checkout-dir <dir>   promote release checkout "
         "(default <working-dir>/dist-release-scm)\n"
      << "  --release-notes <file>         (default RELEASE-NOTES.txt)\n"
      << "  --site-dir <dir>               generated site (default target/site)\n"
      << "  --site-archive <file>          pre-built site archive to stage\n"
      << "  --site-url <url>               project site linked from README.html\n"
      << "  --username <name> --password <secret>\n"
      << "  --dist-module, --no-dist-module  mark the module as the distribution module\n"
      << "  --dry-run, --no-dry-run        check out and stage but do not commit\n"
      << "  --log-level <debug|info|warn|error>\n";
}

using StringSetter = std::function<void(ReleaseConfig&, std::string_view)>;

StringSetter SetString(std::string ReleaseConfig::*member) {
  return [member](ReleaseConfig& config, std::string_view value) {
    config.*member = std::string(value);
  };
}

StringSetter SetPath(fs::path ReleaseConfig::*member) {
  return [member](ReleaseConfig& config, std::string_view value) {
    config.*member = fs::path(std::string(value));
  };
}

const std::map<std::string_view, StringSetter>& ValueFlags() {
  static const std::map<std::string_view, StringSetter> flags = {
      {"--staging-url", SetString(&ReleaseConfig::staging_url)},
      {"--release-url", SetString(&ReleaseConfig::release_url)},
      {"--working-dir", SetPath(&ReleaseConfig::working_dir)},
      {"--checkout-dir", SetPath(&ReleaseConfig::checkout_dir)},
      {"--staging-checkout-dir", SetPath(&ReleaseConfig::staging_checkout_dir)},
      {"--release-checkout-dir", SetPath(&ReleaseConfig::release_checkout_dir)},
      {"--release-notes", SetPath(&ReleaseConfig::release_notes)},
      {"--site-dir", SetPath(&ReleaseConfig::site_dir)},
      {"--site-archive", SetPath(&ReleaseConfig::site_archive)},
      {"--artifact-id", SetString(&ReleaseConfig::artifact_id)},
      {"--version", SetString(&ReleaseConfig::version)},
      {"--site-url", SetString(&ReleaseConfig::site_url)},
      {"--username", SetString(&ReleaseConfig::username)},
      {"--password", SetString(&ReleaseConfig::password)},
  };
  return flags;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "diststage 0.1.0\n";
  return kExitSuccess;
}

int ReportResult(ReleaseGoal goal, const workflow::WorkflowResult& result) {
  switch (result.outcome) {
  case workflow::WorkflowOutcome::kSkipped:
    std::cout << "skipped " << workflow::ToString(goal) << ": " << result.message << '\n';
    break;
  case workflow::WorkflowOutcome::kCompleted:
    if (!result.revision.empty()) {
      std::cout << "committed revision " << result.revision << '\n';
    } else if (!result.output_path.empty()) {
      std::cout << "site archive: " << result.output_path.string() << '\n';
    } else {
      std::cout << workflow::ToString(goal) << ": done\n";
    }
    break;
  case workflow::WorkflowOutcome::kFailed:
    std::cerr << "error: " << result.message << '\n';
    break;
  }
  return core::errors::ToInt(workflow::ExitCodeFor(result));
}

int CommandGoal(ReleaseGoal goal, const std::vector<std::string_view>& args) {
  ReleaseConfig config;
  std::string error;
  switch (ParseReleaseOptions(args, config, error)) {
  case ParseStatus::kOk:
    break;
  case ParseStatus::kUsage:
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  case ParseStatus::kConfig:
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  core::logging::Logger logger(config.log_level);
  logger.SetGoal(workflow::ToString(goal));
  logger.RedactSecret(config.password);

  workflow::WorkflowResult result;
  switch (goal) {
  case ReleaseGoal::kStage: {
    vcs::SvnExeBackend backend(logger);
    result = workflow::RunStageWorkflow(config, backend, logger);
    break;
  }
  case ReleaseGoal::kPromote: {
    vcs::SvnExeBackend backend(logger);
    result = workflow::RunPromoteWorkflow(config, backend, logger);
    break;
  }
  case ReleaseGoal::kCompressSite:
    result = workflow::RunSiteCompressionWorkflow(config, logger);
    break;
  }
  return ReportResult(goal, result);
}

} // namespace

ParseStatus ParseReleaseOptions(const std::vector<std::string_view>& args, ReleaseConfig& config,
                                std::string& error) {
  // The config file is the base layer, so it is applied before any other flag
  // regardless of where it appears.
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] != "--config") {
      continue;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for --config";
      return ParseStatus::kUsage;
    }
    if (!workflow::LoadReleaseConfigFile(fs::path(std::string(args[i + 1])), config, error)) {
      return ParseStatus::kConfig;
    }
    ++i;
  }

  const auto& value_flags = ValueFlags();
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--config") {
      ++i;
      continue;
    }
    if (token == "--dist-module") {
      config.is_dist_module = true;
      continue;
    }
    if (token == "--no-dist-module") {
      config.is_dist_module = false;
      continue;
    }
    if (token == "--dry-run") {
      config.dry_run = true;
      continue;
    }
    if (token == "--no-dry-run") {
      config.dry_run = false;
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return ParseStatus::kUsage;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return ParseStatus::kUsage;
      }
      config.log_level = parsed;
      ++i;
      continue;
    }

    const auto it = value_flags.find(token);
    if (it != value_flags.end()) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return ParseStatus::kUsage;
      }
      it->second(config, args[i + 1]);
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
    } else {
      error = "unexpected argument: " + std::string(token);
    }
    return ParseStatus::kUsage;
  }

  return ParseStatus::kOk;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "stage") {
    return CommandGoal(ReleaseGoal::kStage, args);
  }

  if (command == "compress-site") {
    return CommandGoal(ReleaseGoal::kCompressSite, args);
  }

  if (command == "promote") {
    return CommandGoal(ReleaseGoal::kPromote, args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace diststage::cli
