#include "workflow/stage_workflow.hpp"

#include "staging/distribution_stager.hpp"
#include "staging/path_ops.hpp"
#include "staging/staging_plan.hpp"

#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace diststage::workflow {

namespace {

using core::errors::FailureKind;

WorkflowResult FailStage(core::logging::Logger& logger, FailureKind kind, std::string_view msg,
                         const std::string& detail) {
  logger.Error(msg, {{"failure", core::errors::ToString(kind)}, {"error", detail}});
  return WorkflowResult::Failed(kind, detail);
}

} // namespace

std::string BuildStagingCommitMessage(const std::string& artifact_id, const std::string& version) {
  return "Staging release: " + artifact_id + ", version: " + version;
}

WorkflowResult RunStageWorkflow(const ReleaseConfig& config, vcs::IVcsBackend& backend,
                                core::logging::Logger& logger) {
  if (!config.is_dist_module) {
    logger.Info("module is not a distribution module, skipping staging");
    return WorkflowResult::Skipped("not a distribution module");
  }
  if (config.staging_url.empty()) {
    logger.Warn("staging URL is not set, skipping staging");
    return WorkflowResult::Skipped("staging URL is not set");
  }
  std::error_code ec;
  if (!fs::is_directory(config.working_dir, ec)) {
    logger.Info("working directory contains no distributions, skipping staging",
                {{"working_dir", config.working_dir.string()}});
    return WorkflowResult::Skipped("working directory does not exist: " +
                                   config.working_dir.string());
  }

  std::string error;
  if (!ValidateReleaseConfig(config, ReleaseGoal::kStage, error)) {
    return FailStage(logger, FailureKind::kConfig, "invalid stage configuration", error);
  }

  logger.Info("preparing to stage distributions",
              {{"staging_url", config.staging_url},
               {"artifact_id", config.artifact_id},
               {"version", config.version},
               {"dry_run", config.dry_run ? "true" : "false"}});

  vcs::ScmRepository repository;
  if (!vcs::BuildScmRepository(config.staging_url, repository, error)) {
    return FailStage(logger, FailureKind::kConfig, "invalid staging URL", error);
  }
  if (repository.provider != backend.Provider()) {
    return FailStage(logger, FailureKind::kConfig, "unsupported scm provider",
                     "no backend for provider '" + repository.provider + "'");
  }
  vcs::InjectCredentials(repository, config.username, config.password);

  const fs::path checkout_dir = config.CheckoutDir();
  if (!staging::EnsureDirectory(checkout_dir, error)) {
    return FailStage(logger, FailureKind::kIo, "could not prepare checkout directory", error);
  }

  vcs::WorkingCopy working_copy;
  if (!backend.Checkout(repository, checkout_dir, working_copy, error)) {
    return FailStage(logger, FailureKind::kVcs, "checkout failed", error);
  }

  staging::StagerInputs inputs;
  inputs.working_dir = config.working_dir;
  inputs.checkout_dir = checkout_dir;
  inputs.release_notes = config.release_notes;
  inputs.site_archive = config.site_archive;
  inputs.artifact_id = config.artifact_id;
  inputs.version = config.version;
  inputs.site_url = config.site_url;

  staging::DistributionStager stager(inputs, logger);
  staging::StagingPlan plan;
  if (!stager.Run(plan, error)) {
    return WorkflowResult::Failed(stager.failure_kind(), error);
  }

  const std::string message = BuildStagingCommitMessage(config.artifact_id, config.version);
  const std::vector<fs::path>& files = plan.files_to_commit.Paths();

  if (config.dry_run) {
    logger.Info("dry run: would have committed",
                {{"staging_url", config.staging_url},
                 {"artifact_id", config.artifact_id},
                 {"version", config.version},
                 {"message", message},
                 {"files", std::to_string(files.size())}});
    return WorkflowResult::Completed();
  }

  logger.Info(message, {{"files", std::to_string(files.size())}});
  const vcs::VcsResult add_result = backend.Add(working_copy, files, message);
  if (!add_result.success) {
    return FailStage(logger, FailureKind::kVcs, "adding dist files failed",
                     add_result.command_output);
  }

  const vcs::VcsResult commit_result = backend.Commit(working_copy, files, message);
  if (!commit_result.success) {
    return FailStage(logger, FailureKind::kVcs, "committing dist files failed",
                     commit_result.command_output);
  }

  logger.Info("Committed revision " + commit_result.revision,
              {{"staging_url", config.staging_url}});
  WorkflowResult result = WorkflowResult::Completed();
  result.revision = commit_result.revision;
  return result;
}

} // namespace diststage::workflow
