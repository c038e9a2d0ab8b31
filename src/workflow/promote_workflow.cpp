#include "workflow/promote_workflow.hpp"

#include "staging/path_ops.hpp"

#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace diststage::workflow {

namespace {

using core::errors::FailureKind;

WorkflowResult FailPromote(core::logging::Logger& logger, FailureKind kind, std::string_view msg,
                           const std::string& detail) {
  logger.Error(msg, {{"failure", core::errors::ToString(kind)}, {"error", detail}});
  return WorkflowResult::Failed(kind, detail);
}

// One repository/backend/checkout triple. `label` names the side in logs.
bool CheckoutSide(std::string_view label, const std::string& url, const fs::path& directory,
                  const ReleaseConfig& config, vcs::IVcsBackend& backend,
                  core::logging::Logger& logger, vcs::WorkingCopy& working_copy,
                  WorkflowResult& failure) {
  std::string error;
  vcs::ScmRepository repository;
  if (!vcs::BuildScmRepository(url, repository, error)) {
    failure = FailPromote(logger, FailureKind::kConfig, "invalid distribution URL", error);
    return false;
  }
  if (repository.provider != backend.Provider()) {
    failure = FailPromote(logger, FailureKind::kConfig, "unsupported scm provider",
                          "no backend for provider '" + repository.provider + "'");
    return false;
  }
  vcs::InjectCredentials(repository, config.username, config.password);

  if (!staging::EnsureDirectory(directory, error)) {
    failure = FailPromote(logger, FailureKind::kIo, "could not prepare checkout directory", error);
    return false;
  }

  logger.Info("checking out distribution area",
              {{"side", label}, {"url", repository.url}, {"directory", directory.string()}});
  if (!backend.Checkout(repository, directory, working_copy, error)) {
    failure = FailPromote(logger, FailureKind::kVcs, "checkout failed", error);
    return false;
  }
  return true;
}

} // namespace

WorkflowResult RunPromoteWorkflow(const ReleaseConfig& config, vcs::IVcsBackend& backend,
                                  core::logging::Logger& logger) {
  if (!config.is_dist_module) {
    logger.Info("module is not a distribution module, skipping promotion");
    return WorkflowResult::Skipped("not a distribution module");
  }
  if (config.staging_url.empty()) {
    logger.Warn("staging URL is not set, skipping promotion");
    return WorkflowResult::Skipped("staging URL is not set");
  }

  std::string error;
  if (!ValidateReleaseConfig(config, ReleaseGoal::kPromote, error)) {
    return FailPromote(logger, FailureKind::kConfig, "invalid promote configuration", error);
  }
  if (!staging::EnsureDirectory(config.working_dir, error)) {
    return FailPromote(logger, FailureKind::kIo, "could not create working directory", error);
  }

  logger.Info("preparing to promote distributions from staging to release",
              {{"staging_url", config.staging_url}, {"release_url", config.release_url}});

  WorkflowResult failure;
  vcs::WorkingCopy staging_copy;
  if (!CheckoutSide("staging", config.staging_url, config.StagingCheckoutDir(), config, backend,
                    logger, staging_copy, failure)) {
    return failure;
  }
  vcs::WorkingCopy release_copy;
  if (!CheckoutSide("release", config.release_url, config.ReleaseCheckoutDir(), config, backend,
                    logger, release_copy, failure)) {
    return failure;
  }

  logger.Info("staging and release areas checked out",
              {{"staging_checkout", staging_copy.directory.string()},
               {"release_checkout", release_copy.directory.string()}});
  return WorkflowResult::Completed();
}

} // namespace diststage::workflow
