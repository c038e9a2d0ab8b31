#pragma once

#include "core/logging/logger.hpp"
#include "vcs/vcs_backend.hpp"
#include "workflow/release_config.hpp"
#include "workflow/workflow_result.hpp"

#include <string>

namespace diststage::workflow {

// "Staging release: <artifactId>, version: <version>"
std::string BuildStagingCommitMessage(const std::string& artifact_id, const std::string& version);

// `diststage stage`: checks out the staging distribution area, stages the
// working directory's artifacts into it and commits them.
//
// Skips (exit 0, nothing touched, no VCS calls) when the module is not a
// distribution module, the staging URL is empty, or the working directory
// does not exist. With `dry_run` the checkout and staging still happen but
// nothing is added or committed.
WorkflowResult RunStageWorkflow(const ReleaseConfig& config, vcs::IVcsBackend& backend,
                                core::logging::Logger& logger);

} // namespace diststage::workflow
