#pragma once

#include "core/logging/logger.hpp"
#include "vcs/vcs_backend.hpp"
#include "workflow/release_config.hpp"
#include "workflow/workflow_result.hpp"

namespace diststage::workflow {

// `diststage promote`: checks out both the staging and the release
// distribution areas into their own working copies. No files move between
// them yet; the two checkouts are the groundwork for promotion.
//
// Skips when the module is not a distribution module or the staging URL is
// empty. A missing working directory is created rather than skipped.
WorkflowResult RunPromoteWorkflow(const ReleaseConfig& config, vcs::IVcsBackend& backend,
                                  core::logging::Logger& logger);

} // namespace diststage::workflow
