#pragma once

#include "core/logging/logger.hpp"
#include "workflow/release_config.hpp"
#include "workflow/workflow_result.hpp"

namespace diststage::workflow {

// `diststage compress-site`: zips the generated site directory into
// `<working_dir>/site.zip`, which stage then picks up as a root artifact.
// The site directory must already exist.
WorkflowResult RunSiteCompressionWorkflow(const ReleaseConfig& config,
                                          core::logging::Logger& logger);

} // namespace diststage::workflow
