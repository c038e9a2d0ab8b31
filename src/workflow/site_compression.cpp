#include "workflow/site_compression.hpp"

#include "artifacts/site_tree.hpp"
#include "artifacts/site_zip_writer.hpp"
#include "staging/path_ops.hpp"

#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace diststage::workflow {

using core::errors::FailureKind;

WorkflowResult RunSiteCompressionWorkflow(const ReleaseConfig& config,
                                          core::logging::Logger& logger) {
  std::string error;
  if (!ValidateReleaseConfig(config, ReleaseGoal::kCompressSite, error)) {
    logger.Error("invalid compress-site configuration", {{"error", error}});
    return WorkflowResult::Failed(FailureKind::kConfig, error);
  }

  std::error_code ec;
  if (!fs::is_directory(config.site_dir, ec)) {
    error = "site directory not found: " + config.site_dir.string() +
            " (run the site build before compressing the site)";
    logger.Error("site build was not run before compress-site",
                 {{"site_dir", config.site_dir.string()}});
    return WorkflowResult::Failed(FailureKind::kArchive, error);
  }

  if (!staging::EnsureDirectory(config.working_dir, error)) {
    logger.Error("could not create working directory", {{"error", error}});
    return WorkflowResult::Failed(FailureKind::kIo, error);
  }

  std::vector<fs::path> entries;
  if (!artifacts::EnumerateSiteTree(config.site_dir, entries, error)) {
    logger.Error("could not enumerate site directory", {{"error", error}});
    return WorkflowResult::Failed(FailureKind::kArchive, error);
  }

  artifacts::SiteZipSummary summary;
  const fs::path output = config.SiteZipPath();
  if (!artifacts::WriteSiteZip(config.site_dir, output, entries, summary, error)) {
    logger.Error("failed to create site archive", {{"output", output.string()}, {"error", error}});
    return WorkflowResult::Failed(FailureKind::kArchive, error);
  }

  logger.Info("site archive written",
              {{"output", summary.written_path.string()},
               {"files", std::to_string(summary.file_count)},
               {"payload_bytes", std::to_string(summary.payload_bytes)}});

  WorkflowResult result = WorkflowResult::Completed();
  result.output_path = summary.written_path;
  return result;
}

} // namespace diststage::workflow
