#pragma once

#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "staging/staging_plan.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace diststage::staging {

// Run phases, in order. A failed transition parks the stager in kFailed; the
// caller starts a new run (with a new stager) after fixing the cause.
enum class StagerState {
  kInit,
  kDirectoriesPrepared,
  kClassifiedAndCopied,
  kDocsGenerated,
  kPlanFinalized,
  kFailed,
};

const char* ToString(StagerState state);

// Fixed directory convention inside a distribution checkout.
struct StagingLayout {
  std::filesystem::path checkout_root;

  std::filesystem::path SourceDir() const {
    return checkout_root / "source";
  }
  std::filesystem::path BinariesDir() const {
    return checkout_root / "binaries";
  }
};

struct StagerInputs {
  // Build-output directory whose top-level files are classified.
  std::filesystem::path working_dir;
  std::filesystem::path checkout_dir;
  std::filesystem::path release_notes;
  // Optional pre-built site archive living outside `working_dir`.
  std::filesystem::path site_archive;
  std::string artifact_id;
  std::string version;
  std::string site_url;
};

// Builds the staged distribution tree inside an existing checkout:
//
//   <checkout>/HEADER.html README.html RELEASE-NOTES.txt <root artifacts>
//   <checkout>/source/<*src* artifacts> HEADER.html README.html
//   <checkout>/binaries/<*bin* artifacts> HEADER.html README.html
//
// `source/` and `binaries/` are deleted and recreated on every run so a
// previous partial run never leaks stale artifacts into a commit. The
// resulting plan lists the files to commit in this order: classified
// artifacts, site archive, generated pages, release notes.
class DistributionStager {
public:
  DistributionStager(StagerInputs inputs, core::logging::Logger& logger);

  DistributionStager(const DistributionStager&) = delete;
  DistributionStager& operator=(const DistributionStager&) = delete;

  // Runs every transition from kInit. Valid once per stager.
  bool Run(StagingPlan& plan, std::string& error);

  StagerState state() const {
    return state_;
  }
  core::errors::FailureKind failure_kind() const {
    return failure_kind_;
  }
  const StagingLayout& layout() const {
    return layout_;
  }

private:
  bool PrepareDirectories(std::string& error);
  bool ClassifyAndCopy(StagingPlan& plan, std::string& error);
  bool CopySiteArchive(StagingPlan& plan, const std::vector<std::filesystem::path>& listed,
                       std::string& error);
  bool GenerateDocs(StagingPlan& plan, std::string& error);
  void FinalizePlan(StagingPlan& plan);

  bool Copy(const std::filesystem::path& from, const std::filesystem::path& to, StagingPlan& plan,
            std::string& error);
  bool Fail(core::errors::FailureKind kind);

  StagerInputs inputs_;
  StagingLayout layout_;
  core::logging::Logger& logger_;
  StagerState state_ = StagerState::kInit;
  core::errors::FailureKind failure_kind_ = core::errors::FailureKind::kNone;

  std::vector<std::filesystem::path> classified_copies_;
  std::vector<std::filesystem::path> site_copies_;
  std::vector<std::filesystem::path> generated_docs_;
  std::filesystem::path release_notes_copy_;
};

} // namespace diststage::staging
