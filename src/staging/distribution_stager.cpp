#include "staging/distribution_stager.hpp"

#include "core/fs_utils.hpp"
#include "staging/artifact_classifier.hpp"
#include "staging/doc_templates.hpp"
#include "staging/path_ops.hpp"

#include <algorithm>
#include <initializer_list>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace diststage::staging {

using core::errors::FailureKind;

const char* ToString(StagerState state) {
  switch (state) {
  case StagerState::kInit:
    return "init";
  case StagerState::kDirectoriesPrepared:
    return "directories_prepared";
  case StagerState::kClassifiedAndCopied:
    return "classified_and_copied";
  case StagerState::kDocsGenerated:
    return "docs_generated";
  case StagerState::kPlanFinalized:
    return "plan_finalized";
  case StagerState::kFailed:
    return "failed";
  }
  return "failed";
}

DistributionStager::DistributionStager(StagerInputs inputs, core::logging::Logger& logger)
    : inputs_(std::move(inputs)), logger_(logger) {
  layout_.checkout_root = inputs_.checkout_dir;
}

bool DistributionStager::Run(StagingPlan& plan, std::string& error) {
  if (state_ != StagerState::kInit) {
    error = std::string("stager already ran (state=") + ToString(state_) + ")";
    return false;
  }

  plan = StagingPlan{};
  if (!PrepareDirectories(error) || !ClassifyAndCopy(plan, error) || !GenerateDocs(plan, error)) {
    logger_.Error("staging failed", {{"error", error}});
    return false;
  }
  FinalizePlan(plan);

  logger_.Info("staging plan finalized",
               {{"checkout_dir", layout_.checkout_root.string()},
                {"copies", std::to_string(plan.copies.size())},
                {"files_to_commit", std::to_string(plan.files_to_commit.size())}});
  return true;
}

bool DistributionStager::PrepareDirectories(std::string& error) {
  if (!ResetDirectory(layout_.BinariesDir(), error) ||
      !ResetDirectory(layout_.SourceDir(), error)) {
    return Fail(FailureKind::kIo);
  }
  state_ = StagerState::kDirectoriesPrepared;
  logger_.Debug("staging directories reset",
                {{"source_dir", layout_.SourceDir().string()},
                 {"binaries_dir", layout_.BinariesDir().string()}});
  return true;
}

bool DistributionStager::ClassifyAndCopy(StagingPlan& plan, std::string& error) {
  std::vector<fs::path> listed;
  if (!ListTopLevelFiles(inputs_.working_dir, listed, error)) {
    return Fail(FailureKind::kIo);
  }

  for (const ArtifactFile& artifact : ClassifyArtifacts(listed)) {
    const fs::path name = artifact.path.filename();
    fs::path destination;
    switch (artifact.bucket) {
    case ArtifactBucket::kSource:
      destination = layout_.SourceDir() / name;
      break;
    case ArtifactBucket::kBinary:
      destination = layout_.BinariesDir() / name;
      break;
    case ArtifactBucket::kRoot:
      destination = layout_.checkout_root / name;
      break;
    case ArtifactBucket::kMetadataExcluded:
      logger_.Debug("skipping bookkeeping file", {{"file", artifact.path.string()}});
      continue;
    }

    if (!Copy(artifact.path, destination, plan, error)) {
      return false;
    }
    classified_copies_.push_back(destination);
    logger_.Debug("artifact staged",
                  {{"file", name.string()},
                   {"bucket", ToString(artifact.bucket)},
                   {"destination", destination.string()}});
  }

  if (!CopySiteArchive(plan, listed, error)) {
    return false;
  }

  logger_.Info("copying release notes", {{"release_notes", inputs_.release_notes.string()}});
  release_notes_copy_ = layout_.checkout_root / inputs_.release_notes.filename();
  if (!Copy(inputs_.release_notes, release_notes_copy_, plan, error)) {
    return false;
  }

  state_ = StagerState::kClassifiedAndCopied;
  return true;
}

bool DistributionStager::CopySiteArchive(StagingPlan& plan, const std::vector<fs::path>& listed,
                                         std::string& error) {
  if (inputs_.site_archive.empty()) {
    return true;
  }

  std::error_code ec;
  if (!fs::is_regular_file(inputs_.site_archive, ec) || ec) {
    error = "site archive not found: " + inputs_.site_archive.string() +
            " (run compress-site before staging)";
    return Fail(FailureKind::kArchive);
  }

  // Already staged as a root artifact when it was built into the working directory.
  const fs::path archive = fs::weakly_canonical(inputs_.site_archive, ec);
  const bool already_listed =
      !ec && std::any_of(listed.begin(), listed.end(), [&archive](const fs::path& path) {
        std::error_code path_ec;
        return fs::weakly_canonical(path, path_ec) == archive && !path_ec;
      });
  if (already_listed) {
    return true;
  }

  const fs::path destination = layout_.checkout_root / inputs_.site_archive.filename();
  if (!Copy(inputs_.site_archive, destination, plan, error)) {
    return false;
  }
  site_copies_.push_back(destination);
  return true;
}

bool DistributionStager::GenerateDocs(StagingPlan& plan, std::string& error) {
  const TemplateVariables readme_variables = {
      {"artifactId", inputs_.artifact_id},
      {"version", inputs_.version},
      {"siteUrl", inputs_.site_url},
  };

  std::vector<fs::path> root_pages;
  for (const DocumentId id : {DocumentId::kHeader, DocumentId::kReadme}) {
    std::string text;
    const TemplateVariables& variables =
        id == DocumentId::kReadme ? readme_variables : TemplateVariables{};
    const fs::path page = layout_.checkout_root / std::string(DocumentFileName(id));
    if (!RenderDocument(id, variables, text, error)) {
      error = "could not build " + page.filename().string() + ": " + error;
      return Fail(FailureKind::kIo);
    }
    if (!core::WriteTextFileAtomic(page, text, error)) {
      error = "could not build " + page.filename().string() + ": " + error;
      return Fail(FailureKind::kIo);
    }
    root_pages.push_back(page);
    generated_docs_.push_back(page);
  }

  // Plain copies instead of symlinks: the distribution repository does not
  // keep links.
  for (const fs::path& subdir : {layout_.SourceDir(), layout_.BinariesDir()}) {
    for (const fs::path& page : root_pages) {
      const fs::path copy = subdir / page.filename();
      if (!Copy(page, copy, plan, error)) {
        return false;
      }
      generated_docs_.push_back(copy);
    }
  }

  state_ = StagerState::kDocsGenerated;
  logger_.Debug("distribution pages generated",
                {{"count", std::to_string(generated_docs_.size())}});
  return true;
}

void DistributionStager::FinalizePlan(StagingPlan& plan) {
  plan.files_to_commit.RegisterMany(classified_copies_);
  plan.files_to_commit.RegisterMany(site_copies_);
  plan.files_to_commit.RegisterMany(generated_docs_);
  plan.files_to_commit.Register(release_notes_copy_);
  state_ = StagerState::kPlanFinalized;
}

bool DistributionStager::Copy(const fs::path& from, const fs::path& to, StagingPlan& plan,
                              std::string& error) {
  if (!CopyFile(from, to, error)) {
    return Fail(FailureKind::kIo);
  }
  plan.copies.push_back(CopyStep{from, to});
  return true;
}

bool DistributionStager::Fail(FailureKind kind) {
  state_ = StagerState::kFailed;
  failure_kind_ = kind;
  return false;
}

} // namespace diststage::staging
