#ifndef DISTSTAGE_STAGING_ARTIFACT_CLASSIFIER_HPP_
#define DISTSTAGE_STAGING_ARTIFACT_CLASSIFIER_HPP_

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace diststage::staging {

// Destination of one build-output file inside the staging checkout.
enum class ArtifactBucket {
  kSource,           // -> <checkout>/source
  kBinary,           // -> <checkout>/binaries
  kMetadataExcluded, // bookkeeping, never staged
  kRoot,             // -> <checkout>
};

const char* ToString(ArtifactBucket bucket);

struct ArtifactFile {
  std::filesystem::path path;
  ArtifactBucket bucket = ArtifactBucket::kRoot;
};

// Name-based bucket assignment, first match wins:
//   1. contains "src"                                         -> kSource
//   2. contains "bin"                                         -> kBinary
//   3. contains "scm", "sha1.properties", "sha256.properties" -> kMetadataExcluded
//   4. anything else                                          -> kRoot
//
// Matching is a plain substring test on the file name, so a name such as
// "foo-src-sha1.properties" lands in kSource. Directories must be filtered out
// by the caller.
ArtifactBucket ClassifyArtifactName(std::string_view file_name);

// Classifies every path by its filename component, preserving input order.
std::vector<ArtifactFile> ClassifyArtifacts(const std::vector<std::filesystem::path>& files);

// Lists the regular files directly inside `dir`, sorted by path.
// Subdirectories (including the checkout itself when it lives inside `dir`)
// are skipped.
bool ListTopLevelFiles(const std::filesystem::path& dir,
                       std::vector<std::filesystem::path>& files,
                       std::string& error);

} // namespace diststage::staging

#endif // DISTSTAGE_STAGING_ARTIFACT_CLASSIFIER_HPP_
