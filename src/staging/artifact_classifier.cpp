#include "staging/artifact_classifier.hpp"

#include <algorithm>
#include <array>
#include <system_error>

namespace fs = std::filesystem;

namespace diststage::staging {

namespace {

constexpr std::string_view kSourceMarker = "src";
constexpr std::string_view kBinaryMarker = "bin";
constexpr std::array<std::string_view, 3> kExcludedMarkers = {
    "scm",
    "sha1.properties",
    "sha256.properties",
};

bool Contains(std::string_view text, std::string_view needle) {
  return text.find(needle) != std::string_view::npos;
}

} // namespace

const char* ToString(ArtifactBucket bucket) {
  switch (bucket) {
  case ArtifactBucket::kSource:
    return "source";
  case ArtifactBucket::kBinary:
    return "binary";
  case ArtifactBucket::kMetadataExcluded:
    return "excluded";
  case ArtifactBucket::kRoot:
    return "root";
  }
  return "root";
}

ArtifactBucket ClassifyArtifactName(std::string_view file_name) {
  if (Contains(file_name, kSourceMarker)) {
    return ArtifactBucket::kSource;
  }
  if (Contains(file_name, kBinaryMarker)) {
    return ArtifactBucket::kBinary;
  }
  for (const std::string_view marker : kExcludedMarkers) {
    if (Contains(file_name, marker)) {
      return ArtifactBucket::kMetadataExcluded;
    }
  }
  return ArtifactBucket::kRoot;
}

std::vector<ArtifactFile> ClassifyArtifacts(const std::vector<fs::path>& files) {
  std::vector<ArtifactFile> classified;
  classified.reserve(files.size());
  for (const fs::path& path : files) {
    ArtifactFile artifact;
    artifact.path = path;
    artifact.bucket = ClassifyArtifactName(path.filename().string());
    classified.push_back(std::move(artifact));
  }
  return classified;
}

bool ListTopLevelFiles(const fs::path& dir, std::vector<fs::path>& files, std::string& error) {
  files.clear();

  std::error_code ec;
  if (!fs::is_directory(dir, ec) || ec) {
    error = "build output directory not found: " + dir.string();
    return false;
  }

  fs::directory_iterator it(dir, ec);
  if (ec) {
    error = "failed to list build output directory " + dir.string() + ": " + ec.message();
    return false;
  }
  const fs::directory_iterator end{};
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && !type_ec) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    error = "failed while listing build output directory " + dir.string() + ": " + ec.message();
    return false;
  }

  std::sort(files.begin(), files.end());
  return true;
}

} // namespace diststage::staging
