#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace diststage::artifacts {

struct SiteZipSummary {
  std::filesystem::path written_path;
  std::size_t file_count = 0;
  std::uint64_t payload_bytes = 0;
};

// Writes the site archive consumed by the staging goal as an ordinary root
// artifact.
//
// Contract:
// - `site_root` must exist; a missing root means the site build did not run.
// - Only non-directory members of `entries` are written, in `entries` order.
// - Each archive name is the entry path relative to `site_root`, with '/'
//   separators and no leading component, so extracting recreates the
//   contents of `site_root` in place.
// - Entries outside `site_root` are rejected; repeated entries are written once;
//   `output_file` itself is never archived.
// - Members are stored uncompressed (zip32 limits apply).
// - Returns true on success and populates `summary`.
// - Returns false on failure and populates `error`.
bool WriteSiteZip(const std::filesystem::path& site_root,
                  const std::filesystem::path& output_file,
                  const std::vector<std::filesystem::path>& entries,
                  SiteZipSummary& summary,
                  std::string& error);

// Reads the central directory of a zip written by WriteSiteZip (or any
// single-disk zip32 archive) and returns member names in archive order.
bool ListZipEntries(const std::filesystem::path& zip_path,
                    std::vector<std::string>& names,
                    std::string& error);

} // namespace diststage::artifacts
