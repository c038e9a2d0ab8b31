#pragma once

#include <filesystem>
#include <string>

namespace diststage::staging {

// Directory lifecycle helpers used by every goal.
//
// Contract:
// - Returns true on success.
// - Returns false on failure and populates `error` with the offending path(s)
//   and the underlying cause.

// Deletes `dir` recursively when it exists, then creates it (with parents).
// Calling it twice in a row is not an error; both calls leave an existing,
// empty directory behind.
bool ResetDirectory(const std::filesystem::path& dir, std::string& error);

// Creates `dir` (with parents) when absent. Never deletes content.
bool EnsureDirectory(const std::filesystem::path& dir, std::string& error);

// Byte-for-byte copy. Parent directories of `to` are created and an existing
// `to` is overwritten unconditionally.
bool CopyFile(const std::filesystem::path& from, const std::filesystem::path& to,
              std::string& error);

} // namespace diststage::staging
