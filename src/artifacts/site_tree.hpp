#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace diststage::artifacts {

// Single-pass, depth-first walk over a generated site directory.
//
// Every file and directory below `root` is yielded once, a directory always
// before its children. Order among siblings is whatever the filesystem
// reports; callers must not assume lexical order. A cursor is not restartable:
// construct a new one to walk the tree again (and observe any changes made
// since the previous walk).
class SiteTreeCursor {
public:
  explicit SiteTreeCursor(std::filesystem::path root);

  SiteTreeCursor(const SiteTreeCursor&) = delete;
  SiteTreeCursor& operator=(const SiteTreeCursor&) = delete;

  // Advances the walk.
  // - returns true and sets `entry` when an entry is available
  // - returns false with empty `error` when the walk is exhausted
  // - returns false with `error` set when the root is missing or the
  //   filesystem cannot be read
  bool Next(std::filesystem::path& entry, std::string& error);

  const std::filesystem::path& root() const {
    return root_;
  }

private:
  bool Open(std::string& error);

  std::filesystem::path root_;
  std::filesystem::recursive_directory_iterator it_;
  bool opened_ = false;
  bool exhausted_ = false;
};

// Drains a fresh cursor into `entries`.
bool EnumerateSiteTree(const std::filesystem::path& root,
                       std::vector<std::filesystem::path>& entries,
                       std::string& error);

} // namespace diststage::artifacts
