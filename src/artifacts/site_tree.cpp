#include "artifacts/site_tree.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace diststage::artifacts {

SiteTreeCursor::SiteTreeCursor(fs::path root) : root_(std::move(root)) {}

bool SiteTreeCursor::Open(std::string& error) {
  opened_ = true;

  std::error_code ec;
  if (!fs::is_directory(root_, ec) || ec) {
    exhausted_ = true;
    error = "site directory not found: " + root_.string() +
            " (run the site build before compressing the site)";
    return false;
  }

  it_ = fs::recursive_directory_iterator(root_, fs::directory_options::none, ec);
  if (ec) {
    exhausted_ = true;
    error = "failed to open site directory " + root_.string() + ": " + ec.message();
    return false;
  }
  return true;
}

bool SiteTreeCursor::Next(fs::path& entry, std::string& error) {
  error.clear();
  if (exhausted_) {
    return false;
  }

  if (!opened_) {
    if (!Open(error)) {
      return false;
    }
  } else {
    std::error_code ec;
    it_.increment(ec);
    if (ec) {
      exhausted_ = true;
      error = "failed while walking site directory " + root_.string() + ": " + ec.message();
      return false;
    }
  }

  if (it_ == fs::recursive_directory_iterator()) {
    exhausted_ = true;
    return false;
  }

  entry = it_->path();
  return true;
}

bool EnumerateSiteTree(const fs::path& root, std::vector<fs::path>& entries, std::string& error) {
  entries.clear();

  SiteTreeCursor cursor(root);
  fs::path entry;
  while (cursor.Next(entry, error)) {
    entries.push_back(entry);
  }
  return error.empty();
}

} // namespace diststage::artifacts
