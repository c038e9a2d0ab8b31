#include "staging/path_ops.hpp"

#include "core/fs_utils.hpp"

#include <cstdint>
#include <system_error>

namespace fs = std::filesystem;

namespace diststage::staging {

bool ResetDirectory(const fs::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }

  std::error_code ec;
  const bool existed = fs::exists(dir, ec);
  if (ec) {
    error = "unable to inspect directory " + dir.string() + ": " + ec.message();
    return false;
  }

  if (existed) {
    const auto removed = fs::remove_all(dir, ec);
    if (ec || removed == static_cast<std::uintmax_t>(-1)) {
      error = "unable to remove directory " + dir.string() + ": " +
              (ec ? ec.message() : std::string("remove_all reported no result"));
      return false;
    }
    // remove_all can report success on filesystems that silently keep the
    // entry (or when another process recreates it); treat that as a failure.
    if (fs::exists(dir, ec) || ec) {
      error = "unable to remove directory " + dir.string() + ": directory still present";
      return false;
    }
  }

  return EnsureDirectory(dir, error);
}

bool EnsureDirectory(const fs::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }

  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    error = "unable to create directory " + dir.string() + ": " + ec.message();
    return false;
  }
  if (!fs::is_directory(dir, ec) || ec) {
    error = "unable to create directory " + dir.string() + ": path is not a directory";
    return false;
  }
  return true;
}

bool CopyFile(const fs::path& from, const fs::path& to, std::string& error) {
  std::string cause;
  if (!core::EnsureParentDirectory(to, cause)) {
    error = "unable to copy file " + from.string() + " to " + to.string() + ": " + cause;
    return false;
  }

  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    error = "unable to copy file " + from.string() + " to " + to.string() + ": " + ec.message();
    return false;
  }
  return true;
}

} // namespace diststage::staging
