#ifndef DISTSTAGE_CORE_FS_UTILS_HPP_
#define DISTSTAGE_CORE_FS_UTILS_HPP_

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace diststage::core {

// Creates the parent directory of `path` (with its parents). A bare file name
// has no parent to create.
inline bool EnsureParentDirectory(const std::filesystem::path& path, std::string& error) {
  if (path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent = path.parent_path();
  if (parent.empty()) {
    return true;
  }

  std::error_code ec;
  if (std::filesystem::is_directory(parent, ec)) {
    return true;
  }
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    error = "failed to create directory '" + parent.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Reads a whole file in binary mode. Files above `max_bytes` are refused so a
// mistyped --config path pointing at an artifact does not load gigabytes.
inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error,
                         std::uintmax_t max_bytes = std::uintmax_t{64} * 1024U * 1024U) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    error = "file not found: '" + path.string() + "'";
    return false;
  }
  const std::uintmax_t size = std::filesystem::file_size(path, ec);
  if (ec) {
    error = "unable to stat file '" + path.string() + "': " + ec.message();
    return false;
  }
  if (size > max_bytes) {
    error = "file '" + path.string() + "' is larger than " + std::to_string(max_bytes) + " bytes";
    return false;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read file '" + path.string() + "'";
    return false;
  }
  contents.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    error = "failed while reading file '" + path.string() + "'";
    return false;
  }
  return true;
}

// Writes `text` next to `path` under a hidden partial name and renames it
// over `path`, so a generated page in a checkout is never half-written.
inline bool WriteTextFileAtomic(const std::filesystem::path& path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(path, error)) {
    return false;
  }

  static std::atomic<std::uint64_t> sequence{0};
  const std::filesystem::path partial =
      path.parent_path() / ("." + path.filename().string() + ".partial-" +
                            std::to_string(sequence.fetch_add(1U, std::memory_order_relaxed)));

  std::ofstream out(partial, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "failed to open '" + partial.string() + "' for writing";
    return false;
  }
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.close();

  std::error_code ec;
  if (!out) {
    std::filesystem::remove(partial, ec);
    error = "failed while writing '" + partial.string() + "'";
    return false;
  }

  std::filesystem::rename(partial, path, ec);
  if (ec) {
    const std::string cause = ec.message();
    std::filesystem::remove(partial, ec);
    error = "failed to move '" + partial.string() + "' to '" + path.string() + "': " + cause;
    return false;
  }
  return true;
}

} // namespace diststage::core

#endif // DISTSTAGE_CORE_FS_UTILS_HPP_
