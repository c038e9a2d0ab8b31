#include "artifacts/site_zip_writer.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <set>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace diststage::artifacts {

namespace {

constexpr std::uint32_t kLocalFileHeaderSignature = 0x04034b50U;
constexpr std::uint32_t kCentralDirectoryHeaderSignature = 0x02014b50U;
constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50U;
constexpr std::uint16_t kZipVersion = 20; // 2.0
constexpr std::uint16_t kVersionMadeByUnix = (3U << 8) | kZipVersion;
constexpr std::uint16_t kCompressionMethodStore = 0;
constexpr std::uint16_t kGeneralPurposeUtf8Names = 1U << 11;
constexpr std::uint16_t kDosTimeMidnight = 0;
constexpr std::uint16_t kDosDate1980Jan01 = (0U << 9) | (1U << 5) | 1U;
constexpr std::uint32_t kUnixRegularFileMode0644 = 0100644U;
constexpr std::size_t kEndOfCentralDirectorySize = 22;
constexpr std::size_t kMaxZipCommentSize = 0xFFFF;

constexpr std::uint32_t kCrc32Init = 0xFFFFFFFFU;
constexpr std::uint32_t kCrc32FinalXor = 0xFFFFFFFFU;

struct MemberEntry {
  fs::path path;
  std::string zip_path;
  std::uint32_t crc32 = 0;
  std::uint32_t size_bytes = 0;
  std::uint32_t local_header_offset = 0;
};

void WriteU16(std::ofstream& out_file, std::uint16_t value) {
  const std::array<char, 2> bytes = {
      static_cast<char>(value & 0xFFU),
      static_cast<char>((value >> 8) & 0xFFU),
  };
  out_file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

void WriteU32(std::ofstream& out_file, std::uint32_t value) {
  const std::array<char, 4> bytes = {
      static_cast<char>(value & 0xFFU),
      static_cast<char>((value >> 8) & 0xFFU),
      static_cast<char>((value >> 16) & 0xFFU),
      static_cast<char>((value >> 24) & 0xFFU),
  };
  out_file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

std::uint16_t ReadU16(const std::string& buffer, std::size_t offset) {
  return static_cast<std::uint16_t>(static_cast<unsigned char>(buffer[offset]) |
                                    (static_cast<unsigned char>(buffer[offset + 1]) << 8));
}

std::uint32_t ReadU32(const std::string& buffer, std::size_t offset) {
  return static_cast<std::uint32_t>(ReadU16(buffer, offset)) |
         (static_cast<std::uint32_t>(ReadU16(buffer, offset + 2)) << 16);
}

const std::array<std::uint32_t, 256>& Crc32Table() {
  static const std::array<std::uint32_t, 256> table = [] {
    std::array<std::uint32_t, 256> generated{};
    for (std::uint32_t i = 0; i < 256U; ++i) {
      std::uint32_t c = i;
      for (int bit = 0; bit < 8; ++bit) {
        c = ((c & 1U) != 0U) ? (0xEDB88320U ^ (c >> 1)) : (c >> 1);
      }
      generated[i] = c;
    }
    return generated;
  }();
  return table;
}

std::uint32_t Crc32Update(std::uint32_t crc, const char* data, std::size_t size) {
  const auto& table = Crc32Table();
  for (std::size_t i = 0; i < size; ++i) {
    const auto byte = static_cast<std::uint8_t>(data[i]);
    crc = table[(crc ^ byte) & 0xFFU] ^ (crc >> 8);
  }
  return crc;
}

// Streams `path` once, either to compute crc/size or to copy it into `sink`.
bool StreamFile(const fs::path& path, std::ofstream* sink, std::uint32_t& crc32,
                std::uint64_t& total_size, std::string& error) {
  std::ifstream in_file(path, std::ios::binary);
  if (!in_file) {
    error = "failed to open site file: " + path.string();
    return false;
  }

  std::uint32_t crc = kCrc32Init;
  total_size = 0;
  std::array<char, 8192> buffer{};
  while (in_file.good()) {
    in_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      continue;
    }
    crc = Crc32Update(crc, buffer.data(), static_cast<std::size_t>(read_count));
    total_size += static_cast<std::uint64_t>(read_count);
    if (sink != nullptr) {
      sink->write(buffer.data(), read_count);
      if (!*sink) {
        error = "failed while writing site archive payload for: " + path.string();
        return false;
      }
    }
  }

  if (!in_file.eof()) {
    error = "failed while reading site file: " + path.string();
    return false;
  }
  crc32 = crc ^ kCrc32FinalXor;
  return true;
}

bool BuildMemberEntries(const fs::path& site_root, const fs::path& output_file,
                        const std::vector<fs::path>& entries, std::vector<MemberEntry>& members,
                        std::string& error) {
  std::error_code ec;
  const fs::path output_canonical = fs::weakly_canonical(output_file, ec);
  if (ec) {
    error = "failed to resolve site archive path: " + output_file.string();
    return false;
  }

  std::set<std::string> seen;
  for (const fs::path& path : entries) {
    if (fs::is_directory(path, ec)) {
      continue;
    }
    if (ec) {
      error = "failed to inspect site entry: " + path.string();
      return false;
    }
    if (fs::weakly_canonical(path, ec) == output_canonical) {
      continue;
    }

    const fs::path relative = fs::relative(path, site_root, ec);
    if (ec || relative.empty()) {
      error = "failed to compute path relative to site root: " + path.string();
      return false;
    }
    if (relative == "." || *relative.begin() == "..") {
      error = "site entry is outside the site root: " + path.string();
      return false;
    }
    std::string zip_path = relative.generic_string();
    if (zip_path.size() > 0xFFFFU) {
      error = "site entry path too long for zip: " + zip_path;
      return false;
    }
    if (!seen.insert(zip_path).second) {
      continue;
    }

    MemberEntry member;
    member.path = path;
    member.zip_path = std::move(zip_path);
    std::uint64_t size = 0;
    if (!StreamFile(member.path, nullptr, member.crc32, size, error)) {
      return false;
    }
    if (size > 0xFFFFFFFFULL) {
      error = "site file too large for zip32 support: " + path.string();
      return false;
    }
    member.size_bytes = static_cast<std::uint32_t>(size);
    members.push_back(std::move(member));
  }

  if (members.size() > 0xFFFFU) {
    error = "too many site files for zip32 support";
    return false;
  }
  return true;
}

bool CheckedOffset(std::ofstream& out_file, std::uint32_t& offset, std::string& error) {
  const std::streamoff position = out_file.tellp();
  if (position < 0 || static_cast<std::uint64_t>(position) > 0xFFFFFFFFULL) {
    error = "site archive exceeds zip32 offset range";
    return false;
  }
  offset = static_cast<std::uint32_t>(position);
  return true;
}

} // namespace

bool WriteSiteZip(const fs::path& site_root, const fs::path& output_file,
                  const std::vector<fs::path>& entries, SiteZipSummary& summary,
                  std::string& error) {
  std::error_code ec;
  if (site_root.empty() || !fs::is_directory(site_root, ec) || ec) {
    error = "site directory not found: " + site_root.string() +
            " (run the site build before compressing the site)";
    return false;
  }

  std::vector<MemberEntry> members;
  if (!BuildMemberEntries(site_root, output_file, entries, members, error)) {
    return false;
  }
  if (!core::EnsureParentDirectory(output_file, error)) {
    return false;
  }

  std::ofstream out_file(output_file, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open site archive output: " + output_file.string();
    return false;
  }

  summary = SiteZipSummary{};
  summary.written_path = output_file;

  for (auto& member : members) {
    if (!CheckedOffset(out_file, member.local_header_offset, error)) {
      return false;
    }

    WriteU32(out_file, kLocalFileHeaderSignature);
    WriteU16(out_file, kZipVersion);
    WriteU16(out_file, kGeneralPurposeUtf8Names);
    WriteU16(out_file, kCompressionMethodStore);
    WriteU16(out_file, kDosTimeMidnight);
    WriteU16(out_file, kDosDate1980Jan01);
    WriteU32(out_file, member.crc32);
    WriteU32(out_file, member.size_bytes); // compressed size (store)
    WriteU32(out_file, member.size_bytes); // uncompressed size
    WriteU16(out_file, static_cast<std::uint16_t>(member.zip_path.size()));
    WriteU16(out_file, 0); // extra field length
    out_file.write(member.zip_path.data(), static_cast<std::streamsize>(member.zip_path.size()));
    if (!out_file) {
      error = "failed while writing site archive header for: " + member.zip_path;
      return false;
    }

    // The file is read a second time; a size change since the crc pass means
    // the site tree was modified concurrently.
    std::uint32_t crc = 0;
    std::uint64_t written = 0;
    if (!StreamFile(member.path, &out_file, crc, written, error)) {
      return false;
    }
    if (written != member.size_bytes || crc != member.crc32) {
      error = "site file changed while archiving: " + member.path.string();
      return false;
    }
    summary.payload_bytes += written;
  }

  std::uint32_t central_dir_offset = 0;
  if (!CheckedOffset(out_file, central_dir_offset, error)) {
    return false;
  }

  for (const auto& member : members) {
    WriteU32(out_file, kCentralDirectoryHeaderSignature);
    WriteU16(out_file, kVersionMadeByUnix);
    WriteU16(out_file, kZipVersion); // version needed to extract
    WriteU16(out_file, kGeneralPurposeUtf8Names);
    WriteU16(out_file, kCompressionMethodStore);
    WriteU16(out_file, kDosTimeMidnight);
    WriteU16(out_file, kDosDate1980Jan01);
    WriteU32(out_file, member.crc32);
    WriteU32(out_file, member.size_bytes);
    WriteU32(out_file, member.size_bytes);
    WriteU16(out_file, static_cast<std::uint16_t>(member.zip_path.size()));
    WriteU16(out_file, 0); // extra field length
    WriteU16(out_file, 0); // file comment length
    WriteU16(out_file, 0); // disk number start
    WriteU16(out_file, 0); // internal file attributes
    WriteU32(out_file, kUnixRegularFileMode0644 << 16);
    WriteU32(out_file, member.local_header_offset);
    out_file.write(member.zip_path.data(), static_cast<std::streamsize>(member.zip_path.size()));
    if (!out_file) {
      error = "failed while writing site archive central directory";
      return false;
    }
  }

  std::uint32_t central_dir_end = 0;
  if (!CheckedOffset(out_file, central_dir_end, error)) {
    return false;
  }

  WriteU32(out_file, kEndOfCentralDirectorySignature);
  WriteU16(out_file, 0); // number of this disk
  WriteU16(out_file, 0); // disk where central directory starts
  WriteU16(out_file, static_cast<std::uint16_t>(members.size()));
  WriteU16(out_file, static_cast<std::uint16_t>(members.size()));
  WriteU32(out_file, central_dir_end - central_dir_offset);
  WriteU32(out_file, central_dir_offset);
  WriteU16(out_file, 0); // comment length

  out_file.close();
  if (!out_file) {
    error = "failed while finalizing site archive: " + output_file.string();
    return false;
  }

  summary.file_count = members.size();
  return true;
}

bool ListZipEntries(const fs::path& zip_path, std::vector<std::string>& names,
                    std::string& error) {
  names.clear();

  std::string contents;
  if (!core::ReadTextFile(zip_path, contents, error,
                          std::numeric_limits<std::uintmax_t>::max())) {
    return false;
  }
  if (contents.size() < kEndOfCentralDirectorySize) {
    error = "zip archive too short: " + zip_path.string();
    return false;
  }

  // The end record sits in the last 22 bytes plus an optional comment.
  const std::size_t scan_floor =
      contents.size() > kEndOfCentralDirectorySize + kMaxZipCommentSize
          ? contents.size() - kEndOfCentralDirectorySize - kMaxZipCommentSize
          : 0U;
  std::size_t eocd = std::string::npos;
  for (std::size_t pos = contents.size() - kEndOfCentralDirectorySize + 1; pos-- > scan_floor;) {
    if (ReadU32(contents, pos) == kEndOfCentralDirectorySignature) {
      eocd = pos;
      break;
    }
  }
  if (eocd == std::string::npos) {
    error = "zip end of central directory not found: " + zip_path.string();
    return false;
  }

  const std::uint16_t entry_count = ReadU16(contents, eocd + 10);
  std::size_t offset = ReadU32(contents, eocd + 16);
  for (std::uint16_t i = 0; i < entry_count; ++i) {
    if (offset + 46 > contents.size() ||
        ReadU32(contents, offset) != kCentralDirectoryHeaderSignature) {
      error = "corrupt zip central directory: " + zip_path.string();
      return false;
    }
    const std::size_t name_length = ReadU16(contents, offset + 28);
    const std::size_t extra_length = ReadU16(contents, offset + 30);
    const std::size_t comment_length = ReadU16(contents, offset + 32);
    if (offset + 46 + name_length > contents.size()) {
      error = "corrupt zip entry name: " + zip_path.string();
      return false;
    }
    names.push_back(contents.substr(offset + 46, name_length));
    offset += 46 + name_length + extra_length + comment_length;
  }
  return true;
}

} // namespace diststage::artifacts
