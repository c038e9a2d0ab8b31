#ifndef DISTSTAGE_TESTS_COMMON_ASSERTIONS_HPP_
#define DISTSTAGE_TESTS_COMMON_ASSERTIONS_HPP_

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace diststage::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertExists(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    Fail("expected path to exist: " + path.string());
  }
}

inline void AssertNotExists(const std::filesystem::path& path) {
  if (std::filesystem::exists(path)) {
    Fail("expected path to be absent: " + path.string());
  }
}

inline std::string ReadFileToString(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open file: " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

inline void WriteFile(const std::filesystem::path& path, std::string_view contents) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream output(path, std::ios::binary);
  if (!output) {
    Fail("failed to create file: " + path.string());
  }
  output << contents;
}

} // namespace diststage::tests::common

#endif // DISTSTAGE_TESTS_COMMON_ASSERTIONS_HPP_
