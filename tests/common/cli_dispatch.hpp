#ifndef DISTSTAGE_TESTS_COMMON_CLI_DISPATCH_HPP_
#define DISTSTAGE_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "diststage/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace diststage::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return diststage::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Runs Dispatch with std::cout/std::cerr redirected into the given strings.
inline int DispatchArgsCaptured(const std::vector<std::string>& argv_storage,
                                std::string& stdout_text, std::string& stderr_text) {
  std::ostringstream captured_cout;
  std::ostringstream captured_cerr;
  std::streambuf* original_cout = std::cout.rdbuf(captured_cout.rdbuf());
  std::streambuf* original_cerr = std::cerr.rdbuf(captured_cerr.rdbuf());
  const int exit_code = DispatchArgs(argv_storage);
  std::cout.rdbuf(original_cout);
  std::cerr.rdbuf(original_cerr);

  stdout_text = captured_cout.str();
  stderr_text = captured_cerr.str();
  return exit_code;
}

} // namespace diststage::tests::common

#endif // DISTSTAGE_TESTS_COMMON_CLI_DISPATCH_HPP_
