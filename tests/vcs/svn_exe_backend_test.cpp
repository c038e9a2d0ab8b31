#include "vcs/svn_exe_backend.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

using diststage::core::logging::LogLevel;
using diststage::core::logging::Logger;
using diststage::vcs::ScmRepository;
using diststage::vcs::SvnExeBackend;
using diststage::vcs::VcsResult;
using diststage::vcs::WorkingCopy;

namespace {

// Scripted runner: records commands and replies with a fixed output/exit code.
struct FakeRunner {
  std::vector<std::string> commands;
  std::string output;
  int exit_code = 0;
  bool start_fails = false;

  diststage::vcs::CommandRunner Bind() {
    return [this](const std::string& command, std::string& out, int& code, std::string& error) {
      commands.push_back(command);
      if (start_fails) {
        error = "no such file";
        return false;
      }
      out = output;
      code = exit_code;
      return true;
    };
  }
};

ScmRepository Repo(std::string username = "", std::string password = "") {
  ScmRepository repository;
  repository.provider = "svn";
  repository.url = "https://svn.example.org/dist/dev/foo";
  repository.username = std::move(username);
  repository.password = std::move(password);
  return repository;
}

} // namespace

TEST_CASE("Committed revision is parsed from svn output", "[vcs][svn]") {
  REQUIRE(diststage::vcs::ParseCommittedRevision("Adding foo\nCommitted revision 1234.\n") ==
          "1234");
  REQUIRE(diststage::vcs::ParseCommittedRevision("Committed revision 7.") == "7");
  REQUIRE(diststage::vcs::ParseCommittedRevision("nothing to commit").empty());
}

TEST_CASE("Shell quoting survives embedded quotes", "[vcs][svn]") {
  REQUIRE(diststage::vcs::ShellQuote("plain") == "'plain'");
  REQUIRE(diststage::vcs::ShellQuote("it's") == "'it'\\''s'");
  REQUIRE(diststage::vcs::ShellQuote("") == "''");
}

TEST_CASE("Checkout runs non-interactive svn checkout with credentials", "[vcs][svn]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  FakeRunner runner;
  SvnExeBackend backend(logger, runner.Bind());

  WorkingCopy working_copy;
  std::string error;
  REQUIRE(backend.Checkout(Repo("releaser", "s3cret"), fs::path("/tmp/co"), working_copy, error));
  REQUIRE(runner.commands.size() == 1U);
  REQUIRE(runner.commands[0] ==
          "'svn' checkout --non-interactive --username 'releaser' --password 's3cret' "
          "'https://svn.example.org/dist/dev/foo' '/tmp/co'");
  REQUIRE(working_copy.directory == fs::path("/tmp/co"));
  REQUIRE(working_copy.repository.url == "https://svn.example.org/dist/dev/foo");

  // The password never reaches the log.
  REQUIRE(log.str().find("s3cret") == std::string::npos);
  REQUIRE(log.str().find("********") != std::string::npos);
}

TEST_CASE("Checkout failure carries the svn output", "[vcs][svn]") {
  std::ostringstream log;
  Logger logger(LogLevel::kError, log);
  FakeRunner runner;
  runner.output = "svn: E170013: Unable to connect to a repository";
  runner.exit_code = 1;
  SvnExeBackend backend(logger, runner.Bind());

  WorkingCopy working_copy;
  std::string error;
  REQUIRE_FALSE(backend.Checkout(Repo(), fs::path("/tmp/co"), working_copy, error));
  REQUIRE(error.find("E170013") != std::string::npos);
  REQUIRE(error.find("https://svn.example.org/dist/dev/foo") != std::string::npos);
}

TEST_CASE("Add forces parents and commit lists new directories", "[vcs][svn]") {
  std::ostringstream log;
  Logger logger(LogLevel::kInfo, log);
  FakeRunner runner;
  runner.output = "Sending foo\nCommitted revision 99.\n";
  SvnExeBackend backend(logger, runner.Bind());

  WorkingCopy working_copy;
  working_copy.directory = "/co";
  working_copy.repository = Repo();
  const std::vector<fs::path> files = {"/co/source/foo-src.zip", "/co/README.html"};

  const VcsResult add = backend.Add(working_copy, files, "Staging release: foo, version: 1.0");
  REQUIRE(add.success);
  REQUIRE(runner.commands[0] ==
          "'svn' add --non-interactive '--parents' '--force' '/co/source/foo-src.zip' "
          "'/co/README.html'");

  const VcsResult commit =
      backend.Commit(working_copy, files, "Staging release: foo, version: 1.0");
  REQUIRE(commit.success);
  REQUIRE(commit.revision == "99");
  REQUIRE(runner.commands[1] ==
          "'svn' commit --non-interactive '--depth' 'empty' '-m' "
          "'Staging release: foo, version: 1.0' '/co/source' '/co/source/foo-src.zip' "
          "'/co/README.html'");
}

TEST_CASE("Non-zero exit and unstartable svn are failures", "[vcs][svn]") {
  std::ostringstream log;
  Logger logger(LogLevel::kInfo, log);
  WorkingCopy working_copy;
  working_copy.directory = "/co";
  working_copy.repository = Repo();

  FakeRunner rejecting;
  rejecting.output = "svn: E155010: out of date";
  rejecting.exit_code = 1;
  SvnExeBackend backend(logger, rejecting.Bind());
  const VcsResult commit = backend.Commit(working_copy, {"/co/a.txt"}, "msg");
  REQUIRE_FALSE(commit.success);
  REQUIRE(commit.command_output == "svn: E155010: out of date");
  REQUIRE(commit.revision.empty());

  FakeRunner missing;
  missing.start_fails = true;
  SvnExeBackend unstartable(logger, missing.Bind(), "/nonexistent/svn");
  const VcsResult add = unstartable.Add(working_copy, {"/co/a.txt"}, "msg");
  REQUIRE_FALSE(add.success);
  REQUIRE(add.command_output.find("/nonexistent/svn") != std::string::npos);
}
