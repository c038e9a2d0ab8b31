#pragma once

#include "core/logging/logger.hpp"
#include "vcs/vcs_backend.hpp"

#include <functional>
#include <string>
#include <vector>

namespace diststage::vcs {

// Runs one shell command, capturing stdout+stderr into `output`.
// Returns false only when the command could not be started at all.
using CommandRunner =
    std::function<bool(const std::string& command, std::string& output, int& exit_code,
                       std::string& error)>;

// popen-based runner used in production.
bool RunShellCommand(const std::string& command, std::string& output, int& exit_code,
                     std::string& error);

// Quotes one argument for a POSIX shell.
std::string ShellQuote(const std::string& arg);

// Extracts N from svn's "Committed revision N." line; empty when absent.
std::string ParseCommittedRevision(const std::string& svn_output);

// IVcsBackend on top of the `svn` command-line client.
//
// Every command runs with --non-interactive. Credentials from the repository
// are passed as --username/--password and masked in logs. The password is
// still visible in the process list while svn runs; leave it empty to use
// svn's auth cache instead. `add` uses
// --parents --force so re-adding versioned files is harmless. `commit` lists
// the parent directories of new files with --depth empty so freshly added
// directories are committed without sweeping in unrelated changes.
class SvnExeBackend final : public IVcsBackend {
public:
  explicit SvnExeBackend(core::logging::Logger& logger, CommandRunner runner = RunShellCommand,
                         std::string svn_executable = "svn");

  std::string_view Provider() const override;
  bool Checkout(const ScmRepository& repository, const std::filesystem::path& directory,
                WorkingCopy& working_copy, std::string& error) override;
  VcsResult Add(const WorkingCopy& working_copy, const std::vector<std::filesystem::path>& files,
                const std::string& message) override;
  VcsResult Commit(const WorkingCopy& working_copy,
                   const std::vector<std::filesystem::path>& files,
                   const std::string& message) override;

private:
  // Builds "<svn> <subcommand> --non-interactive [credentials] <args...>".
  // `redacted` receives the same command with the password masked.
  std::string BuildCommand(const std::string& subcommand, const ScmRepository& repository,
                           const std::vector<std::string>& args, std::string& redacted) const;
  VcsResult Execute(const std::string& subcommand, const ScmRepository& repository,
                    const std::vector<std::string>& args);

  core::logging::Logger& logger_;
  CommandRunner runner_;
  std::string svn_executable_;
};

} // namespace diststage::vcs
