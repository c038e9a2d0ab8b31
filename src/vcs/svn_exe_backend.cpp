#include "vcs/svn_exe_backend.hpp"

#include <cstdio>
#include <set>
#include <utility>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace diststage::vcs {

namespace {

constexpr std::string_view kRevisionMarker = "Committed revision ";
constexpr std::string_view kPasswordMask = "'********'";

std::vector<std::string> ToArgs(const std::vector<fs::path>& paths) {
  std::vector<std::string> args;
  args.reserve(paths.size());
  for (const fs::path& path : paths) {
    args.push_back(path.string());
  }
  return args;
}

// Directories between the working-copy root and each file, parents first.
std::vector<fs::path> CollectParentDirectories(const fs::path& root,
                                               const std::vector<fs::path>& files) {
  const fs::path normalized_root = root.lexically_normal();
  std::vector<fs::path> ordered;
  std::set<fs::path> seen;
  for (const fs::path& file : files) {
    const fs::path relative = file.lexically_normal().lexically_relative(normalized_root);
    if (relative.empty() || *relative.begin() == "..") {
      continue;
    }
    fs::path current = normalized_root;
    const fs::path relative_parent = relative.parent_path();
    for (const fs::path& component : relative_parent) {
      current /= component;
      if (seen.insert(current).second) {
        ordered.push_back(current);
      }
    }
  }
  return ordered;
}

} // namespace

bool RunShellCommand(const std::string& command, std::string& output, int& exit_code,
                     std::string& error) {
  output.clear();
  exit_code = -1;
  error.clear();

  const std::string wrapped = command + " 2>&1";
#if defined(_WIN32)
  FILE* pipe = _popen(wrapped.c_str(), "r");
#else
  FILE* pipe = popen(wrapped.c_str(), "r");
#endif
  if (pipe == nullptr) {
    error = "failed to execute command";
    return false;
  }

  char buffer[4096];
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), pipe) != nullptr) {
    output.append(buffer);
  }

#if defined(_WIN32)
  exit_code = _pclose(pipe);
#else
  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    exit_code = -1;
  } else if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
#endif

  return true;
}

std::string ShellQuote(const std::string& arg) {
  std::string quoted = "'";
  for (const char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string ParseCommittedRevision(const std::string& svn_output) {
  const std::size_t marker = svn_output.rfind(kRevisionMarker);
  if (marker == std::string::npos) {
    return "";
  }
  std::size_t pos = marker + kRevisionMarker.size();
  std::string revision;
  while (pos < svn_output.size() && svn_output[pos] >= '0' && svn_output[pos] <= '9') {
    revision.push_back(svn_output[pos]);
    ++pos;
  }
  return revision;
}

SvnExeBackend::SvnExeBackend(core::logging::Logger& logger, CommandRunner runner,
                             std::string svn_executable)
    : logger_(logger), runner_(std::move(runner)), svn_executable_(std::move(svn_executable)) {}

std::string_view SvnExeBackend::Provider() const {
  return "svn";
}

bool SvnExeBackend::Checkout(const ScmRepository& repository, const fs::path& directory,
                             WorkingCopy& working_copy, std::string& error) {
  logger_.Info("checking out dist", {{"url", repository.url}, {"directory", directory.string()}});

  const VcsResult result = Execute("checkout", repository, {repository.url, directory.string()});
  if (!result.success) {
    error = "checkout of " + repository.url + " failed: " + result.command_output;
    return false;
  }

  working_copy.directory = directory;
  working_copy.repository = repository;
  return true;
}

VcsResult SvnExeBackend::Add(const WorkingCopy& working_copy, const std::vector<fs::path>& files,
                             const std::string& message) {
  logger_.Debug("svn add", {{"files", std::to_string(files.size())}, {"message", message}});

  std::vector<std::string> args = {"--parents", "--force"};
  const std::vector<std::string> targets = ToArgs(files);
  args.insert(args.end(), targets.begin(), targets.end());
  return Execute("add", working_copy.repository, args);
}

VcsResult SvnExeBackend::Commit(const WorkingCopy& working_copy,
                                const std::vector<fs::path>& files, const std::string& message) {
  std::vector<std::string> args = {"--depth", "empty", "-m", message};
  const std::vector<std::string> parents =
      ToArgs(CollectParentDirectories(working_copy.directory, files));
  const std::vector<std::string> targets = ToArgs(files);
  args.insert(args.end(), parents.begin(), parents.end());
  args.insert(args.end(), targets.begin(), targets.end());

  VcsResult result = Execute("commit", working_copy.repository, args);
  if (result.success) {
    result.revision = ParseCommittedRevision(result.command_output);
  }
  return result;
}

std::string SvnExeBackend::BuildCommand(const std::string& subcommand,
                                        const ScmRepository& repository,
                                        const std::vector<std::string>& args,
                                        std::string& redacted) const {
  std::string command = ShellQuote(svn_executable_) + " " + subcommand + " --non-interactive";
  redacted = command;
  if (!repository.username.empty()) {
    const std::string part = " --username " + ShellQuote(repository.username);
    command += part;
    redacted += part;
  }
  if (!repository.password.empty()) {
    command += " --password " + ShellQuote(repository.password);
    redacted += " --password " + std::string(kPasswordMask);
  }
  for (const std::string& arg : args) {
    const std::string part = " " + ShellQuote(arg);
    command += part;
    redacted += part;
  }
  return command;
}

VcsResult SvnExeBackend::Execute(const std::string& subcommand, const ScmRepository& repository,
                                 const std::vector<std::string>& args) {
  std::string redacted;
  const std::string command = BuildCommand(subcommand, repository, args, redacted);
  logger_.Debug("running svn", {{"command", redacted}});

  VcsResult result;
  int exit_code = -1;
  std::string error;
  if (!runner_(command, result.command_output, exit_code, error)) {
    result.command_output = "unable to run " + svn_executable_ + ": " + error;
    return result;
  }

  result.success = exit_code == 0;
  if (!result.success) {
    logger_.Debug("svn returned non-zero exit code",
                  {{"subcommand", subcommand}, {"exit_code", std::to_string(exit_code)}});
  }
  return result;
}

} // namespace diststage::vcs
