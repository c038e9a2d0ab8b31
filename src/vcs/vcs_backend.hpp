#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace diststage::vcs {

// Remote location plus the credentials used to reach it.
//
// Built from maven-scm style URLs (`scm:svn:https://host/repo/path`); a bare
// URL without the `scm:` prefix is taken as an svn URL.
struct ScmRepository {
  std::string provider;
  std::string url;
  std::string username;
  std::string password;
};

// Splits `scm_url` into provider and URL. Credentials are left empty.
bool BuildScmRepository(std::string_view scm_url, ScmRepository& repository,
                        std::string& error);

// Attaches credentials; empty values mean "let the client decide".
void InjectCredentials(ScmRepository& repository, std::string username, std::string password);

// A checked-out local directory bound to one repository. Each workflow owns
// its working copies; nothing shares them.
struct WorkingCopy {
  std::filesystem::path directory;
  ScmRepository repository;
};

// Outcome of add/commit. `command_output` is the backend's raw text and is
// reported verbatim on failure. `revision` is set by a successful commit.
struct VcsResult {
  bool success = false;
  std::string command_output;
  std::string revision;
};

// Capability-shaped VCS contract used by the stage and promote workflows.
class IVcsBackend {
public:
  virtual ~IVcsBackend() = default;

  // Provider key this backend serves ("svn").
  virtual std::string_view Provider() const = 0;

  // Checks `repository` out into `directory` (which must exist). Re-running
  // against an existing working copy of the same URL updates it in place.
  virtual bool Checkout(const ScmRepository& repository, const std::filesystem::path& directory,
                        WorkingCopy& working_copy, std::string& error) = 0;

  // Schedules `files` (absolute paths inside the working copy) for addition.
  // Files already under version control are not an error.
  virtual VcsResult Add(const WorkingCopy& working_copy,
                        const std::vector<std::filesystem::path>& files,
                        const std::string& message) = 0;

  // Commits `files` with `message`.
  virtual VcsResult Commit(const WorkingCopy& working_copy,
                           const std::vector<std::filesystem::path>& files,
                           const std::string& message) = 0;
};

} // namespace diststage::vcs
