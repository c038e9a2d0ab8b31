#pragma once

#include "vcs/vcs_backend.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace diststage::vcs::testing {

// In-memory backend for workflow tests: records every call, creates the
// checkout directory, and fails on request with scripted command output.
class RecordingVcsBackend final : public IVcsBackend {
public:
  struct CheckoutCall {
    ScmRepository repository;
    std::filesystem::path directory;
  };

  struct ChangeCall {
    std::filesystem::path working_copy;
    std::vector<std::filesystem::path> files;
    std::string message;
  };

  std::string_view Provider() const override;
  bool Checkout(const ScmRepository& repository, const std::filesystem::path& directory,
                WorkingCopy& working_copy, std::string& error) override;
  VcsResult Add(const WorkingCopy& working_copy, const std::vector<std::filesystem::path>& files,
                const std::string& message) override;
  VcsResult Commit(const WorkingCopy& working_copy,
                   const std::vector<std::filesystem::path>& files,
                   const std::string& message) override;

  void FailCheckout(std::string error_text);
  void FailAdd(std::string command_output);
  void FailCommit(std::string command_output);
  void SetCommittedRevision(std::string revision);

  const std::vector<CheckoutCall>& checkouts() const {
    return checkouts_;
  }
  const std::vector<ChangeCall>& adds() const {
    return adds_;
  }
  const std::vector<ChangeCall>& commits() const {
    return commits_;
  }
  std::size_t mutation_count() const {
    return adds_.size() + commits_.size();
  }

private:
  std::vector<CheckoutCall> checkouts_;
  std::vector<ChangeCall> adds_;
  std::vector<ChangeCall> commits_;
  bool fail_checkout_ = false;
  bool fail_add_ = false;
  bool fail_commit_ = false;
  std::string checkout_error_;
  std::string add_output_ = "A         (scripted)";
  std::string commit_output_;
  std::string revision_ = "1";
};

} // namespace diststage::vcs::testing
