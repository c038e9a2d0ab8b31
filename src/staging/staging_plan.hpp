#ifndef DISTSTAGE_STAGING_STAGING_PLAN_HPP_
#define DISTSTAGE_STAGING_STAGING_PLAN_HPP_

#include <filesystem>
#include <set>
#include <vector>

namespace diststage::staging {

// Insertion-ordered set of paths handed to the VCS add/commit calls.
//
// Contract:
// - the first registration of a path fixes its position
// - later registrations of the same (lexically normalized) path are ignored
class CommitFileSet {
public:
  // Returns false when the path was already present.
  bool Register(const std::filesystem::path& path);
  void RegisterMany(const std::vector<std::filesystem::path>& paths);

  bool Contains(const std::filesystem::path& path) const;
  std::size_t size() const {
    return ordered_.size();
  }
  bool empty() const {
    return ordered_.empty();
  }

  const std::vector<std::filesystem::path>& Paths() const {
    return ordered_;
  }

private:
  std::vector<std::filesystem::path> ordered_;
  std::set<std::filesystem::path> seen_;
};

struct CopyStep {
  std::filesystem::path source;
  std::filesystem::path destination;
};

// Everything one staging run copied or generated, in execution order.
struct StagingPlan {
  std::vector<CopyStep> copies;
  CommitFileSet files_to_commit;
};

} // namespace diststage::staging

#endif // DISTSTAGE_STAGING_STAGING_PLAN_HPP_
