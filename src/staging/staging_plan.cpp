#include "staging/staging_plan.hpp"

namespace fs = std::filesystem;

namespace diststage::staging {

bool CommitFileSet::Register(const fs::path& path) {
  const fs::path normalized = path.lexically_normal();
  if (!seen_.insert(normalized).second) {
    return false;
  }
  ordered_.push_back(normalized);
  return true;
}

void CommitFileSet::RegisterMany(const std::vector<fs::path>& paths) {
  for (const fs::path& path : paths) {
    Register(path);
  }
}

bool CommitFileSet::Contains(const fs::path& path) const {
  return seen_.count(path.lexically_normal()) != 0U;
}

} // namespace diststage::staging
