#include "vcs/vcs_backend.hpp"

#include <utility>

namespace diststage::vcs {

namespace {

constexpr std::string_view kScmPrefix = "scm:";
constexpr std::string_view kDefaultProvider = "svn";

bool HasUrlScheme(std::string_view url) {
  const std::size_t colon = url.find("://");
  return colon != std::string_view::npos && colon > 0U;
}

} // namespace

bool BuildScmRepository(std::string_view scm_url, ScmRepository& repository,
                        std::string& error) {
  repository = ScmRepository{};
  if (scm_url.empty()) {
    error = "scm url cannot be empty";
    return false;
  }

  std::string_view rest = scm_url;
  std::string_view provider = kDefaultProvider;
  if (rest.rfind(kScmPrefix, 0) == 0U) {
    rest.remove_prefix(kScmPrefix.size());
    const std::size_t separator = rest.find(':');
    if (separator == std::string_view::npos || separator == 0U) {
      error = "scm url is missing a provider (expected scm:<provider>:<url>): " +
              std::string(scm_url);
      return false;
    }
    provider = rest.substr(0, separator);
    rest.remove_prefix(separator + 1);
  }

  if (provider != kDefaultProvider) {
    error = "unsupported scm provider '" + std::string(provider) + "' (only svn is supported)";
    return false;
  }
  if (!HasUrlScheme(rest)) {
    error = "scm url must contain an absolute repository url: " + std::string(scm_url);
    return false;
  }

  repository.provider = std::string(provider);
  repository.url = std::string(rest);
  return true;
}

void InjectCredentials(ScmRepository& repository, std::string username, std::string password) {
  repository.username = std::move(username);
  repository.password = std::move(password);
}

} // namespace diststage::vcs
