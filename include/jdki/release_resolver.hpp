#ifndef JDKI_RELEASE_RESOLVER_HPP
#define JDKI_RELEASE_RESOLVER_HPP

#include "jdki/http.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace jdki {

struct ReleaseAsset {
  std::string name;
  std::string url;
  size_t size = 0;
};

struct Release {
  std::string tag;
  std::vector<ReleaseAsset> assets;
};

// Finds the download URL of the latest GitHub release asset whose file name
// matches a glob.
class ReleaseResolver {
public:
  ReleaseResolver(HTTP &http, std::string apiBase, bool caseInsensitive);

  // Throws ResolutionError.
  std::string resolveLatest(const std::string &repo,
                            const std::string &filenameGlob);

  Release fetchLatest(const std::string &repo);

  // Accepts a release object, an array of releases, or a bare asset array.
  static Release parseRelease(const nlohmann::json &body);

  // Lexicographically first matching asset, or nullopt.
  static std::optional<ReleaseAsset>
  selectAsset(const std::vector<ReleaseAsset> &assets,
              const std::string &filenameGlob, bool caseInsensitive,
              size_t *matchCount = nullptr);

  // '*' matches any run, '?' any single character.
  static bool globMatch(const std::string &pattern, const std::string &name,
                        bool caseInsensitive);

  static bool validateRepo(const std::string &repo, std::string &outError);

private:
  HTTP &http_;
  std::string apiBase_;
  bool caseInsensitive_;
};

} // namespace jdki

#endif // JDKI_RELEASE_RESOLVER_HPP
