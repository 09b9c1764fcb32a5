#include "jdki/release_resolver.hpp"
#include "jdki/errors.hpp"
#include "jdki/logger.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace jdki {

using json = nlohmann::json;

namespace {

std::vector<ReleaseAsset> parseAssets(const json &assets) {
  std::vector<ReleaseAsset> out;
  if (!assets.is_array())
    return out;

  for (const auto &asset : assets) {
    if (!asset.is_object())
      continue;
    auto name = asset.find("name");
    if (name == asset.end() || !name->is_string()) {
      LOG_DEBUG("Ignoring asset without a usable name");
      continue;
    }
    ReleaseAsset ra;
    ra.name = name->get<std::string>();

    auto url = asset.find("browser_download_url");
    if (url == asset.end() || !url->is_string() || url->get<std::string>().empty()) {
      LOG_DEBUG("Ignoring asset without download URL: " + ra.name);
      continue;
    }
    ra.url = url->get<std::string>();

    auto size = asset.find("size");
    if (size != asset.end() && size->is_number_unsigned())
      ra.size = size->get<size_t>();
    out.push_back(ra);
  }
  return out;
}

char fold(char c, bool caseInsensitive) {
  return caseInsensitive
             ? static_cast<char>(std::tolower(static_cast<unsigned char>(c)))
             : c;
}

} // namespace

ReleaseResolver::ReleaseResolver(HTTP &http, std::string apiBase,
                                 bool caseInsensitive)
    : http_(http), apiBase_(std::move(apiBase)),
      caseInsensitive_(caseInsensitive) {
  while (!apiBase_.empty() && apiBase_.back() == '/')
    apiBase_.pop_back();
}

bool ReleaseResolver::validateRepo(const std::string &repo,
                                   std::string &outError) {
  if (repo.empty()) {
    outError = "Repo cannot be empty";
    return false;
  }
  auto slash = repo.find('/');
  if (slash == std::string::npos || slash == 0 || slash == repo.size() - 1 ||
      repo.find('/', slash + 1) != std::string::npos) {
    outError = "Invalid repo format (owner/name expected): " + repo;
    return false;
  }
  return true;
}

bool ReleaseResolver::globMatch(const std::string &pattern,
                                const std::string &name,
                                bool caseInsensitive) {
  // Iterative matcher with single-star backtracking.
  size_t p = 0, n = 0;
  size_t starP = std::string::npos, starN = 0;
  while (n < name.size()) {
    if (p < pattern.size() &&
        (pattern[p] == '?' ||
         (pattern[p] != '*' &&
          fold(pattern[p], caseInsensitive) == fold(name[n], caseInsensitive)))) {
      ++p;
      ++n;
    } else if (p < pattern.size() && pattern[p] == '*') {
      starP = p++;
      starN = n;
    } else if (starP != std::string::npos) {
      p = starP + 1;
      n = ++starN;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*')
    ++p;
  return p == pattern.size();
}

std::optional<ReleaseAsset>
ReleaseResolver::selectAsset(const std::vector<ReleaseAsset> &assets,
                             const std::string &filenameGlob,
                             bool caseInsensitive, size_t *matchCount) {
  std::vector<const ReleaseAsset *> matches;
  for (const auto &a : assets) {
    if (globMatch(filenameGlob, a.name, caseInsensitive))
      matches.push_back(&a);
  }
  if (matchCount)
    *matchCount = matches.size();
  if (matches.empty())
    return std::nullopt;

  auto first = std::min_element(
      matches.begin(), matches.end(),
      [](const ReleaseAsset *l, const ReleaseAsset *r) { return l->name < r->name; });
  return **first;
}

Release ReleaseResolver::parseRelease(const json &body) {
  Release release;

  if (body.is_object()) {
    if (!body.contains("assets")) {
      std::string message = body.value("message", "no assets field");
      throw ResolutionError("Unexpected release listing: " + message);
    }
    release.tag = body.value("tag_name", "");
    release.assets = parseAssets(body["assets"]);
    return release;
  }

  if (!body.is_array())
    throw ResolutionError("Unexpected release listing: not an object or array");

  if (body.empty())
    return release;

  // A list of releases, newest first.
  if (body.front().is_object() && body.front().contains("assets")) {
    for (const auto &rel : body) {
      if (rel.value("draft", false) || rel.value("prerelease", false))
        continue;
      release.tag = rel.value("tag_name", "");
      release.assets = parseAssets(rel.value("assets", json::array()));
      return release;
    }
    return release;
  }

  release.assets = parseAssets(body);
  return release;
}

Release ReleaseResolver::fetchLatest(const std::string &repo) {
  std::string error;
  if (!validateRepo(repo, error))
    throw ResolutionError(error);

  std::string url = apiBase_ + "/repos/" + repo + "/releases/latest";
  LOG_INFO("Querying " + url);

  std::string response;
  try {
    response = http_.get(url, {"Accept: application/vnd.github+json"});
  } catch (const std::exception &e) {
    throw ResolutionError("Cannot reach release listing for " + repo + ": " +
                          e.what());
  }

  json j = json::parse(response, nullptr, false);
  if (j.is_discarded())
    throw ResolutionError("Release listing for " + repo + " is not valid JSON");

  try {
    return parseRelease(j);
  } catch (const json::exception &e) {
    throw ResolutionError("Malformed release listing for " + repo + ": " +
                          e.what());
  }
}

std::string ReleaseResolver::resolveLatest(const std::string &repo,
                                           const std::string &filenameGlob) {
  Release release = fetchLatest(repo);
  LOG_DEBUG("Release " + (release.tag.empty() ? std::string("<untagged>")
                                              : release.tag) +
            " lists " + std::to_string(release.assets.size()) + " assets");

  size_t count = 0;
  auto asset = selectAsset(release.assets, filenameGlob, caseInsensitive_, &count);
  if (!asset) {
    throw ResolutionError("No unambiguous release asset found in " + repo +
                          " matching '" + filenameGlob + "'");
  }
  if (count > 1) {
    LOG_WARN(std::to_string(count) + " assets match '" + filenameGlob +
             "', using " + asset->name);
  }

  LOG_INFO("Resolved " + asset->name + " (" + release.tag + ")");
  return asset->url;
}

} // namespace jdki
