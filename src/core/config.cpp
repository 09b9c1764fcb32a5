#include "jdki/config.hpp"
#include "jdki/errors.hpp"
#include "jdki/logger.hpp"
#include <fstream>

namespace jdki {

using json = nlohmann::json;

Config &Config::instance() {
  static Config instance;
  return instance;
}

void Config::reset() {
  configPath_.clear();
  release_ = ReleaseConfig{};
  install_ = InstallConfig{};
  environment_ = EnvironmentConfig{};
  http_ = HttpSettings{};
}

void Config::load(const std::filesystem::path &path) {
  configPath_ = path;

  if (!std::filesystem::exists(path)) {
    LOG_WARN("Config file not found at " + path.string() + ". Using defaults.");
    return;
  }

  std::ifstream file(path);
  if (!file) {
    throw ConfigurationError("Cannot read config file " + path.string());
  }

  try {
    json j;
    file >> j;

    if (j.contains("release")) {
      auto &r = j["release"];
      release_.repo = r.value("repo", release_.repo);
      release_.assetGlob = r.value("asset_glob", release_.assetGlob);
      release_.apiBase = r.value("api_base", release_.apiBase);
      release_.caseInsensitive =
          r.value("case_insensitive", release_.caseInsensitive);
    }

    if (j.contains("install")) {
      auto &i = j["install"];
      install_.destination = i.value("destination", install_.destination);
      install_.javaBinary = i.value("java_binary", install_.javaBinary);
      install_.stripLevels = i.value("strip_levels", install_.stripLevels);
      if (install_.stripLevels < 0) {
        throw ConfigurationError("install.strip_levels must not be negative");
      }
    }

    if (j.contains("environment")) {
      auto &e = j["environment"];
      environment_.homeVariable =
          e.value("home_variable", environment_.homeVariable);
      environment_.pathVariable =
          e.value("path_variable", environment_.pathVariable);
      environment_.file = e.value("file", environment_.file);
    }

    if (j.contains("http")) {
      auto &h = j["http"];
      http_.connectTimeout = h.value("connect_timeout", http_.connectTimeout);
      http_.lowSpeedTime = h.value("low_speed_time", http_.lowSpeedTime);
      http_.lowSpeedLimit = h.value("low_speed_limit", http_.lowSpeedLimit);
      http_.userAgent = h.value("user_agent", http_.userAgent);
    }

    LOG_INFO("Configuration loaded from " + path.string());

  } catch (const json::exception &e) {
    throw ConfigurationError("Failed to parse config file " + path.string() +
                             ": " + e.what());
  }
}

json Config::toJson() const {
  json j;
  j["release"] = {{"repo", release_.repo},
                  {"asset_glob", release_.assetGlob},
                  {"api_base", release_.apiBase},
                  {"case_insensitive", release_.caseInsensitive}};
  j["install"] = {{"destination", install_.destination},
                  {"java_binary", install_.javaBinary},
                  {"strip_levels", install_.stripLevels}};
  j["environment"] = {{"home_variable", environment_.homeVariable},
                      {"path_variable", environment_.pathVariable},
                      {"file", environment_.file}};
  j["http"] = {{"connect_timeout", http_.connectTimeout},
               {"low_speed_time", http_.lowSpeedTime},
               {"low_speed_limit", http_.lowSpeedLimit},
               {"user_agent", http_.userAgent}};
  return j;
}

} // namespace jdki
