#ifndef JDKI_CONFIG_HPP
#define JDKI_CONFIG_HPP

#include "jdki/http.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

namespace jdki {

struct ReleaseConfig {
  std::string repo = "adoptium/temurin21-binaries"; // GitHub "owner/repo"
#ifdef _WIN32
  std::string assetGlob = "OpenJDK21U-jdk_x64_windows_hotspot_*.zip";
  bool caseInsensitive = true;
#else
  std::string assetGlob = "OpenJDK21U-jdk_x64_linux_hotspot_*.tar.gz";
  bool caseInsensitive = false;
#endif
  std::string apiBase = "https://api.github.com";
};

struct InstallConfig {
#ifdef _WIN32
  std::string destination = "C:\\Program Files\\Java\\jdk";
  std::string javaBinary = "bin/java.exe";
#else
  std::string destination = "/opt/java/jdk";
  std::string javaBinary = "bin/java";
#endif
  int stripLevels = 1;
};

struct EnvironmentConfig {
  std::string homeVariable = "JAVA_HOME";
#ifdef _WIN32
  std::string pathVariable = "Path";
#else
  std::string pathVariable = "PATH";
#endif
  std::string file = "/etc/environment"; // ignored on Windows
};

class Config {
public:
  static Config &instance();

  // Missing file: defaults. Unreadable or malformed: ConfigurationError.
  void load(const std::filesystem::path &configPath);
  void reset();

  ReleaseConfig &getRelease() { return release_; }
  InstallConfig &getInstall() { return install_; }
  EnvironmentConfig &getEnvironment() { return environment_; }
  HttpSettings &getHttp() { return http_; }

  nlohmann::json toJson() const;

  // Forbidden
  Config(const Config &) = delete;
  Config &operator=(const Config &) = delete;

private:
  Config() = default;
  ~Config() = default;

  std::filesystem::path configPath_;
  ReleaseConfig release_;
  InstallConfig install_;
  EnvironmentConfig environment_;
  HttpSettings http_;
};

} // namespace jdki

#endif // JDKI_CONFIG_HPP
