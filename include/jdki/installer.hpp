#ifndef JDKI_INSTALLER_HPP
#define JDKI_INSTALLER_HPP

#include "jdki/config.hpp"
#include "jdki/environment.hpp"
#include "jdki/http.hpp"
#include "jdki/zip_util.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace jdki {

struct InstallRequest {
  std::optional<std::filesystem::path> archiveFile;
  bool downloadLatest = false;
  std::filesystem::path destination;
  bool updatePath = false;
};

struct InstallResult {
  std::filesystem::path destination;
  std::filesystem::path binary;
  std::string version;
  std::string downloadedFrom; // empty for a local archive
  EnvironmentUpdate environment;
};

struct InstallerSettings {
  ReleaseConfig release;
  int stripLevels = 1;
  std::string javaBinary = InstallConfig{}.javaBinary;
  std::string homeVariable = EnvironmentConfig{}.homeVariable;
  std::string pathVariable = EnvironmentConfig{}.pathVariable;
  char pathSeparator = kPathListSeparator;
  std::filesystem::path tempRoot; // empty: system temp directory
};

// Runs one installation: prepare destination, acquire, extract, optionally
// update the environment, verify. Every failure is an InstallError.
class Installer {
public:
  Installer(HTTP &http, ArchiveExtractor &extractor, EnvironmentStore &store,
            InstallerSettings settings);

  InstallResult run(const InstallRequest &request);

  // Throws ConfigurationError unless exactly one source is selected.
  static void validate(const InstallRequest &request);

private:
  void prepareDestination(const std::filesystem::path &destination);

  HTTP &http_;
  ArchiveExtractor &extractor_;
  EnvironmentStore &store_;
  InstallerSettings settings_;
};

} // namespace jdki

#endif // JDKI_INSTALLER_HPP
