#include "jdki/installer.hpp"
#include "jdki/acquirer.hpp"
#include "jdki/errors.hpp"
#include "jdki/logger.hpp"
#include "jdki/release_resolver.hpp"
#include "jdki/verifier.hpp"
#include <utility>

namespace jdki {

Installer::Installer(HTTP &http, ArchiveExtractor &extractor,
                     EnvironmentStore &store, InstallerSettings settings)
    : http_(http), extractor_(extractor), store_(store),
      settings_(std::move(settings)) {}

void Installer::validate(const InstallRequest &request) {
  bool hasFile = request.archiveFile && !request.archiveFile->empty();
  if (!hasFile && !request.downloadLatest) {
    throw ConfigurationError(
        "No archive source: pass an archive file or request the latest release");
  }
  if (hasFile && request.downloadLatest) {
    throw ConfigurationError(
        "Choose either an archive file or the latest release, not both");
  }
  if (request.destination.empty()) {
    throw ConfigurationError("No destination directory given");
  }
}

void Installer::prepareDestination(const std::filesystem::path &destination) {
  std::error_code ec;
  if (std::filesystem::exists(destination, ec)) {
    if (!std::filesystem::is_directory(destination, ec)) {
      throw ExtractionError("Destination " + destination.string() +
                            " exists and is not a directory");
    }
    LOG_WARN("Destination " + destination.string() +
             " already exists; existing files are kept and same-named files "
             "overwritten");
    return;
  }

  std::filesystem::create_directories(destination, ec);
  if (ec) {
    throw ExtractionError("Cannot create destination " + destination.string() +
                          ": " + ec.message());
  }
  LOG_INFO("Created " + destination.string());
}

InstallResult Installer::run(const InstallRequest &request) {
  {
    LogContext stage(stageName(Stage::Configuration));
    validate(request);
  }

  InstallResult result;
  std::error_code ec;
  result.destination =
      std::filesystem::absolute(request.destination, ec).lexically_normal();
  if (ec)
    result.destination = request.destination;
  if (!result.destination.has_filename() && result.destination.has_relative_path())
    result.destination = result.destination.parent_path();

  {
    LogContext stage(stageName(Stage::Extraction));
    prepareDestination(result.destination);
  }

  // Lives until the end of the run; removed on every exit path.
  TempArchive download;
  std::filesystem::path archive;
  if (request.downloadLatest) {
    {
      LogContext stage(stageName(Stage::Resolution));
      ReleaseResolver resolver(http_, settings_.release.apiBase,
                               settings_.release.caseInsensitive);
      result.downloadedFrom = resolver.resolveLatest(
          settings_.release.repo, settings_.release.assetGlob);
    }

    LogContext stage(stageName(Stage::Acquisition));

    std::filesystem::path tempRoot = settings_.tempRoot;
    if (tempRoot.empty()) {
      tempRoot = std::filesystem::temp_directory_path(ec);
      if (ec)
        throw AcquisitionError("No usable temporary directory: " + ec.message());
    }
    Acquirer acquirer(http_, tempRoot);
    download = acquirer.download(result.downloadedFrom);
    archive = download.path();
  } else {
    archive = *request.archiveFile;
    LOG_INFO("Using local archive " + archive.string());
  }

  {
    LogContext stage(stageName(Stage::Extraction));
    try {
      extractor_.extract(archive.string(), result.destination.string(),
                         settings_.stripLevels);
    } catch (const InstallError &) {
      throw;
    } catch (const std::exception &e) {
      throw ExtractionError("Failed to extract " + archive.string() + " into " +
                            result.destination.string() + ": " + e.what());
    }
    download.reset();
  }

  if (request.updatePath) {
    LogContext stage(stageName(Stage::Environment));
    EnvironmentConfigurator configurator(store_, settings_.homeVariable,
                                         settings_.pathVariable,
                                         settings_.pathSeparator);
    result.environment =
        configurator.applyPathUpdate(result.destination.string());
  } else {
    LOG_DEBUG("Environment update not requested");
  }

  {
    LogContext stage(stageName(Stage::Verification));
    Verifier verifier(settings_.javaBinary);
    Verification verification = verifier.verify(result.destination);
    result.binary = verification.binary;
    result.version = verification.version;
  }

  LOG_INFO("Installed " + result.version + " to " + result.destination.string());
  return result;
}

} // namespace jdki
