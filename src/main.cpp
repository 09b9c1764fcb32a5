#include "jdki/config.hpp"
#include "jdki/environment.hpp"
#include "jdki/errors.hpp"
#include "jdki/http.hpp"
#include "jdki/installer.hpp"
#include "jdki/logger.hpp"
#include "jdki/version.hpp"
#include "jdki/zip_util.hpp"
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

void showHelp() {
  std::cout
      << "jdki - install a JDK release archive\n\n"
      << "Usage: jdki (--file <archive> | --latest) [options]\n\n"
      << "Source:\n"
      << "  -f, --file <archive>   Install from a local archive\n"
      << "  -l, --latest           Download the latest release from GitHub\n\n"
      << "Options:\n"
      << "  -d, --dest <dir>       Destination directory (default from config)\n"
      << "  -p, --update-path      Set JAVA_HOME and append the install to PATH\n"
      << "                         (machine scope, needs administrator rights)\n"
      << "  -c, --config <file>    JSON configuration (or JDKI_CONFIG)\n"
      << "      --log <file>       Also append the log to a file\n"
      << "      --print-config     Print the effective configuration and exit\n"
      << "  -v, --verbose          Enable verbose logging to stdout\n"
      << "  -h, --help             Show this help message\n"
      << "      --version          Show the program version\n";
}

namespace {

struct Options {
  jdki::InstallRequest request;
  std::string configPath;
  std::string logPath;
  bool verbose = false;
  bool printConfig = false;
};

// Returns false and fills error on a usage problem.
bool parseArgs(const std::vector<std::string> &args, Options &opts,
               std::string &error) {
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    auto next = [&](std::string &out) {
      if (i + 1 >= args.size()) {
        error = "Missing value for " + arg;
        return false;
      }
      out = args[++i];
      return true;
    };

    std::string value;
    if (arg == "-f" || arg == "--file") {
      if (!next(value))
        return false;
      opts.request.archiveFile = value;
    } else if (arg == "-d" || arg == "--dest") {
      if (!next(value))
        return false;
      opts.request.destination = value;
    } else if (arg == "-l" || arg == "--latest") {
      opts.request.downloadLatest = true;
    } else if (arg == "-p" || arg == "--update-path") {
      opts.request.updatePath = true;
    } else if (arg == "-c" || arg == "--config") {
      if (!next(opts.configPath))
        return false;
    } else if (arg == "--log") {
      if (!next(opts.logPath))
        return false;
    } else if (arg == "--print-config") {
      opts.printConfig = true;
    } else if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (!arg.empty()) {
      args.push_back(arg);
    }
  }

  for (const auto &arg : args) {
    if (arg == "help" || arg == "--help" || arg == "-h") {
      showHelp();
      return 0;
    }
    if (arg == "--version") {
      std::cout << "jdki v" << jdki::JDKI_VERSION_STRING << "\n";
      return 0;
    }
  }

  Options opts;
  std::string usageError;
  if (!parseArgs(args, opts, usageError)) {
    std::cerr << usageError << "\n\n";
    showHelp();
    return 2;
  }

  if (!jdki::Logger::instance().init(opts.logPath, opts.verbose)) {
    LOG_WARN("Cannot open log file " + opts.logPath + "; logging to console only");
  }
  LOG_DEBUG("jdki v" + jdki::JDKI_VERSION_STRING + " starting");

  auto &cfg = jdki::Config::instance();
  try {
    if (opts.configPath.empty()) {
      const char *env = std::getenv("JDKI_CONFIG");
      if (env && *env)
        opts.configPath = env;
    }
    if (!opts.configPath.empty())
      cfg.load(opts.configPath);
  } catch (const jdki::InstallError &e) {
    std::cerr << "[" << jdki::stageName(e.stage()) << "] " << e.what() << "\n";
    return 2;
  }

  if (opts.printConfig) {
    std::cout << cfg.toJson().dump(4) << "\n";
    return 0;
  }

  if (opts.request.destination.empty()) {
    opts.request.destination = cfg.getInstall().destination;
  }

  jdki::InstallerSettings settings;
  settings.release = cfg.getRelease();
  settings.stripLevels = cfg.getInstall().stripLevels;
  settings.javaBinary = cfg.getInstall().javaBinary;
  settings.homeVariable = cfg.getEnvironment().homeVariable;
  settings.pathVariable = cfg.getEnvironment().pathVariable;

#ifdef _WIN32
  auto store = std::make_unique<jdki::RegistryEnvironment>();
#else
  auto store = std::make_unique<jdki::FileEnvironment>(cfg.getEnvironment().file);
#endif

  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    LOG_ERROR("Failed to initialize libcurl");
    return 1;
  }

  int exitCode = 0;
  try {
    jdki::HTTP http(cfg.getHttp());
    jdki::ZipUtil extractor;
    jdki::Installer installer(http, extractor, *store, settings);

    auto result = installer.run(opts.request);

    std::cout << "Installed to " << result.destination.string() << "\n"
              << result.version << "\n";
    if (result.environment.homeChanged || result.environment.pathChanged) {
      std::cout << "Environment updated; open a new shell to pick it up.\n";
    }
  } catch (const jdki::InstallError &e) {
    LOG_ERROR(std::string("[") + jdki::stageName(e.stage()) + "] " + e.what());
    exitCode = e.stage() == jdki::Stage::Configuration ? 2 : 1;
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("Unexpected error: ") + e.what());
    exitCode = 1;
  }

  curl_global_cleanup();
  jdki::Logger::instance().close();
  return exitCode;
}
