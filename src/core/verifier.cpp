#include "jdki/verifier.hpp"
#include "jdki/errors.hpp"
#include "jdki/logger.hpp"
#include "jdki/process.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace jdki {

namespace {

std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

} // namespace

Verifier::Verifier(std::filesystem::path binaryRelativePath)
    : binary_(std::move(binaryRelativePath)) {}

std::string Verifier::extractVersion(const std::string &output) {
  std::istringstream iss(output);
  std::string line;
  std::string version;
  while (std::getline(iss, line)) {
    std::string lower = line;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower.find("version") == std::string::npos)
      continue;
    if (!version.empty())
      version += "\n";
    version += trim(line);
  }
  return version.empty() ? trim(output) : version;
}

Verification Verifier::verify(const std::filesystem::path &destination) const {
  Verification result;
  result.binary = destination / binary_;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(result.binary, ec)) {
    throw VerificationError("binary not found at " + result.binary.string());
  }

  LOG_INFO("Running " + result.binary.string() + " -version");
  ProcessResult proc;
  try {
    proc = Process::run(result.binary.string(), {"-version"});
  } catch (const std::exception &e) {
    throw VerificationError("Cannot run " + result.binary.string() + ": " +
                            e.what());
  }

  if (proc.exitCode != 0) {
    throw VerificationError(result.binary.string() + " -version exited with " +
                            std::to_string(proc.exitCode) + ": " +
                            trim(proc.output));
  }

  result.version = extractVersion(proc.output);
  LOG_DEBUG("Version output: " + result.version);
  return result;
}

} // namespace jdki
