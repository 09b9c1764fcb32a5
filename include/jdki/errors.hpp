#ifndef JDKI_ERRORS_HPP
#define JDKI_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace jdki {

enum class Stage {
  Configuration,
  Resolution,
  Acquisition,
  Extraction,
  Environment,
  Verification
};

const char *stageName(Stage stage);

// Base for every failure that aborts an installation run.
class InstallError : public std::runtime_error {
public:
  InstallError(Stage stage, const std::string &message)
      : std::runtime_error(message), stage_(stage) {}

  Stage stage() const { return stage_; }

private:
  Stage stage_;
};

class ConfigurationError : public InstallError {
public:
  explicit ConfigurationError(const std::string &message)
      : InstallError(Stage::Configuration, message) {}
};

class ResolutionError : public InstallError {
public:
  explicit ResolutionError(const std::string &message)
      : InstallError(Stage::Resolution, message) {}
};

class AcquisitionError : public InstallError {
public:
  explicit AcquisitionError(const std::string &message)
      : InstallError(Stage::Acquisition, message) {}
};

class ExtractionError : public InstallError {
public:
  explicit ExtractionError(const std::string &message)
      : InstallError(Stage::Extraction, message) {}
};

class EnvironmentError : public InstallError {
public:
  explicit EnvironmentError(const std::string &message)
      : InstallError(Stage::Environment, message) {}
};

class VerificationError : public InstallError {
public:
  explicit VerificationError(const std::string &message)
      : InstallError(Stage::Verification, message) {}
};

} // namespace jdki

#endif // JDKI_ERRORS_HPP
