#ifndef JDKI_VERIFIER_HPP
#define JDKI_VERIFIER_HPP

#include <filesystem>
#include <string>

namespace jdki {

struct Verification {
  std::filesystem::path binary;
  std::string version;
};

// Runs the installed java binary with -version.
class Verifier {
public:
  explicit Verifier(std::filesystem::path binaryRelativePath);

  // Throws VerificationError.
  Verification verify(const std::filesystem::path &destination) const;

  // Lines mentioning "version", or the whole trimmed output if none do.
  static std::string extractVersion(const std::string &output);

private:
  std::filesystem::path binary_;
};

} // namespace jdki

#endif // JDKI_VERIFIER_HPP
