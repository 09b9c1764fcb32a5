#ifndef JDKI_ACQUIRER_HPP
#define JDKI_ACQUIRER_HPP

#include "jdki/http.hpp"
#include <filesystem>
#include <string>

namespace jdki {

// Owns a downloaded archive and the private directory it lives in. Both are
// removed when the handle is destroyed.
class TempArchive {
public:
  TempArchive() = default;
  TempArchive(std::filesystem::path dir, std::filesystem::path file);
  ~TempArchive();

  TempArchive(TempArchive &&other) noexcept;
  TempArchive &operator=(TempArchive &&other) noexcept;
  TempArchive(const TempArchive &) = delete;
  TempArchive &operator=(const TempArchive &) = delete;

  const std::filesystem::path &path() const { return file_; }
  bool empty() const { return file_.empty(); }

  void reset();

private:
  std::filesystem::path dir_;
  std::filesystem::path file_;
};

class Acquirer {
public:
  Acquirer(HTTP &http, std::filesystem::path tempRoot);

  // Single attempt, no retry. Throws AcquisitionError.
  TempArchive download(const std::string &url);

  // Final path segment of the URL, query and fragment removed.
  static std::string fileNameFromUrl(const std::string &url);

private:
  HTTP &http_;
  std::filesystem::path tempRoot_;
};

} // namespace jdki

#endif // JDKI_ACQUIRER_HPP
