#include "jdki/acquirer.hpp"
#include "jdki/errors.hpp"
#include "jdki/logger.hpp"
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace jdki {

TempArchive::TempArchive(std::filesystem::path dir, std::filesystem::path file)
    : dir_(std::move(dir)), file_(std::move(file)) {}

TempArchive::~TempArchive() { reset(); }

TempArchive::TempArchive(TempArchive &&other) noexcept
    : dir_(std::move(other.dir_)), file_(std::move(other.file_)) {
  other.dir_.clear();
  other.file_.clear();
}

TempArchive &TempArchive::operator=(TempArchive &&other) noexcept {
  if (this != &other) {
    reset();
    dir_ = std::move(other.dir_);
    file_ = std::move(other.file_);
    other.dir_.clear();
    other.file_.clear();
  }
  return *this;
}

void TempArchive::reset() {
  std::error_code ec;
  if (!file_.empty()) {
    std::filesystem::remove(file_, ec);
    if (ec)
      LOG_WARN("Could not remove temporary archive " + file_.string() + ": " +
               ec.message());
    else
      LOG_DEBUG("Removed temporary archive " + file_.string());
  }
  if (!dir_.empty()) {
    std::filesystem::remove_all(dir_, ec);
  }
  file_.clear();
  dir_.clear();
}

Acquirer::Acquirer(HTTP &http, std::filesystem::path tempRoot)
    : http_(http), tempRoot_(std::move(tempRoot)) {}

std::string Acquirer::fileNameFromUrl(const std::string &url) {
  std::string path = url.substr(0, url.find_first_of("?#"));
  std::string filename = path.substr(path.find_last_of('/') + 1);
  if (filename.empty() || filename == "." || filename == "..")
    filename = "archive";
  return filename;
}

TempArchive Acquirer::download(const std::string &url) {
  std::string filename = fileNameFromUrl(url);

  std::error_code ec;
  std::filesystem::create_directories(tempRoot_, ec);

  std::random_device rd;
  std::mt19937 gen(rd());
  std::filesystem::path dir;
  for (int attempt = 0; attempt < 16; ++attempt) {
    std::stringstream ss;
    ss << "jdki-" << std::hex << std::setw(8) << std::setfill('0') << gen();
    std::filesystem::path candidate = tempRoot_ / ss.str();
    if (std::filesystem::create_directory(candidate, ec)) {
      dir = candidate;
      break;
    }
  }
  if (dir.empty()) {
    throw AcquisitionError("Cannot create a temporary directory under " +
                           tempRoot_.string());
  }

  TempArchive archive(dir, dir / filename);
  LOG_INFO("Downloading " + url);

  size_t lastDecile = 0;
  auto progress = [&](size_t cur, size_t tot) {
    if (tot == 0)
      return;
    size_t decile = cur * 10 / tot;
    if (decile != lastDecile) {
      lastDecile = decile;
      LOG_DEBUG(filename + ": " + std::to_string(decile * 10) + "%");
    }
  };

  bool ok = false;
  std::string reason;
  try {
    ok = http_.download(url, archive.path().string(), progress);
    if (!ok)
      reason = http_.lastError();
  } catch (const std::exception &e) {
    reason = e.what();
  }
  if (!ok) {
    throw AcquisitionError("Failed to download " + url +
                           (reason.empty() ? std::string() : ": " + reason));
  }

  LOG_INFO("Downloaded " + filename + " to " + archive.path().string());
  return archive;
}

} // namespace jdki
