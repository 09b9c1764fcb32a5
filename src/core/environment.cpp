#include "jdki/environment.hpp"
#include "jdki/errors.hpp"
#include "jdki/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
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

std::string normalizeDirectory(const std::string &dir) {
  std::string out = trim(dir);
  while (out.size() > 1 && (out.back() == '/' || out.back() == '\\'))
    out.pop_back();
#ifdef _WIN32
  for (auto &c : out) {
    c = (c == '/') ? '\\' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
#endif
  return out;
}

} // namespace

EnvironmentConfigurator::EnvironmentConfigurator(EnvironmentStore &store,
                                                 std::string homeVariable,
                                                 std::string pathVariable,
                                                 char separator)
    : store_(store), homeVariable_(std::move(homeVariable)),
      pathVariable_(std::move(pathVariable)), separator_(separator) {}

bool EnvironmentConfigurator::sameDirectory(const std::string &a,
                                            const std::string &b) {
  return normalizeDirectory(a) == normalizeDirectory(b);
}

bool EnvironmentConfigurator::containsSegment(const std::string &pathList,
                                              const std::string &segment,
                                              char separator) {
  size_t start = 0;
  while (start <= pathList.size()) {
    size_t end = pathList.find(separator, start);
    if (end == std::string::npos)
      end = pathList.size();
    std::string entry = pathList.substr(start, end - start);
    if (!trim(entry).empty() && sameDirectory(entry, segment))
      return true;
    start = end + 1;
  }
  return false;
}

EnvironmentUpdate
EnvironmentConfigurator::applyPathUpdate(const std::string &installRoot) {
  EnvironmentUpdate update;
  std::vector<std::string> failures;

  // A variable that cannot be read is never written.
  try {
    auto home = store_.get(homeVariable_);
    if (home && sameDirectory(*home, installRoot)) {
      LOG_INFO(homeVariable_ + " already set to " + installRoot);
    } else {
      store_.set(homeVariable_, installRoot);
      update.homeChanged = true;
      LOG_INFO("Set " + homeVariable_ + " to " + installRoot);
    }
  } catch (const std::exception &e) {
    failures.push_back(e.what());
  }

  try {
    std::string path = store_.get(pathVariable_).value_or("");
    if (containsSegment(path, installRoot, separator_)) {
      LOG_INFO(pathVariable_ + " already contains " + installRoot);
    } else {
      std::string updated = path;
      if (!updated.empty() && updated.back() != separator_)
        updated += separator_;
      updated += installRoot;
      store_.set(pathVariable_, updated);
      update.pathChanged = true;
      LOG_INFO("Appended " + installRoot + " to " + pathVariable_);
    }
  } catch (const std::exception &e) {
    failures.push_back(e.what());
  }

  if (!failures.empty()) {
    std::string msg = "Environment update incomplete";
    for (const auto &f : failures)
      msg += "; " + f;
    throw EnvironmentError(msg);
  }
  return update;
}

#ifndef _WIN32

FileEnvironment::FileEnvironment(std::filesystem::path file)
    : file_(std::move(file)) {}

bool FileEnvironment::parseLine(const std::string &line, std::string &key,
                                std::string &value) {
  std::string s = trim(line);
  if (s.empty() || s[0] == '#')
    return false;
  if (s.rfind("export ", 0) == 0)
    s = trim(s.substr(7));

  auto eq = s.find('=');
  if (eq == std::string::npos || eq == 0)
    return false;

  key = trim(s.substr(0, eq));
  value = trim(s.substr(eq + 1));
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    value = value.substr(1, value.size() - 2);
  }
  return true;
}

std::vector<std::string> FileEnvironment::readLines() const {
  std::vector<std::string> lines;
  std::error_code ec;
  auto status = std::filesystem::status(file_, ec);
  if (status.type() == std::filesystem::file_type::not_found)
    return lines;
  if (ec) {
    throw EnvironmentError("Cannot stat " + file_.string() + ": " +
                           ec.message());
  }
  if (!std::filesystem::is_regular_file(status)) {
    throw EnvironmentError("Cannot read " + file_.string() +
                           ": not a regular file");
  }

  std::ifstream in(file_);
  if (!in)
    throw EnvironmentError("Cannot open " + file_.string() + " for reading");
  std::string line;
  while (std::getline(in, line))
    lines.push_back(line);
  if (in.bad())
    throw EnvironmentError("Error while reading " + file_.string());
  return lines;
}

std::optional<std::string> FileEnvironment::get(const std::string &name) const {
  std::optional<std::string> found;
  for (const auto &line : readLines()) {
    std::string key, value;
    if (parseLine(line, key, value) && key == name)
      found = value;
  }
  return found;
}

void FileEnvironment::set(const std::string &name, const std::string &value) {
  if (value.find_first_of("\"\n") != std::string::npos) {
    throw EnvironmentError("Refusing to write " + name +
                           ": value contains a quote or newline");
  }

  std::string entry = name + "=\"" + value + "\"";
  std::vector<std::string> out;
  bool replaced = false;
  for (const auto &line : readLines()) {
    std::string key, current;
    if (parseLine(line, key, current) && key == name) {
      if (!replaced) {
        out.push_back(entry);
        replaced = true;
      }
      continue;
    }
    out.push_back(line);
  }
  if (!replaced)
    out.push_back(entry);

  std::filesystem::path tmp = file_;
  tmp += ".jdki.tmp";
  {
    std::ofstream ofs(tmp, std::ios::trunc);
    if (!ofs)
      throw EnvironmentError("Cannot write " + tmp.string());
    for (const auto &line : out)
      ofs << line << "\n";
    ofs.close();
    if (!ofs)
      throw EnvironmentError("Cannot write " + tmp.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp, file_, ec);
  if (ec) {
    std::string reason = ec.message();
    std::filesystem::remove(tmp, ec);
    throw EnvironmentError("Cannot replace " + file_.string() + ": " + reason);
  }
}

#endif

} // namespace jdki
