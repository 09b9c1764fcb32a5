#ifndef JDKI_ENVIRONMENT_HPP
#define JDKI_ENVIRONMENT_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace jdki {

#ifdef _WIN32
constexpr char kPathListSeparator = ';';
#else
constexpr char kPathListSeparator = ':';
#endif

// Machine-scoped variable store. get() returns nullopt only when the
// variable is absent; a store that cannot be read throws EnvironmentError,
// as does a failed set().
class EnvironmentStore {
public:
  virtual ~EnvironmentStore() = default;

  virtual std::optional<std::string> get(const std::string &name) const = 0;
  virtual void set(const std::string &name, const std::string &value) = 0;
};

#ifdef _WIN32
// HKLM\SYSTEM\CurrentControlSet\Control\Session Manager\Environment.
// Writes need an elevated process.
class RegistryEnvironment : public EnvironmentStore {
public:
  std::optional<std::string> get(const std::string &name) const override;
  void set(const std::string &name, const std::string &value) override;

private:
  void broadcastChange() const;
};
#else
// KEY="value" lines as read by pam_env, e.g. /etc/environment. A missing
// file holds no variables.
class FileEnvironment : public EnvironmentStore {
public:
  explicit FileEnvironment(std::filesystem::path file);

  std::optional<std::string> get(const std::string &name) const override;
  void set(const std::string &name, const std::string &value) override;

  const std::filesystem::path &file() const { return file_; }

private:
  std::vector<std::string> readLines() const;
  static bool parseLine(const std::string &line, std::string &key,
                        std::string &value);

  std::filesystem::path file_;
};
#endif

struct EnvironmentUpdate {
  bool homeChanged = false;
  bool pathChanged = false;
};

class EnvironmentConfigurator {
public:
  EnvironmentConfigurator(EnvironmentStore &store, std::string homeVariable,
                          std::string pathVariable,
                          char separator = kPathListSeparator);

  // Sets the home variable and appends installRoot to PATH, skipping each
  // write that would not change anything. The two writes are independent.
  EnvironmentUpdate applyPathUpdate(const std::string &installRoot);

  static bool containsSegment(const std::string &pathList,
                              const std::string &segment, char separator);
  static bool sameDirectory(const std::string &a, const std::string &b);

private:
  EnvironmentStore &store_;
  std::string homeVariable_;
  std::string pathVariable_;
  char separator_;
};

} // namespace jdki

#endif // JDKI_ENVIRONMENT_HPP
