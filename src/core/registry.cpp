#ifdef _WIN32

#include "jdki/environment.hpp"
#include "jdki/errors.hpp"
#include "jdki/logger.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

namespace jdki {

namespace {

const wchar_t *kEnvironmentKey =
    L"SYSTEM\\CurrentControlSet\\Control\\Session Manager\\Environment";

std::wstring widen(const std::string &s) {
  if (s.empty())
    return std::wstring();
  int len = MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), nullptr, 0);
  std::wstring out(len, L'\0');
  MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), out.data(), len);
  return out;
}

std::string narrow(const std::wstring &s) {
  if (s.empty())
    return std::string();
  int len = WideCharToMultiByte(CP_UTF8, 0, s.data(), (int)s.size(), nullptr, 0,
                                nullptr, nullptr);
  std::string out(len, '\0');
  WideCharToMultiByte(CP_UTF8, 0, s.data(), (int)s.size(), out.data(), len,
                      nullptr, nullptr);
  return out;
}

} // namespace

std::optional<std::string>
RegistryEnvironment::get(const std::string &name) const {
  HKEY hKey = nullptr;
  LONG r = RegOpenKeyExW(HKEY_LOCAL_MACHINE, kEnvironmentKey, 0, KEY_READ, &hKey);
  if (r != ERROR_SUCCESS) {
    throw EnvironmentError("Cannot open machine environment key (error " +
                           std::to_string((int)r) + ")");
  }

  std::wstring wname = widen(name);
  DWORD type = 0;
  DWORD bytes = 0;
  r = RegQueryValueExW(hKey, wname.c_str(), nullptr, &type, nullptr, &bytes);
  if (r == ERROR_FILE_NOT_FOUND) {
    RegCloseKey(hKey);
    return std::nullopt;
  }

  // Values are read raw, so %VAR% references stay unexpanded. The value can
  // grow between the size query and the read; retry with the new size.
  std::wstring buf;
  for (int attempt = 0;
       attempt < 4 && (r == ERROR_SUCCESS || r == ERROR_MORE_DATA); ++attempt) {
    buf.assign(bytes / sizeof(wchar_t) + 1, L'\0');
    DWORD capacity = (DWORD)(buf.size() * sizeof(wchar_t));
    r = RegQueryValueExW(hKey, wname.c_str(), nullptr, &type,
                         (LPBYTE)buf.data(), &capacity);
    if (r == ERROR_SUCCESS) {
      bytes = capacity;
      break;
    }
    if (r == ERROR_MORE_DATA)
      bytes = capacity;
  }
  RegCloseKey(hKey);

  if (r == ERROR_FILE_NOT_FOUND)
    return std::nullopt;
  if (r != ERROR_SUCCESS) {
    throw EnvironmentError("Cannot read " + name + " (error " +
                           std::to_string((int)r) + ")");
  }
  if (type != REG_SZ && type != REG_EXPAND_SZ) {
    throw EnvironmentError(name + " is not a string value (registry type " +
                           std::to_string((int)type) + ")");
  }

  buf.resize(bytes / sizeof(wchar_t));
  while (!buf.empty() && buf.back() == L'\0')
    buf.pop_back();
  return narrow(buf);
}

void RegistryEnvironment::set(const std::string &name, const std::string &value) {
  HKEY hKey = nullptr;
  LONG r = RegOpenKeyExW(HKEY_LOCAL_MACHINE, kEnvironmentKey, 0, KEY_SET_VALUE,
                         &hKey);
  if (r != ERROR_SUCCESS) {
    throw EnvironmentError("Cannot open machine environment for writing (error " +
                           std::to_string((int)r) +
                           "); run from an elevated prompt");
  }

  std::wstring wname = widen(name);
  std::wstring wvalue = widen(value);
  DWORD type = (value.find('%') != std::string::npos) ? REG_EXPAND_SZ : REG_SZ;
  if (_wcsicmp(wname.c_str(), L"Path") == 0)
    type = REG_EXPAND_SZ;

  r = RegSetValueExW(hKey, wname.c_str(), 0, type, (const BYTE *)wvalue.c_str(),
                     (DWORD)((wvalue.size() + 1) * sizeof(wchar_t)));
  RegCloseKey(hKey);
  if (r != ERROR_SUCCESS) {
    throw EnvironmentError("Failed to write " + name + " (error " +
                           std::to_string((int)r) + ")");
  }

  broadcastChange();
}

void RegistryEnvironment::broadcastChange() const {
  DWORD_PTR result = 0;
  if (!SendMessageTimeoutW(HWND_BROADCAST, WM_SETTINGCHANGE, 0,
                           (LPARAM)L"Environment", SMTO_ABORTIFHUNG, 5000,
                           &result)) {
    LOG_WARN("Environment change broadcast timed out");
  }
}

} // namespace jdki

#endif // _WIN32
