/**
 * @file config.cpp
 * @brief Implementation of Config
 */

#include "config.hpp"
#include "browsererror.hpp"
#include "directorycache.hpp"
#include "filepreview.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string &text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return std::string();
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

/** @brief $name if set and non-empty, otherwise $HOME/fallback */
fs::path xdgDirectory(const char *name, const char *fallback) {
  const char *xdg = std::getenv(name);
  if (xdg != nullptr && *xdg != '\0') {
    return fs::path(xdg);
  }
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return fs::path();
  }
  return fs::path(home) / fallback;
}

} // namespace

Config::Config()
    : m_cacheCapacity(DirectoryCache::DEFAULT_CAPACITY),
      m_maxPreviewBytes(FilePreview::DEFAULT_MAX_BYTES),
      m_logFile(defaultLogPath()) {
  std::error_code ec;
  m_startDirectory = fs::current_path(ec);
  if (ec) {
    m_startDirectory = "/";
  }
}

fs::path Config::defaultConfigPath() {
  fs::path dir = xdgDirectory("XDG_CONFIG_HOME", ".config");
  if (dir.empty()) {
    return fs::path("treeseek.ini");
  }
  return dir / "treeseek" / "config.ini";
}

fs::path Config::defaultLogPath() {
  fs::path dir = xdgDirectory("XDG_CACHE_HOME", ".cache");
  if (dir.empty()) {
    return fs::path("treeseek.log");
  }
  return dir / "treeseek" / "treeseek.log";
}

std::string Config::usage(const std::string &program) {
  return "Usage: " + program +
         " [-p DIR] [--cache-size N] [--log-level LEVEL] [--log-file FILE]\n"
         "  -p, --path DIR       start directory (default: current directory)\n"
         "  --cache-size N       number of folders kept in history (default: 100)\n"
         "  --log-level LEVEL    trace, debug, info, warn, error, critical, off\n"
         "  --log-file FILE      where to write the log\n"
         "  -h, --help           show this help\n";
}

void Config::load() {
  const fs::path path = defaultConfigPath();

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return;
  }
  if (!loadFromFile(path)) {
    spdlog::warn("Config: unable to read {}", path.string());
  }
}

bool Config::loadFromFile(const fs::path &path) {
  std::ifstream file(path);
  if (!file) {
    return false;
  }

  std::string line;
  while (std::getline(file, line)) {
    parseLine(line);
  }
  return true;
}

std::optional<std::uintmax_t> Config::parseUnsigned(const std::string &text) {
  if (text.empty()) {
    return std::nullopt;
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }

  try {
    return static_cast<std::uintmax_t>(std::stoull(text));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

bool Config::isKnownLogLevel(const std::string &level) {
  return level == "off" ||
         spdlog::level::from_str(level) != spdlog::level::off;
}

void Config::parseLine(const std::string &line) {
  const std::string trimmed = trim(line);
  if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
    return;
  }

  const auto pos = trimmed.find('=');
  if (pos == std::string::npos) {
    return;
  }

  const std::string key = trim(trimmed.substr(0, pos));
  const std::string value = trim(trimmed.substr(pos + 1));

  if (key == "cache_size") {
    auto parsed = parseUnsigned(value);
    if (!parsed || *parsed == 0) {
      spdlog::warn("Config: ignoring invalid cache_size '{}'", value);
      return;
    }
    m_cacheCapacity = static_cast<std::size_t>(*parsed);
  } else if (key == "max_preview_bytes") {
    auto parsed = parseUnsigned(value);
    if (!parsed) {
      spdlog::warn("Config: ignoring invalid max_preview_bytes '{}'", value);
      return;
    }
    m_maxPreviewBytes = *parsed;
  } else if (key == "log_level") {
    if (!isKnownLogLevel(value)) {
      spdlog::warn("Config: ignoring unknown log_level '{}'", value);
      return;
    }
    m_logLevel = value;
  } else if (key == "log_file") {
    if (!value.empty()) {
      m_logFile = value;
    }
  } else if (key == "start_directory") {
    if (!value.empty()) {
      m_startDirectory = value;
    }
  }
}

void Config::applyArguments(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      m_helpRequested = true;
      continue;
    }

    const bool takesValue = arg == "-p" || arg == "--path" ||
                            arg == "--cache-size" || arg == "--log-level" ||
                            arg == "--log-file";
    if (!takesValue) {
      throw BrowserError(ErrorKind::Parse, "unknown option " + arg);
    }
    if (i + 1 >= argc) {
      throw BrowserError(ErrorKind::Parse, "missing value for " + arg);
    }

    if (arg == "-p" || arg == "--path") {
      m_startDirectory = argv[++i];
    } else if (arg == "--cache-size") {
      const std::string value = argv[++i];
      auto parsed = parseUnsigned(value);
      if (!parsed || *parsed == 0) {
        throw BrowserError(ErrorKind::Parse,
                           "cache size must be a positive number, got '" +
                               value + "'");
      }
      m_cacheCapacity = static_cast<std::size_t>(*parsed);
    } else if (arg == "--log-level") {
      const std::string value = argv[++i];
      if (!isKnownLogLevel(value)) {
        throw BrowserError(ErrorKind::Parse, "unknown log level '" + value + "'");
      }
      m_logLevel = value;
    } else {
      m_logFile = argv[++i];
    }
  }
}
