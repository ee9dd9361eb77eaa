/**
 * @file config.hpp
 * @brief Runtime settings of treeseek
 *
 * Settings come from three layers, later ones winning:
 * 1. built-in defaults
 * 2. $XDG_CONFIG_HOME/treeseek/config.ini (or ~/.config/treeseek/config.ini)
 * 3. command-line flags
 *
 * config.ini format:
 * @code
 * # comment
 * cache_size = 100
 * max_preview_bytes = 10485760
 * log_level = info
 * log_file = /tmp/treeseek.log
 * start_directory = /home/user/src
 * @endcode
 *
 * The file is only read, never written.
 */

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

class Config {
private:
  std::size_t m_cacheCapacity;
  std::uintmax_t m_maxPreviewBytes;
  std::string m_logLevel = "info";
  std::filesystem::path m_logFile;
  std::filesystem::path m_startDirectory;
  bool m_helpRequested = false;

  /** @brief Digits-only unsigned parse; std::nullopt on anything else */
  static std::optional<std::uintmax_t> parseUnsigned(const std::string &text);

  static bool isKnownLogLevel(const std::string &level);

public:
  /**
   * @brief Builds the defaults
   *
   * Does not read any file; call load() for that.
   */
  Config();

  /** @brief Location of config.ini following the XDG base directory rules */
  static std::filesystem::path defaultConfigPath();

  /** @brief Default log file under the XDG cache directory */
  static std::filesystem::path defaultLogPath();

  /** @brief Text printed for -h/--help */
  static std::string usage(const std::string &program);

  /**
   * @brief Reads defaultConfigPath() if it exists
   */
  void load();

  /**
   * @brief Reads settings from @p path
   * @return false if the file could not be opened
   */
  bool loadFromFile(const std::filesystem::path &path);

  /**
   * @brief Applies one "key = value" line
   *
   * Empty lines, '#'/';' comments, lines without '=' and unknown keys are
   * ignored. Invalid values are ignored with a warning and keep the previous
   * setting.
   */
  void parseLine(const std::string &line);

  /**
   * @brief Overrides settings from command-line flags
   *
   * Recognized: -p/--path DIR, --cache-size N, --log-level LEVEL,
   * --log-file FILE, -h/--help.
   *
   * @throws BrowserError (Parse) on unknown flags, missing or invalid values
   */
  void applyArguments(int argc, char *argv[]);

  std::size_t cacheCapacity() const { return m_cacheCapacity; }
  std::uintmax_t maxPreviewBytes() const { return m_maxPreviewBytes; }
  const std::string &logLevel() const { return m_logLevel; }
  const std::filesystem::path &logFile() const { return m_logFile; }
  const std::filesystem::path &startDirectory() const {
    return m_startDirectory;
  }
  bool helpRequested() const { return m_helpRequested; }
};

#endif // CONFIG_HPP
