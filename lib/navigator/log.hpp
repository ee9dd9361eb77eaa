/**
 * @file log.hpp
 * @brief Logging setup for treeseek
 *
 * Library code logs through spdlog's default logger (spdlog::info, ...).
 * The interactive frontend owns the terminal, so initLogging() points the
 * default logger at a file instead of the console.
 *
 * Usage:
 * @code
 * Config config;
 * config.load();
 * initLogging(config);
 * spdlog::info("Entered {}", dir.string());
 * shutdownLogging();
 * @endcode
 */

#ifndef LOG_HPP
#define LOG_HPP

class Config;

/**
 * @brief Installs a file logger as the default logger
 *
 * Creates the log file's directory if needed. When the file cannot be
 * opened, the default logger is silenced (level off) so nothing leaks onto
 * the terminal.
 *
 * @return true if the file logger is active
 */
bool initLogging(const Config &config);

/** @brief Flushes and drops every logger */
void shutdownLogging();

#endif // LOG_HPP
