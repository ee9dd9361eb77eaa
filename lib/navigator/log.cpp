/**
 * @file log.cpp
 * @brief File logger setup and teardown
 */

#include "log.hpp"
#include "config.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace {
const char *LOGGER_NAME = "treeseek";
}

bool initLogging(const Config &config) {
  const std::filesystem::path &logFile = config.logFile();

  std::error_code ec;
  if (logFile.has_parent_path()) {
    std::filesystem::create_directories(logFile.parent_path(), ec);
  }

  try {
    auto logger = spdlog::basic_logger_mt(LOGGER_NAME, logFile.string());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
    logger->set_level(spdlog::level::from_str(config.logLevel()));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex &) {
    spdlog::set_level(spdlog::level::off);
    return false;
  }

  spdlog::info("treeseek started, cache capacity {}", config.cacheCapacity());
  return true;
}

void shutdownLogging() {
  spdlog::info("treeseek stopped");
  spdlog::shutdown();
}
