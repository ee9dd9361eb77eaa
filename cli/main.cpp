#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "browsererror.hpp"
#include "config.hpp"
#include "filesystemreader.hpp"
#include "log.hpp"
#include "navigationengine.hpp"
#include "navigationstate.hpp"

#include <spdlog/spdlog.h>

/**
 * @class Application
 * @brief Non-interactive listing of a directory through the navigation engine
 *
 * Prints what the interactive browser would show for a start directory:
 * the selected rows after applying an optional expand depth and filter,
 * one per line, directories suffixed with '/'.
 *
 * Usage
 *  - run(startPath, filter, levels)
 *      @param startPath  Directory to list.
 *      @param filter     Fuzzy filter applied to the rows (may be empty).
 *      @param levels     Number of expand steps applied before filtering.
 *      @note BrowserError propagates to the caller.
 *
 * Because the engine is used as is, rows are relative to the start
 * directory and ".." is listed unless the start directory is the root.
 */
class Application {
private:
  const Config &m_config;

public:
  explicit Application(const Config &config) : m_config(config) {}

  void run(const std::filesystem::path &startPath, const std::string &filter,
           unsigned int levels) {
    NavigationState state;
    state.toSearch();
    FilesystemReader reader;
    NavigationEngine engine(state, reader, startPath,
                            m_config.cacheCapacity());

    for (unsigned int i = 0; i < levels; ++i) {
      engine.expand();
    }
    engine.update(filter);

    for (const auto &entry : engine.selected()) {
      std::cout << engine.displayText(entry) << (entry.isFile() ? "" : "/")
                << '\n';
    }
    spdlog::info("Listed {} rows of {}", engine.selected().size(),
                 engine.currentDirectory().string());
  }
};

namespace {

void printUsage(const char *program) {
  std::cout << "Usage: " << program
            << " [-p directory] [-f filter] [-e levels]\n"
               "  -p, --path DIR      directory to list (default: current)\n"
               "  -f, --filter TEXT   fuzzy filter over the listed rows\n"
               "  -e, --expand N      flatten N directory levels\n";
}

} // namespace

int main(int argc, char *argv[]) {
  Config config;
  config.load();

  std::filesystem::path startPath = config.startDirectory();
  std::string filter;
  unsigned int levels = 0;

  // Einfacher Argument-Parser
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    }

    if (i + 1 >= argc) {
      std::cerr << "Missing or unknown argument: " << arg << std::endl;
      printUsage(argv[0]);
      return 1;
    }

    if (arg == "-p" || arg == "--path") {
      startPath = argv[++i];
    } else if (arg == "-f" || arg == "--filter") {
      filter = argv[++i];
    } else if (arg == "-e" || arg == "--expand") {
      const char *value = argv[++i];
      char *end = nullptr;
      const long parsed = std::strtol(value, &end, 10);
      if (end == value || *end != '\0' || parsed < 0 || parsed > 64) {
        std::cerr << "Invalid expand level: " << value << std::endl;
        return 1;
      }
      levels = static_cast<unsigned int>(parsed);
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      printUsage(argv[0]);
      return 1;
    }
  }

  initLogging(config);

  int exitCode = 0;
  try {
    Application app(config);
    app.run(startPath, filter, levels);
  } catch (const BrowserError &e) {
    spdlog::error("{}", e.what());
    std::cerr << e.what() << std::endl;
    exitCode = 1;
  }

  shutdownLogging();
  return exitCode;
}
