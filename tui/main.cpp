#include "browsererror.hpp"
#include "browsersession.hpp"
#include "config.hpp"
#include "filebrowserui.hpp"
#include "log.hpp"

#include <iostream>

#include <spdlog/spdlog.h>

int main(int argc, char *argv[]) {
  Config config;
  try {
    config.load();
    config.applyArguments(argc, argv);
  } catch (const BrowserError &e) {
    std::cerr << e.what() << "\n" << Config::usage(argv[0]);
    return 1;
  }

  if (config.helpRequested()) {
    std::cout << Config::usage(argv[0]);
    return 0;
  }

  initLogging(config);

  int exitCode = 0;
  try {
    BrowserSession session(config);
    FileBrowserUI ui(session);
    ui.initialize();
    ui.run();
  } catch (const std::exception &e) {
    // Terminal is already restored at this point
    spdlog::critical("{}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    exitCode = 1;
  }

  shutdownLogging();
  return exitCode;
}
