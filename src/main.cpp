#include "app.hpp"
#include "log.hpp"

#include <exception>
#include <spdlog/spdlog.h>

/**
 * Program entry point: set up the application, then run the selected
 * subcommand.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  wfh::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    spdlog::shutdown();
    return ret;
  }
  try {
    ret = app.execute();
  } catch (const std::exception &e) {
    wfh::category_logger("app")->critical("Fatal error: {}", e.what());
    ret = 1;
  }
  spdlog::shutdown();
  return ret;
}
