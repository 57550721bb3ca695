/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for workflowharvest.
 *
 * Declares the App class, which manages high-level application flow,
 * configuration loading, and CLI parsing.
 */

#ifndef WORKFLOWHARVEST_APP_HPP
#define WORKFLOWHARVEST_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include <string>
#include <vector>

namespace wfh {

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * Parse the command line, load the configuration and set up logging.
   *
   * Command line values override configuration values. Fatal problems
   * (invalid arguments, unreadable configuration or organizations file,
   * missing token for `crawl`) are reported here.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  /**
   * Execute the selected subcommand. Call after run() returned zero and
   * should_exit() is false.
   *
   * @return Process exit code.
   */
  int execute();

  /**
   * Retrieve the parsed command line options.
   *
   * @return Immutable reference to the populated CLI options structure.
   */
  const CliOptions &options() const { return options_; }

  /**
   * Retrieve the effective configuration (file values with command line
   * overrides applied).
   */
  const Config &config() const { return config_; }

  /// Token resolved from `--token`, `GITHUB_TOKEN` or the configuration.
  const std::string &token() const { return token_; }

  /// Organizations loaded from the organizations file.
  const std::vector<std::string> &orgs() const { return orgs_; }

  /**
   * Determine whether the application should exit immediately after
   * `run()` completes.
   *
   * @return `true` if the application should terminate, otherwise `false`.
   */
  bool should_exit() const { return should_exit_; }

private:
  int run_crawl();
  int run_metrics();
  int run_decompress();

  CliOptions options_;
  Config config_;
  std::string token_;
  std::vector<std::string> orgs_;
  bool should_exit_{false};
};

} // namespace wfh

#endif // WORKFLOWHARVEST_APP_HPP
