/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for workflowharvest.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef WORKFLOWHARVEST_CLI_HPP
#define WORKFLOWHARVEST_CLI_HPP

#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>

namespace wfh {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /**
   * Retrieve the exit code that triggered the exception.
   *
   * @return Numeric process exit code.
   */
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Subcommand selected on the command line.
enum class Command { Crawl, Metrics, Decompress };

/**
 * Parsed command line options supplied via the CLI.
 *
 * `*_explicit` members record whether a value came from the command line so
 * that configuration file values are only overridden when requested.
 */
struct CliOptions {
  Command command{Command::Crawl};

  bool verbose{false};     ///< Enable debug logging
  std::string config_file; ///< Path to configuration file
  std::string token;       ///< `--token`, or `GITHUB_TOKEN` when unset

  std::string log_level{"info"}; ///< Logging verbosity
  bool log_level_explicit{false};
  std::string log_file; ///< Rotating log file path
  int log_rotate{3};    ///< Rotated files to retain
  bool log_rotate_explicit{false};
  bool log_compress{false}; ///< Gzip rotated log files
  bool log_compress_explicit{false};
  std::unordered_map<std::string, std::string> log_categories;
  bool log_categories_explicit{false};

  std::string orgs_file; ///< Organizations to crawl or summarize
  std::string out_dir;   ///< Dataset root; empty keeps the configured one

  // crawl
  std::string git_cache_dir; ///< Clone cache override
  bool keep_clone{true};
  bool keep_clone_explicit{false};
  std::chrono::seconds task_timeout{0};
  bool task_timeout_explicit{false};
  int workers{0};     ///< Job threads; zero keeps the configured value
  int max_clones{0};  ///< Clone permits; zero keeps the configured value
  int log_every{-1};  ///< Progress spacing; negative keeps the configured one

  // decompress
  std::string decompress_root; ///< Empty means `<out_dir>/raw`
  bool keep_original{false};
  int decompress_workers{4};
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * Without a subcommand, `crawl` is assumed when `--orgs-file` is given.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit For `--help`, `--version` and invalid arguments; the
 *         exit code is zero only for the former two.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace wfh

#endif // WORKFLOWHARVEST_CLI_HPP
