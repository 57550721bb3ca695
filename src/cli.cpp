#include "cli.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace wfh {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 13> categories = {
      "app",     "cli",    "config", "crawler", "decompress",
      "git",     "github.client", "history", "http",    "logging",
      "metrics", "orgs",   "pool"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., git=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

std::string get_env_var(const char *name) {
  const char *value = std::getenv(name);
  return value != nullptr ? std::string(value) : std::string{};
}

} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"workflowharvest: collect the history of GitHub workflow "
               "files across organizations"};
  app.footer(log_category_help_text());
  app.fallthrough();
  app.require_subcommand(0, 1);
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "workflowharvest " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option("--token", options.token,
                 "GitHub token (defaults to $GITHUB_TOKEN, then the "
                 "configuration file)")
      ->type_name("TOKEN")
      ->group("General");
  app.add_option("--orgs-file", options.orgs_file,
                 "File listing organization logins")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_option("--out-dir", options.out_dir, "Dataset root directory")
      ->type_name("DIR")
      ->group("General");

  auto *log_level_option =
      app.add_option(
             "--log-level", options.log_level,
             "Set logging level (trace, debug, info, warn, error, critical, "
             "off)")
          ->type_name("LEVEL")
          ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning",
                                 "error", "critical", "off"}))
          ->group("Logging");
  app.add_option("--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  auto *log_compress_flag =
      app.add_flag("--log-compress", options.log_compress,
                   "Compress rotated log files with gzip")
          ->group("Logging");
  std::vector<std::string> log_category_values;
  auto *log_category_option =
      app.add_option("--log-category", log_category_values,
                     "Enable a logging category (NAME or NAME=LEVEL). See "
                     "help footer for available categories.")
          ->type_name("NAME[=LEVEL]")
          ->allow_extra_args(false)
          ->group("Logging");

  CLI::App *crawl =
      app.add_subcommand("crawl", "Collect workflow histories of every "
                                  "organization in --orgs-file");
  crawl->add_option("--git-cache-dir", options.git_cache_dir,
                    "Directory for bare clones (default: "
                    "<out-dir>/.cache/git)")
      ->type_name("DIR");
  auto *keep_clone_flag = crawl->add_flag(
      "--keep-clone,!--no-keep-clone", options.keep_clone,
      "Keep (or delete) each clone after its repository is processed");
  std::string task_timeout_str;
  auto *task_timeout_option =
      crawl->add_option("--task-timeout", task_timeout_str,
                        "Limit per repository, e.g. 30m or 1h (bare numbers "
                        "are seconds)")
          ->type_name("DURATION");
  crawl->add_option("--workers", options.workers,
                    "Threads running repository jobs")
      ->type_name("N")
      ->check(CLI::PositiveNumber);
  crawl->add_option("--max-clones", options.max_clones,
                    "Repositories cloned and walked at once")
      ->type_name("N")
      ->check(CLI::PositiveNumber);
  crawl->add_option("--log-every", options.log_every,
                    "Log progress every N repositories")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber);

  CLI::App *metrics = app.add_subcommand(
      "metrics", "Recompute run summaries from the index tree");

  CLI::App *decompress = app.add_subcommand(
      "decompress", "Convert gzip compressed snapshots to plain files");
  decompress
      ->add_option("--root", options.decompress_root,
                   "Directory to scan (default: <out-dir>/raw)")
      ->type_name("DIR");
  decompress->add_flag("--keep-original", options.keep_original,
                       "Keep the .yml.gz files");
  decompress
      ->add_option("--workers", options.decompress_workers,
                   "Files processed in parallel")
      ->type_name("N")
      ->check(CLI::PositiveNumber);

  try {
    app.parse(argc, argv);
    if (*crawl) {
      options.command = Command::Crawl;
    } else if (*metrics) {
      options.command = Command::Metrics;
    } else if (*decompress) {
      options.command = Command::Decompress;
    } else if (!options.orgs_file.empty()) {
      options.command = Command::Crawl;
    } else {
      throw CLI::RequiredError("A subcommand (crawl, metrics, decompress)");
    }
    if ((options.command == Command::Crawl ||
         options.command == Command::Metrics) &&
        options.orgs_file.empty()) {
      throw CLI::RequiredError("--orgs-file");
    }
    for (const auto &value : log_category_values) {
      auto pos = value.find('=');
      std::string name =
          pos == std::string::npos ? value : value.substr(0, pos);
      std::string level = pos == std::string::npos ? std::string{"debug"}
                                                   : value.substr(pos + 1);
      if (name.empty()) {
        throw CLI::ValidationError("--log-category",
                                   "category name must not be empty");
      }
      options.log_categories[name] = level.empty() ? "debug" : level;
    }
    options.log_categories_explicit = log_category_option->count() > 0U;
    if (task_timeout_option->count() > 0U) {
      try {
        options.task_timeout = parse_duration(task_timeout_str);
      } catch (const std::exception &e) {
        throw CLI::ValidationError("--task-timeout", e.what());
      }
      if (options.task_timeout.count() <= 0) {
        throw CLI::ValidationError("--task-timeout", "must be positive");
      }
      options.task_timeout_explicit = true;
    }
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  options.log_level_explicit = log_level_option->count() > 0U;
  options.log_compress_explicit = log_compress_flag->count() > 0U;
  options.keep_clone_explicit = keep_clone_flag->count() > 0U;
  if (options.token.empty()) {
    options.token = get_env_var("GITHUB_TOKEN");
  }
  cli_log()->debug("Parsed command line ({} arguments)", argc);
  return options;
}

} // namespace wfh
