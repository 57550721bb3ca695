#include "app.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "crawler.hpp"
#include "github_client.hpp"
#include "history_walker.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include "org_list.hpp"
#include "retrying_http_client.hpp"
#include "snapshot_decompress.hpp"
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace wfh {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

OutputLayout layout_from(const Config &cfg) {
  return OutputLayout(cfg.out_dir(), cfg.git_cache_dir());
}
} // namespace

/**
 * Execute the setup phase of the application.
 *
 * This routine orchestrates CLI parsing, configuration loading, logger
 * initialization and the checks that must pass before any organization is
 * processed.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero if execution should terminate with an
 *         error code.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
    if (!options_.out_dir.empty()) {
      config_.set_out_dir(options_.out_dir);
    }
    if (!options_.orgs_file.empty()) {
      config_.set_orgs_file(options_.orgs_file);
    }
    if (!options_.git_cache_dir.empty()) {
      config_.set_git_cache_dir(options_.git_cache_dir);
    }
    if (options_.keep_clone_explicit) {
      config_.set_keep_clone(options_.keep_clone);
    }
    if (options_.task_timeout_explicit) {
      config_.set_task_timeout(options_.task_timeout);
    }
    if (options_.workers > 0) {
      config_.set_max_workers(options_.workers);
    }
    if (options_.max_clones > 0) {
      config_.set_max_clones(options_.max_clones);
    }
    if (options_.log_every >= 0) {
      config_.set_log_every(options_.log_every);
    }
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }
  options_.verbose = options_.verbose || config_.verbose();
  if (!options_.log_rotate_explicit) {
    options_.log_rotate = config_.log_rotate();
  }
  if (!options_.log_compress_explicit) {
    options_.log_compress = config_.log_compress();
  }
  if (!options_.log_categories_explicit) {
    options_.log_categories = config_.log_categories();
  } else {
    config_.set_log_categories(options_.log_categories);
  }

  std::string level_str = options_.verbose ? "debug" : "info";
  if (options_.log_level_explicit) {
    level_str = options_.log_level;
  } else if (config_.log_level() != "info") {
    level_str = config_.log_level();
  }
  spdlog::level::level_enum lvl = spdlog::level::from_str(level_str);
  if (lvl == spdlog::level::off && level_str != "off") {
    app_log()->warn("Unknown log level '{}'; using info", level_str);
    lvl = spdlog::level::info;
  }
  std::string log_file = config_.log_file();
  if (!options_.log_file.empty()) {
    log_file = options_.log_file;
  }
  init_logger(lvl, config_.log_pattern(), log_file,
              static_cast<std::size_t>(options_.log_rotate),
              options_.log_compress);
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level] : options_.log_categories) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level, category);
      continue;
    }
    category_levels[category] = parsed;
  }
  configure_log_categories(category_levels);
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }

  token_ = !options_.token.empty() ? options_.token : config_.github_token();
  if (options_.command == Command::Crawl && token_.empty()) {
    app_log()->error("No GitHub token: pass --token, set GITHUB_TOKEN or add "
                     "github_token to the configuration");
    should_exit_ = true;
    return 2;
  }
  if (options_.command != Command::Decompress) {
    if (config_.orgs_file().empty()) {
      app_log()->error("No organizations file given");
      should_exit_ = true;
      return 2;
    }
    try {
      orgs_ = load_orgs_from_file(config_.orgs_file());
    } catch (const std::exception &e) {
      app_log()->error("Cannot read organizations file {}: {}",
                       config_.orgs_file(), e.what());
      should_exit_ = true;
      return 1;
    }
    if (orgs_.empty()) {
      app_log()->error("Organizations file {} lists no organization",
                       config_.orgs_file());
      should_exit_ = true;
      return 2;
    }
  }
  return 0;
}

int App::execute() {
  switch (options_.command) {
  case Command::Crawl:
    return run_crawl();
  case Command::Metrics:
    return run_metrics();
  case Command::Decompress:
    return run_decompress();
  }
  return 1;
}

int App::run_crawl() {
  RetryPolicy policy;
  policy.max_attempts = config_.max_attempts();
  policy.server_backoff = std::chrono::milliseconds(config_.server_backoff_ms());
  policy.secondary_backoff =
      std::chrono::milliseconds(config_.secondary_backoff_ms());
  policy.rate_limit_margin =
      std::chrono::milliseconds(config_.rate_limit_margin_ms());
  auto transport = std::make_unique<CurlHttpClient>(
      static_cast<long>(config_.http_timeout()) * 1000L);
  auto http =
      std::make_unique<RetryingHttpClient>(std::move(transport), policy);
  GitHubClient github(token_, std::move(http), config_.api_base(),
                      config_.per_page());

  OutputLayout layout = layout_from(config_);
  WalkerOptions walker_options;
  walker_options.workflow_workers = config_.workflow_workers();
  walker_options.layout = parse_snapshot_layout(config_.snapshot_layout());
  walker_options.compress_snapshots = config_.compress_snapshots();
  walker_options.git.binary = config_.git_binary();
  walker_options.git.token = token_;
  walker_options.git.command_timeout =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config_.git_timeout());
  HistoryWalker walker(layout, walker_options);

  CrawlOptions crawl_options;
  crawl_options.max_workers = config_.max_workers();
  crawl_options.max_clones = config_.max_clones();
  crawl_options.task_timeout =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config_.task_timeout());
  crawl_options.poll_interval =
      std::chrono::milliseconds(config_.poll_interval_ms());
  crawl_options.heartbeat_interval =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config_.heartbeat_interval());
  crawl_options.log_every = config_.log_every();
  crawl_options.keep_clone = config_.keep_clone();

  app_log()->info("Crawling {} organizations into {}", orgs_.size(),
                  config_.out_dir());
  Crawler crawler(github, walker, layout, crawl_options);
  CrawlReport report = crawler.run(orgs_);
  for (const auto &org : report.skipped_orgs) {
    app_log()->warn("Organization {} was skipped", org);
  }
  if (report.summaries.empty()) {
    app_log()->error("No organization could be listed");
    return 1;
  }
  return 0;
}

int App::run_metrics() {
  OutputLayout layout = layout_from(config_);
  int rc = 0;
  for (const auto &org : orgs_) {
    try {
      write_summary(layout, refresh_summary(layout, org));
    } catch (const std::exception &e) {
      app_log()->error("Summarizing {} failed: {}", org, e.what());
      rc = 1;
    }
  }
  return rc;
}

int App::run_decompress() {
  std::filesystem::path root = options_.decompress_root;
  if (root.empty()) {
    root = std::filesystem::path(config_.out_dir()) / "raw";
  }
  try {
    DecompressStats stats = decompress_snapshots(root, options_.keep_original,
                                                 options_.decompress_workers);
    return stats.failed == 0 ? 0 : 1;
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
}

} // namespace wfh
