/**
 * @file config.hpp
 * @brief Crawl configuration loaded from YAML, TOML or JSON files.
 */
#ifndef WORKFLOWHARVEST_CONFIG_HPP
#define WORKFLOWHARVEST_CONFIG_HPP

#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>

namespace wfh {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// Root of the dataset.
  const std::string &out_dir() const { return out_dir_; }

  /// Set the dataset root.
  void set_out_dir(const std::string &dir) { out_dir_ = dir; }

  /// Directory holding bare clones; empty means `<out_dir>/.cache/git`.
  const std::string &git_cache_dir() const { return git_cache_dir_; }

  /// Set the clone cache directory.
  void set_git_cache_dir(const std::string &dir) { git_cache_dir_ = dir; }

  /// File listing the organizations to crawl.
  const std::string &orgs_file() const { return orgs_file_; }

  /// Set the organizations file.
  void set_orgs_file(const std::string &file) { orgs_file_ = file; }

  /// Token read from the configuration file, if any.
  const std::string &github_token() const { return github_token_; }

  /// Set the configured token.
  void set_github_token(const std::string &token) { github_token_ = token; }

  /// Base URL for the GitHub API.
  const std::string &api_base() const { return api_base_; }

  /// Set base URL for the GitHub API.
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// Page size of repository listings.
  int per_page() const { return per_page_; }

  /// Set page size (clamped to 1-100).
  void set_per_page(int n) { per_page_ = n < 1 ? 1 : (n > 100 ? 100 : n); }

  /// Threads running repository jobs.
  int max_workers() const { return max_workers_; }

  /// Set worker thread count (minimum 1).
  void set_max_workers(int w) { max_workers_ = w < 1 ? 1 : w; }

  /// Repositories cloned and walked at once.
  int max_clones() const { return max_clones_; }

  /// Set clone concurrency (minimum 1).
  void set_max_clones(int n) { max_clones_ = n < 1 ? 1 : n; }

  /// Workflows walked in parallel inside one repository.
  int workflow_workers() const { return workflow_workers_; }

  /// Set per-repository parallelism (minimum 1).
  void set_workflow_workers(int n) { workflow_workers_ = n < 1 ? 1 : n; }

  /// Limit of one repository job.
  std::chrono::seconds task_timeout() const { return task_timeout_; }

  /// Set the job limit.
  void set_task_timeout(std::chrono::seconds t) { task_timeout_ = t; }

  /// Bound of one completion wait in milliseconds.
  int poll_interval_ms() const { return poll_interval_ms_; }

  /// Set the completion wait bound (minimum 10 ms).
  void set_poll_interval_ms(int ms) {
    poll_interval_ms_ = ms < 10 ? 10 : ms;
  }

  /// Spacing of heartbeat log lines; zero disables them.
  std::chrono::seconds heartbeat_interval() const {
    return heartbeat_interval_;
  }

  /// Set heartbeat spacing.
  void set_heartbeat_interval(std::chrono::seconds s) {
    heartbeat_interval_ = s;
  }

  /// Progress line every N settled jobs.
  int log_every() const { return log_every_; }

  /// Set progress spacing; zero disables progress lines.
  void set_log_every(int n) { log_every_ = n < 0 ? 0 : n; }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout.
  void set_http_timeout(int t) { http_timeout_ = t; }

  /// Backoff step after server errors, in milliseconds.
  int server_backoff_ms() const { return server_backoff_ms_; }
  void set_server_backoff_ms(int ms) { server_backoff_ms_ = ms < 0 ? 0 : ms; }

  /// Backoff step after secondary rate limits, in milliseconds.
  int secondary_backoff_ms() const { return secondary_backoff_ms_; }
  void set_secondary_backoff_ms(int ms) {
    secondary_backoff_ms_ = ms < 0 ? 0 : ms;
  }

  /// Margin added after a primary rate limit reset, in milliseconds.
  int rate_limit_margin_ms() const { return rate_limit_margin_ms_; }
  void set_rate_limit_margin_ms(int ms) {
    rate_limit_margin_ms_ = ms < 0 ? 0 : ms;
  }

  /// Requests issued per call before giving up.
  int max_attempts() const { return max_attempts_; }

  /// Set the attempt budget (minimum 1).
  void set_max_attempts(int n) { max_attempts_ = n < 1 ? 1 : n; }

  /// Snapshot naming, `content` or `per_revision`.
  const std::string &snapshot_layout() const { return snapshot_layout_; }

  /// Set the snapshot naming.
  /// @throws std::invalid_argument For unknown layouts.
  void set_snapshot_layout(const std::string &layout);

  /// Whether snapshots are written gzip compressed.
  bool compress_snapshots() const { return compress_snapshots_; }
  void set_compress_snapshots(bool v) { compress_snapshots_ = v; }

  /// Whether clones stay in the cache after their job.
  bool keep_clone() const { return keep_clone_; }
  void set_keep_clone(bool v) { keep_clone_ = v; }

  /// `git` executable.
  const std::string &git_binary() const { return git_binary_; }
  void set_git_binary(const std::string &binary) { git_binary_ = binary; }

  /// Limit of one `git` command; zero disables it.
  std::chrono::seconds git_timeout() const { return git_timeout_; }
  void set_git_timeout(std::chrono::seconds t) { git_timeout_ = t; }

  /** Logging verbosity level. */
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Logging pattern for spdlog.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Log file path.
  const std::string &log_file() const { return log_file_; }

  /// Set log file path.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep.
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to keep.
  void set_log_rotate(int r) { log_rotate_ = r < 0 ? 0 : r; }

  /// Whether rotated log files are compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated logs.
  void set_log_compress(bool c) { log_compress_ = c; }

  /// Per-category log levels.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace the per-category log levels.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /**
   * Load configuration from a file.
   *
   * The format is chosen from the extension (`.yaml`/`.yml`, `.toml`/`.tml`,
   * `.json`). Keys may be flat or grouped under the sections `core`,
   * `github`, `crawl`, `network`, `output` and `logging`.
   *
   * @throws std::runtime_error When the file cannot be read or parsed.
   */
  static Config from_file(const std::string &path);

  /// Construct a configuration from an already parsed JSON object.
  static Config from_json(const nlohmann::json &j);

private:
  void load_json(const nlohmann::json &j);

  bool verbose_ = false;
  std::string out_dir_{"data"};
  std::string git_cache_dir_;
  std::string orgs_file_;
  std::string github_token_;
  std::string api_base_{"https://api.github.com"};
  int per_page_ = 100;
  int max_workers_ = 32;
  int max_clones_ = 4;
  int workflow_workers_ = 4;
  std::chrono::seconds task_timeout_{std::chrono::minutes(30)};
  int poll_interval_ms_ = 1000;
  std::chrono::seconds heartbeat_interval_{30};
  int log_every_ = 10;
  int http_timeout_ = 60;
  int server_backoff_ms_ = 500;
  int secondary_backoff_ms_ = 1000;
  int rate_limit_margin_ms_ = 1000;
  int max_attempts_ = 6;
  std::string snapshot_layout_{"content"};
  bool compress_snapshots_ = false;
  bool keep_clone_ = true;
  std::string git_binary_{"git"};
  std::chrono::seconds git_timeout_{0};
  std::string log_level_{"info"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace wfh

#endif // WORKFLOWHARVEST_CONFIG_HPP
