/**
 * @file crawler.hpp
 * @brief Per-organization orchestration of repository jobs.
 */
#ifndef WORKFLOWHARVEST_CRAWLER_HPP
#define WORKFLOWHARVEST_CRAWLER_HPP

#include "clone_permits.hpp"
#include "github_client.hpp"
#include "history_walker.hpp"
#include "metrics.hpp"
#include "output_layout.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace wfh {

/// Lifecycle of one organization.
enum class CrawlPhase {
  Idle,
  Listing,
  Dispatching,
  AwaitingCompletion,
  Summarizing,
  Done
};

std::string to_string(CrawlPhase phase);

/// Tunables of Crawler.
struct CrawlOptions {
  int max_workers{32}; ///< Threads running repository jobs
  int max_clones{4};   ///< Jobs allowed to clone and walk at once
  /// Limit per job, measured from the moment it obtained a clone permit.
  std::chrono::milliseconds task_timeout{std::chrono::minutes(30)};
  /// Bound of one wait on the completion queue; also the watchdog period.
  std::chrono::milliseconds poll_interval{1000};
  /// Minimum spacing of "still waiting" lines; zero disables them.
  std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
  int log_every{10};     ///< Progress line every N settled jobs
  bool keep_clone{true}; ///< Keep `<cache>/<org>/<repo>` after the job
};

/// Result of a whole run.
struct CrawlReport {
  std::vector<RunSummary> summaries;     ///< One per processed organization
  std::vector<std::string> skipped_orgs; ///< Organizations that failed listing
};

/**
 * Schedules one job per repository of an organization and aggregates the
 * outcome into a Run Summary.
 *
 * Organizations are processed one after another. Jobs report through a
 * completion queue drained by the calling thread, which alone owns the
 * counters. A watchdog sweep on every queue wait cancels jobs that exceeded
 * CrawlOptions::task_timeout; such jobs count as timeouts and anything they
 * report afterwards is ignored.
 */
class Crawler {
public:
  /**
   * @param github Repository lister.
   * @param collector Per-repository work, normally a HistoryWalker.
   * @param layout Output tree receiving markers and summaries.
   * @param options Concurrency and timing settings.
   */
  Crawler(GitHubClient &github, RepositoryCollector &collector,
          OutputLayout layout, CrawlOptions options);
  ~Crawler();

  Crawler(const Crawler &) = delete;
  Crawler &operator=(const Crawler &) = delete;

  /**
   * Crawl one organization and write its Run Summary.
   *
   * @return The summary, or `std::nullopt` when the repository listing
   *         failed; no summary is written in that case.
   */
  std::optional<RunSummary> crawl_org(const std::string &org);

  /// Crawl every organization in order.
  CrawlReport run(const std::vector<std::string> &orgs);

  /// Phase of the organization currently (or last) processed.
  CrawlPhase phase() const { return phase_.load(); }

private:
  void set_phase(const std::string &org, CrawlPhase phase);

  GitHubClient &github_;
  RepositoryCollector &collector_;
  OutputLayout layout_;
  CrawlOptions options_;
  std::atomic<CrawlPhase> phase_{CrawlPhase::Idle};
  ClonePermits permits_;
  // Declared last: its destructor joins workers that still use the members
  // above.
  WorkerPool pool_;
};

} // namespace wfh

#endif // WORKFLOWHARVEST_CRAWLER_HPP
