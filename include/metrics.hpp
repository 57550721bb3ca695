/**
 * @file metrics.hpp
 * @brief Per-organization Run Summary, from live counters or from disk.
 */
#ifndef WORKFLOWHARVEST_METRICS_HPP
#define WORKFLOWHARVEST_METRICS_HPP

#include "output_layout.hpp"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace wfh {

/// Counters accumulated by the crawler for one organization.
struct LiveCounters {
  std::size_t repos_scanned{0};        ///< Jobs that completed successfully
  std::size_t repos_with_workflows{0}; ///< Of those, with a kept revision
  std::size_t workflows_total{0};      ///< Indexes present for those repos
  std::size_t snapshots_total{0};      ///< Sum of nb_commits
  std::size_t timeouts{0};
  std::size_t failures{0};
};

/// Persisted per-organization summary.
struct RunSummary {
  std::string org;
  std::size_t repos_scanned{0};
  std::size_t repos_with_workflows{0};
  double ratio{0.0}; ///< repos_with_workflows / repos_scanned, 0 when none
  std::size_t workflows_total{0};
  std::size_t snapshots_total{0};
  std::size_t timeouts{0};
  std::size_t failures{0};
  std::string updated_at;
};

void to_json(nlohmann::json &j, const RunSummary &s);
void from_json(const nlohmann::json &j, RunSummary &s);

/// Build a summary from the crawler's counters.
RunSummary summary_from_live(const std::string &org,
                             const LiveCounters &counters);

/**
 * Rebuild a summary by scanning the index tree of @p org.
 *
 * Completion markers count as scanned repositories, index files as
 * workflows and their `nb_commits` as snapshots. Timeouts and failures are
 * not recorded on disk and are reported as zero. Unreadable index files are
 * logged and skipped.
 */
RunSummary summary_from_disk(const OutputLayout &layout,
                             const std::string &org);

/**
 * Read `metrics/orgs/<org>.json` back.
 *
 * @return `std::nullopt` when no summary was written yet.
 * @throws std::runtime_error When the file exists but cannot be parsed.
 */
std::optional<RunSummary> read_summary(const OutputLayout &layout,
                                       const std::string &org);

/**
 * Rescan the index tree of @p org, keeping the timeouts and failures of the
 * summary already on disk since only a crawl can count them. An unreadable
 * previous summary is logged and its counts are lost.
 */
RunSummary refresh_summary(const OutputLayout &layout, const std::string &org);

/// Write `metrics/orgs/<org>.json` atomically.
void write_summary(const OutputLayout &layout, const RunSummary &summary);

} // namespace wfh

#endif // WORKFLOWHARVEST_METRICS_HPP
