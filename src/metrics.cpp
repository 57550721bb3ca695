#include "metrics.hpp"
#include "history_index.hpp"
#include "log.hpp"
#include "util/atomic_file.hpp"
#include "util/timestamp.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>

namespace wfh {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> metrics_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("metrics");
  }();
  return logger;
}

double ratio_of(std::size_t part, std::size_t whole) {
  return whole > 0 ? static_cast<double>(part) / static_cast<double>(whole)
                   : 0.0;
}

} // namespace

void to_json(nlohmann::json &j, const RunSummary &s) {
  j = nlohmann::json{{"org", s.org},
                     {"repos_scanned", s.repos_scanned},
                     {"repos_with_workflows", s.repos_with_workflows},
                     {"ratio", s.ratio},
                     {"workflows_total", s.workflows_total},
                     {"snapshots_total", s.snapshots_total},
                     {"timeouts", s.timeouts},
                     {"failures", s.failures},
                     {"updated_at", s.updated_at}};
}

void from_json(const nlohmann::json &j, RunSummary &s) {
  s.org = j.at("org").get<std::string>();
  s.repos_scanned = j.value("repos_scanned", std::size_t{0});
  s.repos_with_workflows = j.value("repos_with_workflows", std::size_t{0});
  s.ratio = j.value("ratio", 0.0);
  s.workflows_total = j.value("workflows_total", std::size_t{0});
  s.snapshots_total = j.value("snapshots_total", std::size_t{0});
  s.timeouts = j.value("timeouts", std::size_t{0});
  s.failures = j.value("failures", std::size_t{0});
  s.updated_at = j.value("updated_at", "");
}

RunSummary summary_from_live(const std::string &org,
                             const LiveCounters &counters) {
  RunSummary s;
  s.org = org;
  s.repos_scanned = counters.repos_scanned;
  s.repos_with_workflows = counters.repos_with_workflows;
  s.ratio = ratio_of(s.repos_with_workflows, s.repos_scanned);
  s.workflows_total = counters.workflows_total;
  s.snapshots_total = counters.snapshots_total;
  s.timeouts = counters.timeouts;
  s.failures = counters.failures;
  s.updated_at = utc_now();
  return s;
}

RunSummary summary_from_disk(const OutputLayout &layout,
                             const std::string &org) {
  RunSummary s;
  s.org = org;
  s.updated_at = utc_now();
  const fs::path root = layout.index_root(org);
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return s;
  }
  for (const auto &repo_dir : fs::directory_iterator(root, ec)) {
    if (!repo_dir.is_directory(ec)) {
      continue;
    }
    if (fs::exists(repo_dir.path() / "repo.done", ec)) {
      s.repos_scanned += 1;
    }
    const fs::path workflows = repo_dir.path() / "workflows";
    if (!fs::is_directory(workflows, ec)) {
      continue;
    }
    std::size_t repo_commits = 0;
    for (const auto &entry : fs::directory_iterator(workflows, ec)) {
      if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") {
        continue;
      }
      try {
        auto index = read_history_index(entry.path());
        s.workflows_total += 1;
        repo_commits += index.nb_commits();
      } catch (const std::exception &e) {
        metrics_log()->warn("Skipping index {}: {}", entry.path().string(),
                            e.what());
      }
    }
    if (repo_commits > 0) {
      s.repos_with_workflows += 1;
    }
    s.snapshots_total += repo_commits;
  }
  if (ec) {
    metrics_log()->warn("Scanning {} stopped early: {}", root.string(),
                        ec.message());
  }
  s.ratio = ratio_of(s.repos_with_workflows, s.repos_scanned);
  return s;
}

std::optional<RunSummary> read_summary(const OutputLayout &layout,
                                       const std::string &org) {
  const fs::path path = layout.summary_file(org);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(read_file(path)).get<RunSummary>();
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error("Invalid summary " + path.string() + ": " +
                             e.what());
  }
}

RunSummary refresh_summary(const OutputLayout &layout,
                           const std::string &org) {
  RunSummary s = summary_from_disk(layout, org);
  try {
    if (auto previous = read_summary(layout, org)) {
      s.timeouts = previous->timeouts;
      s.failures = previous->failures;
    }
  } catch (const std::exception &e) {
    metrics_log()->warn("Previous summary of {} not carried over: {}", org,
                        e.what());
  }
  return s;
}

void write_summary(const OutputLayout &layout, const RunSummary &summary) {
  nlohmann::json j = summary;
  write_file_atomic(layout.summary_file(summary.org), j.dump(2) + "\n");
  metrics_log()->info(
      "Org {}: {} repos scanned, {} with workflows, {} workflows, {} "
      "snapshots, {} timeouts, {} failures",
      summary.org, summary.repos_scanned, summary.repos_with_workflows,
      summary.workflows_total, summary.snapshots_total, summary.timeouts,
      summary.failures);
}

} // namespace wfh
