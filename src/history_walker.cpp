/**
 * @file history_walker.cpp
 * @brief Walks workflow histories and writes snapshots and indexes.
 */

#include "history_walker.hpp"
#include "history_index.hpp"
#include "log.hpp"
#include "util/atomic_file.hpp"
#include "util/digest.hpp"
#include "util/timestamp.hpp"
#include "worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <spdlog/spdlog.h>
#include <system_error>
#include <vector>

namespace wfh {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> history_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("history");
  }();
  return logger;
}

const std::string kWorkflowDir = ".github/workflows/";

} // namespace

HistoryWalker::HistoryWalker(OutputLayout layout, WalkerOptions options)
    : layout_(std::move(layout)), options_(std::move(options)) {}

RepoResult HistoryWalker::collect(const std::string &org,
                                  const Repository &repo,
                                  const CancellationToken &cancel) {
  cancel.throw_if_cancelled("Collecting " + org + "/" + repo.name);
  GitRepository git = GitRepository::clone_or_open(
      repo.clone_url, layout_.clone_dir(org, repo.name), repo.default_branch,
      options_.git, &cancel);

  std::vector<std::string> workflows;
  for (auto &path : git.list_files(kWorkflowDir)) {
    if (is_workflow_file(path)) {
      workflows.push_back(std::move(path));
    }
  }
  RepoResult result;
  result.workflows_found = workflows.size();
  if (workflows.empty()) {
    history_log()->debug("{}/{} has no workflow files", org, repo.name);
    return result;
  }

  WorkerPool pool(std::min<int>(options_.workflow_workers,
                                static_cast<int>(workflows.size())));
  pool.start();
  std::vector<std::future<void>> futures;
  std::vector<WorkflowResult> outcomes(workflows.size());
  futures.reserve(workflows.size());
  for (std::size_t i = 0; i < workflows.size(); ++i) {
    futures.push_back(pool.submit(workflows[i], [&, i] {
      outcomes[i] =
          collect_workflow(git, org, repo.name, workflows[i], cancel);
    }));
  }

  std::exception_ptr cancelled;
  std::size_t failed = 0;
  for (std::size_t i = 0; i < futures.size(); ++i) {
    try {
      futures[i].get();
    } catch (const OperationCancelled &) {
      cancelled = std::current_exception();
      continue;
    } catch (const std::exception &e) {
      ++failed;
      history_log()->error("Collecting {} of {}/{} failed: {}", workflows[i],
                           org, repo.name, e.what());
      continue;
    }
    result.workflows_indexed += 1;
    result.revisions_indexed += outcomes[i].nb_commits;
    result.snapshots_written += outcomes[i].snapshots_written;
    if (outcomes[i].collected) {
      result.workflows_collected += 1;
    }
  }
  pool.stop();
  if (cancelled) {
    std::rethrow_exception(cancelled);
  }
  if (failed > 0) {
    throw std::runtime_error(std::to_string(failed) + " of " +
                             std::to_string(workflows.size()) +
                             " workflows of " + org + "/" + repo.name +
                             " could not be collected");
  }
  history_log()->debug("{}/{}: {} workflows, {} new, {} revisions", org,
                       repo.name, result.workflows_found,
                       result.workflows_collected, result.revisions_indexed);
  return result;
}

WorkflowResult HistoryWalker::collect_workflow(
    const GitRepository &git, const std::string &org, const std::string &repo,
    const std::string &workflow_path, const CancellationToken &cancel) const {
  WorkflowResult result;
  const fs::path index_path = layout_.index_file(org, repo, workflow_path);
  std::error_code ec;
  if (fs::exists(index_path, ec)) {
    // Resume: the index is the marker of a finished workflow.
    try {
      result.nb_commits = read_history_index(index_path).nb_commits();
    } catch (const std::exception &e) {
      history_log()->warn("Keeping unreadable index {}: {}",
                          index_path.string(), e.what());
    }
    return result;
  }

  HistoryIndex index;
  index.org = org;
  index.repo = repo;
  index.workflow_path = workflow_path;
  index.snapshot_layout = to_string(options_.layout);

  for (const auto &rev : git.revisions_for_path(workflow_path)) {
    cancel.throw_if_cancelled("Walking " + workflow_path);
    std::optional<std::string> content;
    try {
      content = git.read_file_at(rev.id, workflow_path);
    } catch (const OperationCancelled &) {
      throw;
    } catch (const std::exception &e) {
      history_log()->warn("Cannot read {} at {} in {}/{}: {}", workflow_path,
                          rev.id, org, repo, e.what());
      continue;
    }
    if (!content) {
      continue;
    }
    CommitEntry entry;
    entry.sha = rev.id;
    entry.date = format_utc(rev.author_time);
    entry.message = rev.message;
    entry.content_hash = sha256_hex(*content);
    const std::string key = options_.layout == SnapshotLayout::Content
                                ? entry.content_hash
                                : rev.id;
    entry.raw_snapshot_relpath = layout_.snapshot_relpath(
        org, repo, workflow_path, key, options_.compress_snapshots);
    try {
      if (store_snapshot(entry.raw_snapshot_relpath, *content)) {
        result.snapshots_written += 1;
      }
    } catch (const std::exception &e) {
      history_log()->warn("Cannot store snapshot of {} at {} in {}/{}: {}",
                          workflow_path, rev.id, org, repo, e.what());
      continue;
    }
    index.commits.push_back(std::move(entry));
  }
  cancel.throw_if_cancelled("Walking " + workflow_path);

  if (!index.commits.empty()) {
    index.last_commit_date = index.commits.front().date;
    index.first_commit_date = index.commits.back().date;
  }
  index.collected_at = utc_now();
  write_history_index(index_path, index);
  result.collected = true;
  result.nb_commits = index.nb_commits();
  history_log()->debug("Indexed {} revisions of {} in {}/{}",
                       result.nb_commits, workflow_path, org, repo);
  return result;
}

bool HistoryWalker::store_snapshot(const std::string &relpath,
                                   const std::string &content) const {
  const fs::path target = layout_.root() / relpath;
  std::error_code ec;
  if (fs::exists(target, ec)) {
    return false;
  }
  write_file_atomic(target, content, options_.compress_snapshots);
  return true;
}

} // namespace wfh
