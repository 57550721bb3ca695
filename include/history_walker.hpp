/**
 * @file history_walker.hpp
 * @brief Per-repository collection of workflow file histories.
 */
#ifndef WORKFLOWHARVEST_HISTORY_WALKER_HPP
#define WORKFLOWHARVEST_HISTORY_WALKER_HPP

#include "cancellation.hpp"
#include "git_repository.hpp"
#include "github_client.hpp"
#include "output_layout.hpp"
#include <cstddef>
#include <string>

namespace wfh {

/// What one repository contributed to the dataset.
struct RepoResult {
  std::size_t workflows_found{0};     ///< Workflow files at the branch tip
  std::size_t workflows_indexed{0};   ///< Of those, with an index on disk
  std::size_t workflows_collected{0}; ///< Indexes written by this walk
  std::size_t revisions_indexed{0};   ///< Sum of nb_commits over the indexes
  std::size_t snapshots_written{0};   ///< Snapshot files created by this walk

  /// Whether at least one indexed workflow has a kept revision.
  bool has_workflows() const { return revisions_indexed > 0; }
};

/// Outcome of a single workflow file.
struct WorkflowResult {
  bool collected{false};     ///< Index written now (false: reused)
  std::size_t nb_commits{0}; ///< Entries of the index
  std::size_t snapshots_written{0};
};

/**
 * Collects everything a repository contributes. The crawler depends on this
 * interface only, so tests can substitute slow or failing collectors.
 */
class RepositoryCollector {
public:
  virtual ~RepositoryCollector() = default;

  /**
   * Collect @p repo of @p org.
   *
   * @throws OperationCancelled When @p cancel is observed.
   * @throws std::exception On any failure that prevents a complete result.
   */
  virtual RepoResult collect(const std::string &org, const Repository &repo,
                             const CancellationToken &cancel) = 0;
};

/// Tunables of HistoryWalker.
struct WalkerOptions {
  int workflow_workers{4};                    ///< Per-repository parallelism
  SnapshotLayout layout{SnapshotLayout::Content};
  bool compress_snapshots{false};             ///< Write `.yml.gz` snapshots
  GitOptions git;                             ///< `git` invocation settings
};

/**
 * RepositoryCollector reading history from a bare partial clone.
 *
 * Workflows whose History Index already exists are not walked again, which
 * makes repeated runs resumable. Indexes and snapshots are written
 * atomically; snapshots are never rewritten once present.
 */
class HistoryWalker : public RepositoryCollector {
public:
  HistoryWalker(OutputLayout layout, WalkerOptions options);

  /**
   * Clone or refresh the repository, then collect every workflow file at the
   * tip of its default branch.
   *
   * @throws GitCommandError When cloning or listing fails.
   * @throws std::runtime_error When at least one workflow could not be
   *         collected; the others are still written.
   */
  RepoResult collect(const std::string &org, const Repository &repo,
                     const CancellationToken &cancel) override;

  /**
   * Collect one workflow file from an open repository.
   *
   * Revisions in which the file does not exist, or whose content cannot be
   * read or stored, are left out of the index.
   */
  WorkflowResult collect_workflow(const GitRepository &git,
                                  const std::string &org,
                                  const std::string &repo,
                                  const std::string &workflow_path,
                                  const CancellationToken &cancel) const;

  const OutputLayout &layout() const { return layout_; }

private:
  /// Write the snapshot unless a file with that name exists. @return created
  bool store_snapshot(const std::string &relpath,
                      const std::string &content) const;

  OutputLayout layout_;
  WalkerOptions options_;
};

} // namespace wfh

#endif // WORKFLOWHARVEST_HISTORY_WALKER_HPP
