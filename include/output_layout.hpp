/**
 * @file output_layout.hpp
 * @brief Paths of every artifact below the output directory.
 */
#ifndef WORKFLOWHARVEST_OUTPUT_LAYOUT_HPP
#define WORKFLOWHARVEST_OUTPUT_LAYOUT_HPP

#include <filesystem>
#include <string>

namespace wfh {

/// Naming scheme of snapshot files.
enum class SnapshotLayout {
  Content,    ///< `<sha256 of content>.yml`, shared by identical revisions
  PerRevision ///< `<commit id>.yml`, one file per revision
};

/// `content` or `per_revision`.
std::string to_string(SnapshotLayout layout);

/// @throws std::invalid_argument For unknown names.
SnapshotLayout parse_snapshot_layout(const std::string &name);

/**
 * Directory structure of a dataset rooted at `out_dir`:
 *
 *     index/<org>/<repo>/workflows/<sha1(workflow path)>.json
 *     index/<org>/<repo>/repo.done
 *     raw/<org>/<repo>/<workflow path>/<key>.yml[.gz]
 *     metrics/orgs/<org>.json
 *     .cache/git/<org>/<repo>/
 */
class OutputLayout {
public:
  explicit OutputLayout(std::filesystem::path root,
                        std::filesystem::path git_cache = {});

  const std::filesystem::path &root() const { return root_; }

  std::filesystem::path index_root(const std::string &org) const;
  std::filesystem::path repo_index_dir(const std::string &org,
                                       const std::string &repo) const;
  std::filesystem::path index_file(const std::string &org,
                                   const std::string &repo,
                                   const std::string &workflow_path) const;
  std::filesystem::path completion_marker(const std::string &org,
                                          const std::string &repo) const;

  /// Snapshot location relative to root(), as stored in the index.
  std::string snapshot_relpath(const std::string &org, const std::string &repo,
                               const std::string &workflow_path,
                               const std::string &key, bool gzip) const;

  std::filesystem::path summary_file(const std::string &org) const;
  std::filesystem::path clone_dir(const std::string &org,
                                  const std::string &repo) const;

private:
  std::filesystem::path root_;
  std::filesystem::path git_cache_;
};

} // namespace wfh

#endif // WORKFLOWHARVEST_OUTPUT_LAYOUT_HPP
