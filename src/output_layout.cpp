#include "output_layout.hpp"
#include "util/digest.hpp"

#include <stdexcept>

namespace wfh {

namespace fs = std::filesystem;

std::string to_string(SnapshotLayout layout) {
  return layout == SnapshotLayout::PerRevision ? "per_revision" : "content";
}

SnapshotLayout parse_snapshot_layout(const std::string &name) {
  if (name == "content") {
    return SnapshotLayout::Content;
  }
  if (name == "per_revision") {
    return SnapshotLayout::PerRevision;
  }
  throw std::invalid_argument("Unknown snapshot layout: " + name);
}

OutputLayout::OutputLayout(fs::path root, fs::path git_cache)
    : root_(std::move(root)), git_cache_(std::move(git_cache)) {
  if (git_cache_.empty()) {
    git_cache_ = root_ / ".cache" / "git";
  }
}

fs::path OutputLayout::index_root(const std::string &org) const {
  return root_ / "index" / org;
}

fs::path OutputLayout::repo_index_dir(const std::string &org,
                                      const std::string &repo) const {
  return index_root(org) / repo;
}

fs::path OutputLayout::index_file(const std::string &org,
                                  const std::string &repo,
                                  const std::string &workflow_path) const {
  return repo_index_dir(org, repo) / "workflows" /
         (sha1_hex(workflow_path) + ".json");
}

fs::path OutputLayout::completion_marker(const std::string &org,
                                         const std::string &repo) const {
  return repo_index_dir(org, repo) / "repo.done";
}

std::string OutputLayout::snapshot_relpath(const std::string &org,
                                           const std::string &repo,
                                           const std::string &workflow_path,
                                           const std::string &key,
                                           bool gzip) const {
  fs::path rel = fs::path("raw") / org / repo / workflow_path /
                 (key + (gzip ? ".yml.gz" : ".yml"));
  return rel.generic_string();
}

fs::path OutputLayout::summary_file(const std::string &org) const {
  return root_ / "metrics" / "orgs" / (org + ".json");
}

fs::path OutputLayout::clone_dir(const std::string &org,
                                 const std::string &repo) const {
  return git_cache_ / org / repo;
}

} // namespace wfh
