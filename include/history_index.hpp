/**
 * @file history_index.hpp
 * @brief Per-workflow History Index documents.
 */
#ifndef WORKFLOWHARVEST_HISTORY_INDEX_HPP
#define WORKFLOWHARVEST_HISTORY_INDEX_HPP

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace wfh {

/// Summary of one kept revision.
struct CommitEntry {
  std::string sha;                  ///< Commit id
  std::string date;                 ///< Author date, ISO 8601 UTC
  std::string message;              ///< Commit message
  std::string content_hash;         ///< SHA-256 of the file content
  std::string raw_snapshot_relpath; ///< Snapshot path relative to out_dir
};

/// Every kept revision of one workflow file, newest first.
struct HistoryIndex {
  std::string org;
  std::string repo;
  std::string workflow_path;
  std::optional<std::string> last_commit_date;  ///< Newest kept revision
  std::optional<std::string> first_commit_date; ///< Oldest kept revision
  std::string collected_at;
  std::string snapshot_layout{"content"};
  std::vector<CommitEntry> commits;

  std::size_t nb_commits() const { return commits.size(); }
};

void to_json(nlohmann::json &j, const CommitEntry &c);
void from_json(const nlohmann::json &j, CommitEntry &c);
void to_json(nlohmann::json &j, const HistoryIndex &h);

/**
 * Decode an index document.
 *
 * @throws std::runtime_error When required fields are missing or
 *         `nb_commits` does not match the commit list.
 */
void from_json(const nlohmann::json &j, HistoryIndex &h);

/// Write @p index to @p path atomically.
void write_history_index(const std::filesystem::path &path,
                         const HistoryIndex &index);

/// @throws std::runtime_error When the file is unreadable or invalid.
HistoryIndex read_history_index(const std::filesystem::path &path);

} // namespace wfh

#endif // WORKFLOWHARVEST_HISTORY_INDEX_HPP
