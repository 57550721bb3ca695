#include "history_index.hpp"
#include "util/atomic_file.hpp"

#include <stdexcept>

namespace wfh {

namespace {

template <typename T>
T required(const nlohmann::json &j, const char *field) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    throw std::runtime_error(std::string("History index lacks field ") + field);
  }
  return it->get<T>();
}

std::optional<std::string> optional_string(const nlohmann::json &j,
                                          const char *field) {
  auto it = j.find(field);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

} // namespace

void to_json(nlohmann::json &j, const CommitEntry &c) {
  j = nlohmann::json{{"sha", c.sha},
                     {"date", c.date},
                     {"message", c.message},
                     {"content_hash", c.content_hash},
                     {"raw_snapshot_relpath", c.raw_snapshot_relpath}};
}

void from_json(const nlohmann::json &j, CommitEntry &c) {
  c.sha = required<std::string>(j, "sha");
  c.date = j.value("date", "");
  c.message = j.value("message", "");
  c.content_hash = j.value("content_hash", "");
  c.raw_snapshot_relpath = j.value("raw_snapshot_relpath", "");
}

void to_json(nlohmann::json &j, const HistoryIndex &h) {
  j = nlohmann::json{{"org", h.org},
                     {"repo", h.repo},
                     {"workflow_path", h.workflow_path},
                     {"nb_commits", h.nb_commits()},
                     {"collected_at", h.collected_at},
                     {"snapshot_layout", h.snapshot_layout},
                     {"commits", h.commits}};
  if (h.last_commit_date) {
    j["last_commit_date"] = *h.last_commit_date;
  }
  if (h.first_commit_date) {
    j["first_commit_date"] = *h.first_commit_date;
  }
}

void from_json(const nlohmann::json &j, HistoryIndex &h) {
  if (!j.is_object()) {
    throw std::runtime_error("History index is not an object");
  }
  h.org = required<std::string>(j, "org");
  h.repo = required<std::string>(j, "repo");
  h.workflow_path = required<std::string>(j, "workflow_path");
  h.last_commit_date = optional_string(j, "last_commit_date");
  h.first_commit_date = optional_string(j, "first_commit_date");
  h.collected_at = j.value("collected_at", "");
  h.snapshot_layout = j.value("snapshot_layout", "content");
  h.commits = j.value("commits", std::vector<CommitEntry>{});
  auto nb = required<std::size_t>(j, "nb_commits");
  if (nb != h.commits.size()) {
    throw std::runtime_error("History index of " + h.workflow_path +
                             " declares " + std::to_string(nb) +
                             " commits but lists " +
                             std::to_string(h.commits.size()));
  }
}

void write_history_index(const std::filesystem::path &path,
                         const HistoryIndex &index) {
  nlohmann::json j = index;
  write_file_atomic(path, j.dump(2) + "\n");
}

HistoryIndex read_history_index(const std::filesystem::path &path) {
  std::string text = read_file(path);
  try {
    return nlohmann::json::parse(text).get<HistoryIndex>();
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error("Invalid history index " + path.string() + ": " +
                             e.what());
  }
}

} // namespace wfh
