/**
 * @file git_repository.cpp
 * @brief Clone, refresh and history queries over the `git` executable.
 */

#include "git_repository.hpp"
#include "log.hpp"
#include "util/digest.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <sstream>
#include <system_error>

namespace wfh {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> git_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("git");
  }();
  return logger;
}

constexpr char kFieldSep = '\x1f';
constexpr char kRecordSep = '\x1e';

bool uses_https(const std::string &url) { return url.rfind("https://", 0) == 0; }

std::string join_args(const std::vector<std::string> &args) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i) {
      oss << ' ';
    }
    // Never echo the credential header.
    if (args[i].rfind("http.extraHeader=", 0) == 0) {
      oss << "http.extraHeader=<redacted>";
    } else {
      oss << args[i];
    }
  }
  return oss.str();
}

std::string trim_trailing_newlines(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
  return s;
}

std::vector<std::string> command_prefix(const GitOptions &options,
                                        bool send_auth) {
  std::vector<std::string> cmd{options.binary};
  if (send_auth && !options.token.empty()) {
    cmd.push_back("-c");
    cmd.push_back("http.extraHeader=Authorization: Basic " +
                  base64_encode("x-access-token:" + options.token));
  }
  return cmd;
}

ProcessResult run_git(std::vector<std::string> cmd, const GitOptions &options,
                      const CancellationToken *cancel, bool check) {
  ProcessOptions popts;
  popts.env = {{"GIT_TERMINAL_PROMPT", "0"}, {"GIT_ASKPASS", "true"}};
  popts.timeout = options.command_timeout;
  popts.cancel = cancel;
  git_log()->trace("Running {}", join_args(cmd));
  ProcessResult res = run_process(cmd, popts);
  if (res.cancelled) {
    throw OperationCancelled(join_args(cmd) + " cancelled");
  }
  if (res.timed_out) {
    throw GitCommandError(join_args(cmd), res.exit_code,
                          "timed out after " +
                              std::to_string(options.command_timeout.count()) +
                              " ms");
  }
  if (check && res.exit_code != 0) {
    throw GitCommandError(join_args(cmd), res.exit_code,
                          trim_trailing_newlines(res.err));
  }
  return res;
}

} // namespace

GitCommandError::GitCommandError(std::string command, int exit_code,
                                 std::string stderr_text)
    : std::runtime_error(command + " exited with " + std::to_string(exit_code) +
                         (stderr_text.empty() ? "" : ": " + stderr_text)),
      command_(std::move(command)), exit_code_(exit_code),
      stderr_(std::move(stderr_text)) {}

bool is_workflow_file(const std::string &path) {
  auto ends_with = [&](const std::string &suffix) {
    return path.size() >= suffix.size() &&
           path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  return ends_with(".yml") || ends_with(".yaml");
}

GitRepository::GitRepository(fs::path dir, std::string branch,
                             GitOptions options, bool send_auth,
                             const CancellationToken *cancel)
    : dir_(std::move(dir)), branch_(std::move(branch)),
      options_(std::move(options)), send_auth_(send_auth), cancel_(cancel) {}

GitRepository GitRepository::clone_or_open(const std::string &url,
                                           const fs::path &dir,
                                           const std::string &branch,
                                           const GitOptions &options,
                                           const CancellationToken *cancel) {
  const bool auth = uses_https(url);
  GitRepository repo(dir, branch, options, auth, cancel);
  std::error_code ec;
  if (fs::exists(dir / "HEAD", ec)) {
    try {
      repo.run({"fetch", "--no-tags", "--update-head-ok", "origin",
                "+" + repo.branch_ref() + ":" + repo.branch_ref()},
               true);
      git_log()->debug("Refreshed {}", dir.string());
    } catch (const GitCommandError &e) {
      git_log()->warn("Refreshing {} failed, using cached clone: {}",
                      dir.string(), e.what());
    }
    return repo;
  }

  if (fs::exists(dir, ec)) {
    // Leftover of an interrupted clone.
    fs::remove_all(dir, ec);
  }
  fs::create_directories(dir.parent_path(), ec);
  if (ec) {
    throw std::runtime_error("Failed to create " +
                             dir.parent_path().string() + ": " + ec.message());
  }
  auto cmd = command_prefix(options, auth);
  cmd.insert(cmd.end(), {"clone", "--quiet", "--bare", "--single-branch",
                         "--branch", branch, "--no-tags", "--filter=blob:none",
                         url, dir.string()});
  git_log()->info("Cloning {} ({})", url, branch);
  try {
    run_git(std::move(cmd), options, cancel, true);
  } catch (...) {
    fs::remove_all(dir, ec);
    throw;
  }
  return repo;
}

std::vector<std::string> GitRepository::base_command() const {
  auto cmd = command_prefix(options_, send_auth_);
  cmd.push_back("-C");
  cmd.push_back(dir_.string());
  return cmd;
}

ProcessResult GitRepository::run(const std::vector<std::string> &args,
                                 bool check) const {
  auto cmd = base_command();
  cmd.insert(cmd.end(), args.begin(), args.end());
  return run_git(std::move(cmd), options_, cancel_, check);
}

std::vector<std::string>
GitRepository::list_files(const std::string &prefix) const {
  ProcessResult res =
      run({"ls-tree", "-r", "--name-only", "-z", branch_ref(), "--", prefix},
          true);
  std::vector<std::string> files;
  std::size_t start = 0;
  while (start < res.out.size()) {
    auto end = res.out.find('\0', start);
    if (end == std::string::npos) {
      end = res.out.size();
    }
    if (end > start) {
      files.emplace_back(res.out.substr(start, end - start));
    }
    start = end + 1;
  }
  return files;
}

std::vector<Revision>
GitRepository::revisions_for_path(const std::string &path) const {
  ProcessResult res = run({"log", "--format=%H%x1f%at%x1f%B%x1e", branch_ref(),
                           "--", path},
                          true);
  std::vector<Revision> revisions;
  std::size_t start = 0;
  while (start < res.out.size()) {
    auto end = res.out.find(kRecordSep, start);
    if (end == std::string::npos) {
      end = res.out.size();
    }
    std::string record = res.out.substr(start, end - start);
    start = end + 1;
    auto first = record.find_first_not_of("\r\n");
    if (first == std::string::npos) {
      continue;
    }
    record.erase(0, first);
    auto f1 = record.find(kFieldSep);
    auto f2 = f1 == std::string::npos ? std::string::npos
                                      : record.find(kFieldSep, f1 + 1);
    if (f2 == std::string::npos) {
      git_log()->warn("Unexpected log record for {} in {}", path,
                      dir_.string());
      continue;
    }
    Revision rev;
    rev.id = record.substr(0, f1);
    try {
      rev.author_time = std::stoll(record.substr(f1 + 1, f2 - f1 - 1));
    } catch (const std::exception &) {
      rev.author_time = 0;
    }
    rev.message = trim_trailing_newlines(record.substr(f2 + 1));
    revisions.push_back(std::move(rev));
  }
  return revisions;
}

std::optional<std::string>
GitRepository::read_file_at(const std::string &commit,
                            const std::string &path) const {
  ProcessResult tree = run({"ls-tree", commit, "--", path}, true);
  // "<mode> <type> <oid>\t<path>"
  std::istringstream line(tree.out);
  std::string mode, type, oid;
  if (!(line >> mode >> type >> oid) || type != "blob") {
    return std::nullopt;
  }
  ProcessResult blob = run({"cat-file", "blob", oid}, true);
  return std::move(blob.out);
}

} // namespace wfh
