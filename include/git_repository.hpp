/**
 * @file git_repository.hpp
 * @brief Bare partial clones driven through the `git` command line tool.
 */
#ifndef WORKFLOWHARVEST_GIT_REPOSITORY_HPP
#define WORKFLOWHARVEST_GIT_REPOSITORY_HPP

#include "cancellation.hpp"
#include "process.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wfh {

/// A `git` invocation that exited with a non-zero status.
class GitCommandError : public std::runtime_error {
public:
  GitCommandError(std::string command, int exit_code, std::string stderr_text);

  const std::string &command() const noexcept { return command_; }
  int exit_code() const noexcept { return exit_code_; }
  const std::string &stderr_text() const noexcept { return stderr_; }

private:
  std::string command_;
  int exit_code_;
  std::string stderr_;
};

/// One commit touching a path.
struct Revision {
  std::string id;              ///< Full commit hash
  std::int64_t author_time{0}; ///< Author timestamp, seconds since epoch
  std::string message;         ///< Full commit message
};

/// How `git` is invoked.
struct GitOptions {
  std::string binary{"git"}; ///< Executable name or path
  std::string token;         ///< HTTPS credential; empty for anonymous access
  /// Per command limit; zero leaves commands bounded only by cancellation.
  std::chrono::milliseconds command_timeout{0};
};

/**
 * Local bare clone restricted to one branch.
 *
 * All queries address `refs/heads/<branch>` explicitly and never touch a
 * working tree. Credentials travel as a per-command HTTP header and are
 * never written to the clone's configuration.
 */
class GitRepository {
public:
  /**
   * Clone @p url into @p dir, or open and refresh an existing clone there.
   *
   * A fresh clone is bare, single branch, without tags and without blobs
   * (they are fetched lazily). When @p dir already holds a bare repository a
   * fetch updates the branch; a failed fetch is logged and the cached state
   * is used as is.
   *
   * @throws GitCommandError When cloning fails.
   * @throws OperationCancelled When @p cancel is set while cloning.
   */
  static GitRepository clone_or_open(const std::string &url,
                                     const std::filesystem::path &dir,
                                     const std::string &branch,
                                     const GitOptions &options = {},
                                     const CancellationToken *cancel = nullptr);

  /**
   * List blobs below @p prefix (recursively) at the tip of the branch.
   *
   * @return Repository relative paths, sorted as `git ls-tree` prints them.
   */
  std::vector<std::string> list_files(const std::string &prefix) const;

  /// Commits on the branch touching @p path, newest first.
  std::vector<Revision> revisions_for_path(const std::string &path) const;

  /**
   * Content of @p path at @p commit.
   *
   * @return `std::nullopt` when the path does not exist (or is not a file)
   *         in that commit.
   */
  std::optional<std::string> read_file_at(const std::string &commit,
                                          const std::string &path) const;

  const std::filesystem::path &path() const { return dir_; }
  const std::string &branch() const { return branch_; }

private:
  GitRepository(std::filesystem::path dir, std::string branch,
                GitOptions options, bool send_auth,
                const CancellationToken *cancel);

  std::vector<std::string> base_command() const;
  ProcessResult run(const std::vector<std::string> &args, bool check) const;
  std::string branch_ref() const { return "refs/heads/" + branch_; }

  std::filesystem::path dir_;
  std::string branch_;
  GitOptions options_;
  bool send_auth_;
  const CancellationToken *cancel_;
};

/// Whether @p path names a workflow definition (`.yml` or `.yaml`).
bool is_workflow_file(const std::string &path);

} // namespace wfh

#endif // WORKFLOWHARVEST_GIT_REPOSITORY_HPP
