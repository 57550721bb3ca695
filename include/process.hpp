/**
 * @file process.hpp
 * @brief Subprocess execution with captured output, deadline and
 * cancellation.
 */
#ifndef WORKFLOWHARVEST_PROCESS_HPP
#define WORKFLOWHARVEST_PROCESS_HPP

#include "cancellation.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace wfh {

/// Parameters of a single subprocess invocation.
struct ProcessOptions {
  std::filesystem::path cwd; ///< Working directory; empty keeps the current
  /// Variables added to (or replacing in) the inherited environment.
  std::vector<std::pair<std::string, std::string>> env;
  /// Wall clock limit; zero disables the deadline.
  std::chrono::milliseconds timeout{0};
  /// Optional token observed while the process runs.
  const CancellationToken *cancel{nullptr};
};

/// Outcome of a finished subprocess.
struct ProcessResult {
  int exit_code{-1};      ///< Exit status, or 128 + signal when killed
  std::string out;        ///< Raw standard output
  std::string err;        ///< Raw standard error
  bool timed_out{false};  ///< Killed because the deadline passed
  bool cancelled{false};  ///< Killed because the token was set
};

/**
 * Run @p argv (argv[0] is looked up in `PATH`) and wait for it.
 *
 * Output is captured byte for byte. The child runs in its own process group
 * so that a deadline or cancellation terminates every process it spawned
 * (SIGTERM, then SIGKILL after a short grace period).
 *
 * @throws std::runtime_error When the process cannot be started.
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          const ProcessOptions &options = {});

} // namespace wfh

#endif // WORKFLOWHARVEST_PROCESS_HPP
