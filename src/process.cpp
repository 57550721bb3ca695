/**
 * @file process.cpp
 * @brief fork/exec based subprocess runner.
 */

#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace wfh {

namespace {

constexpr auto kTick = std::chrono::milliseconds(100);
constexpr auto kKillGrace = std::chrono::milliseconds(2000);

/// Closes a descriptor once.
struct FdGuard {
  int fd{-1};
  ~FdGuard() { reset(); }
  void reset() {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
};

std::vector<std::string>
build_environment(const std::vector<std::pair<std::string, std::string>> &extra) {
  std::vector<std::string> env;
  for (char **e = environ; e != nullptr && *e != nullptr; ++e) {
    std::string entry(*e);
    auto eq = entry.find('=');
    std::string key = entry.substr(0, eq);
    bool overridden = false;
    for (const auto &[k, v] : extra) {
      if (k == key) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      env.push_back(std::move(entry));
    }
  }
  for (const auto &[k, v] : extra) {
    env.push_back(k + "=" + v);
  }
  return env;
}

std::vector<char *> to_c_array(std::vector<std::string> &items) {
  std::vector<char *> out;
  out.reserve(items.size() + 1);
  for (auto &s : items) {
    out.push_back(s.data());
  }
  out.push_back(nullptr);
  return out;
}

/// Read whatever is available on @p fd; closes it on EOF.
void drain(FdGuard &fd, std::string &sink) {
  char buffer[8192];
  while (true) {
    ssize_t n = ::read(fd.fd, buffer, sizeof(buffer));
    if (n > 0) {
      sink.append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) {
      fd.reset();
    } else if (errno == EINTR) {
      continue;
    } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
      fd.reset();
    }
    return;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

/// Terminate the process group and reap the child.
int kill_group(pid_t pid) {
  ::kill(-pid, SIGTERM);
  auto give_up = std::chrono::steady_clock::now() + kKillGrace;
  int status = 0;
  while (std::chrono::steady_clock::now() < give_up) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      return decode_status(status);
    }
    ::usleep(20000);
  }
  ::kill(-pid, SIGKILL);
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  return decode_status(status);
}

} // namespace

ProcessResult run_process(const std::vector<std::string> &argv,
                          const ProcessOptions &options) {
  if (argv.empty()) {
    throw std::runtime_error("run_process: empty command line");
  }
  // Everything the child needs is prepared before fork.
  std::vector<std::string> args = argv;
  std::vector<char *> c_args = to_c_array(args);
  std::vector<std::string> env = build_environment(options.env);
  std::vector<char *> c_env = to_c_array(env);
  const std::string cwd = options.cwd.string();

  int out_pipe[2];
  int err_pipe[2];
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }
  FdGuard out_r{out_pipe[0]}, out_w{out_pipe[1]};
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }
  FdGuard err_r{err_pipe[0]}, err_w{err_pipe[1]};

  pid_t pid = ::fork();
  if (pid < 0) {
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(out_w.fd, STDOUT_FILENO);
    ::dup2(err_w.fd, STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
    }
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      ::_exit(126);
    }
    ::execvpe(c_args[0], c_args.data(), c_env.data());
    ::_exit(127);
  }
  ::setpgid(pid, pid);
  out_w.reset();
  err_w.reset();
  ::fcntl(out_r.fd, F_SETFL, O_NONBLOCK);
  ::fcntl(err_r.fd, F_SETFL, O_NONBLOCK);

  ProcessResult result;
  const auto start = std::chrono::steady_clock::now();
  bool exited = false;
  int status = 0;
  while (true) {
    if (options.cancel != nullptr && options.cancel->cancelled()) {
      result.cancelled = true;
      result.exit_code = kill_group(pid);
      return result;
    }
    if (options.timeout.count() > 0 &&
        std::chrono::steady_clock::now() - start > options.timeout) {
      result.timed_out = true;
      result.exit_code = kill_group(pid);
      return result;
    }

    pollfd fds[2];
    nfds_t n = 0;
    if (out_r.fd >= 0) {
      fds[n++] = pollfd{out_r.fd, POLLIN, 0};
    }
    if (err_r.fd >= 0) {
      fds[n++] = pollfd{err_r.fd, POLLIN, 0};
    }
    if (n > 0) {
      int rc = ::poll(fds, n, static_cast<int>(kTick.count()));
      if (rc < 0 && errno != EINTR) {
        break;
      }
      if (out_r.fd >= 0) {
        drain(out_r, result.out);
      }
      if (err_r.fd >= 0) {
        drain(err_r, result.err);
      }
    }
    if (!exited) {
      pid_t r = ::waitpid(pid, &status, WNOHANG);
      if (r == pid) {
        exited = true;
      }
    }
    if (exited && out_r.fd < 0 && err_r.fd < 0) {
      break;
    }
    if (n == 0 && !exited) {
      ::usleep(static_cast<useconds_t>(kTick.count() * 1000 / 5));
    }
  }
  if (!exited) {
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
  }
  result.exit_code = decode_status(status);
  return result;
}

} // namespace wfh
