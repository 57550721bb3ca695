/**
 * @file crawler.cpp
 * @brief Organization crawl: listing, dispatch, watchdog and summary.
 */

#include "crawler.hpp"
#include "log.hpp"
#include "util/atomic_file.hpp"
#include "util/duration.hpp"
#include "util/timestamp.hpp"

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <system_error>

namespace wfh {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> crawler_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("crawler");
  }();
  return logger;
}

using Clock = std::chrono::steady_clock;

/// Message sent by a job to the orchestrator.
struct JobEvent {
  enum class Kind { Started, Finished, Failed, Cancelled };
  std::size_t job{0};
  Kind kind{Kind::Finished};
  RepoResult result;
  std::string error;
};

/// Multi-producer queue drained by the orchestrator thread.
class CompletionQueue {
public:
  void push(JobEvent event) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      events_.push_back(std::move(event));
    }
    cv_.notify_one();
  }

  std::optional<JobEvent> wait_pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
      return std::nullopt;
    }
    JobEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<JobEvent> events_;
};

/// State shared between a job and the orchestrator.
struct JobContext {
  explicit JobContext(ClonePermits &permits) : permit(permits) {}

  std::size_t id{0};
  std::string org;
  Repository repo;
  CancellationToken cancel;
  std::shared_ptr<CompletionQueue> queue;
  /// Released by the job when it returns, or by the watchdog on timeout.
  ClonePermits::Lease permit;
};

/// Orchestrator-side bookkeeping of a job.
struct JobState {
  std::shared_ptr<JobContext> context;
  std::optional<Clock::time_point> started;
  bool settled{false};
};

void remove_clone(const fs::path &dir, const std::string &org,
                  const std::string &repo) {
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) {
    crawler_log()->warn("Failed to delete clone of {}/{} at {}: {}", org, repo,
                        dir.string(), ec.message());
  }
}

std::string seconds_since(Clock::time_point start) {
  return format_duration(
      std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - start));
}

} // namespace

std::string to_string(CrawlPhase phase) {
  switch (phase) {
  case CrawlPhase::Idle:
    return "idle";
  case CrawlPhase::Listing:
    return "listing";
  case CrawlPhase::Dispatching:
    return "dispatching";
  case CrawlPhase::AwaitingCompletion:
    return "awaiting-completion";
  case CrawlPhase::Summarizing:
    return "summarizing";
  case CrawlPhase::Done:
    return "done";
  }
  return "unknown";
}

Crawler::Crawler(GitHubClient &github, RepositoryCollector &collector,
                 OutputLayout layout, CrawlOptions options)
    : github_(github), collector_(collector), layout_(std::move(layout)),
      options_(options), permits_(options.max_clones),
      pool_(options.max_workers) {
  pool_.start();
}

Crawler::~Crawler() { pool_.stop(); }

void Crawler::set_phase(const std::string &org, CrawlPhase phase) {
  phase_.store(phase);
  crawler_log()->debug("Org {} -> {}", org, to_string(phase));
}

std::optional<RunSummary> Crawler::crawl_org(const std::string &org) {
  const auto t0 = Clock::now();
  set_phase(org, CrawlPhase::Listing);
  std::vector<Repository> listed;
  try {
    listed = github_.list_org_repositories(org);
  } catch (const std::exception &e) {
    crawler_log()->error("Listing repositories of {} failed, skipping: {}",
                         org, e.what());
    set_phase(org, CrawlPhase::Done);
    return std::nullopt;
  }
  std::vector<Repository> targets;
  for (auto &repo : listed) {
    if (is_crawl_target(repo)) {
      targets.push_back(std::move(repo));
    }
  }
  crawler_log()->info("Org {}: {} repos to process ({} skipped)", org,
                      targets.size(), listed.size() - targets.size());

  set_phase(org, CrawlPhase::Dispatching);
  auto queue = std::make_shared<CompletionQueue>();
  std::map<std::size_t, JobState> jobs;
  for (std::size_t id = 0; id < targets.size(); ++id) {
    auto ctx = std::make_shared<JobContext>(permits_);
    ctx->id = id;
    ctx->org = org;
    ctx->repo = targets[id];
    ctx->queue = queue;
    jobs[id].context = ctx;
    pool_.submit(org + "/" + ctx->repo.name, [this, ctx] {
      const std::string &name = ctx->repo.name;
      JobEvent done;
      done.job = ctx->id;
      try {
        ctx->permit.acquire(ctx->cancel);
        ctx->queue->push(JobEvent{ctx->id, JobEvent::Kind::Started, {}, {}});
        done.result = collector_.collect(ctx->org, ctx->repo, ctx->cancel);
        ctx->cancel.throw_if_cancelled("Collecting " + name);
        write_file_atomic(layout_.completion_marker(ctx->org, name),
                          utc_now() + "\n");
        done.kind = JobEvent::Kind::Finished;
      } catch (const OperationCancelled &e) {
        done.kind = JobEvent::Kind::Cancelled;
        done.error = e.what();
      } catch (const std::exception &e) {
        done.kind = JobEvent::Kind::Failed;
        done.error = e.what();
      }
      if (!options_.keep_clone) {
        remove_clone(layout_.clone_dir(ctx->org, name), ctx->org, name);
      }
      ctx->permit.release();
      ctx->queue->push(std::move(done));
    });
  }

  set_phase(org, CrawlPhase::AwaitingCompletion);
  LiveCounters counters;
  std::size_t settled = 0;
  const std::size_t total = jobs.size();
  auto last_activity = Clock::now();
  auto settle = [&](JobState &state) {
    state.settled = true;
    ++settled;
    if (options_.log_every > 0 &&
        (settled % static_cast<std::size_t>(options_.log_every) == 0 ||
         settled == total)) {
      crawler_log()->info("Org {}: repos scanned {}/{}", org, settled, total);
    }
  };

  while (settled < total) {
    auto event = queue->wait_pop(options_.poll_interval);
    if (event) {
      last_activity = Clock::now();
      auto &state = jobs.at(event->job);
      const std::string &name = state.context->repo.name;
      if (state.settled) {
        crawler_log()->debug("Ignoring late report of {}/{}", org, name);
      } else {
        switch (event->kind) {
        case JobEvent::Kind::Started:
          state.started = Clock::now();
          break;
        case JobEvent::Kind::Finished:
          counters.repos_scanned += 1;
          counters.workflows_total += event->result.workflows_indexed;
          counters.snapshots_total += event->result.revisions_indexed;
          if (event->result.has_workflows()) {
            counters.repos_with_workflows += 1;
          }
          settle(state);
          break;
        case JobEvent::Kind::Failed:
          crawler_log()->warn("Collecting {}/{} failed: {}", org, name,
                              event->error);
          counters.failures += 1;
          settle(state);
          break;
        case JobEvent::Kind::Cancelled:
          // Only the watchdog cancels, and it settles first.
          crawler_log()->warn("{}/{} stopped: {}", org, name, event->error);
          counters.timeouts += 1;
          settle(state);
          break;
        }
      }
    } else if (options_.heartbeat_interval.count() > 0 &&
               Clock::now() - last_activity >= options_.heartbeat_interval) {
      crawler_log()->info("Org {}: waiting on {} of {} jobs ({} elapsed)", org,
                          total - settled, total, seconds_since(t0));
      last_activity = Clock::now();
    }

    const auto now = Clock::now();
    for (auto &[id, state] : jobs) {
      if (state.settled || !state.started ||
          now - *state.started < options_.task_timeout) {
        continue;
      }
      state.context->cancel.cancel();
      // The job may not honour the cancel for a while; queued jobs must not
      // wait on it.
      state.context->permit.release();
      crawler_log()->warn("Timeout: {}/{} exceeded {}; cancelled", org,
                          state.context->repo.name,
                          format_duration(std::chrono::duration_cast<
                                          std::chrono::seconds>(
                              options_.task_timeout)));
      counters.timeouts += 1;
      settle(state);
    }
  }

  set_phase(org, CrawlPhase::Summarizing);
  RunSummary summary = summary_from_live(org, counters);
  try {
    write_summary(layout_, summary);
  } catch (const std::exception &e) {
    crawler_log()->error("Writing summary of {} failed: {}", org, e.what());
  }
  set_phase(org, CrawlPhase::Done);
  crawler_log()->info("Org {}: done in {}", org, seconds_since(t0));
  return summary;
}

CrawlReport Crawler::run(const std::vector<std::string> &orgs) {
  CrawlReport report;
  for (const auto &org : orgs) {
    auto summary = crawl_org(org);
    if (summary) {
      report.summaries.push_back(std::move(*summary));
    } else {
      report.skipped_orgs.push_back(org);
    }
  }
  return report;
}

} // namespace wfh
