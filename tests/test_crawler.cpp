#include "crawler.hpp"
#include "git_fixture.hpp"
#include "history_index.hpp"
#include "metrics.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <thread>

using namespace wfh;
using wfh::test::ScratchDir;

namespace {

/// Serves one listing per organization; unknown organizations get 404.
class ListingHttpClient : public HttpClient {
public:
  explicit ListingHttpClient(std::map<std::string, nlohmann::json> orgs)
      : orgs_(std::move(orgs)) {}

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &) override {
    HttpResponse res;
    for (const auto &[org, listing] : orgs_) {
      if (url.find("/orgs/" + org + "/repos") == std::string::npos) {
        continue;
      }
      res.status_code = 200;
      const bool first = url.size() >= 7 &&
                         url.compare(url.size() - 7, 7, "&page=1") == 0;
      res.body = first ? listing.dump() : "[]";
      return res;
    }
    res.status_code = 404;
    res.body = "{\"message\":\"Not Found\"}";
    return res;
  }

private:
  std::map<std::string, nlohmann::json> orgs_;
};

nlohmann::json repo(const std::string &name, bool archived = false,
                    bool fork = false) {
  return {{"name", name},
          {"full_name", "acme/" + name},
          {"archived", archived},
          {"fork", fork}};
}

/// Behaviour keyed by repository name prefix.
class ScriptedCollector : public RepositoryCollector {
public:
  explicit ScriptedCollector(OutputLayout layout) : layout_(std::move(layout)) {}

  std::atomic<int> calls{0};

  RepoResult collect(const std::string &org, const Repository &r,
                     const CancellationToken &cancel) override {
    ++calls;
    std::filesystem::create_directories(layout_.clone_dir(org, r.name));
    const std::string &name = r.name;
    if (name.rfind("slow", 0) == 0) {
      auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(10);
      while (std::chrono::steady_clock::now() < give_up) {
        cancel.throw_if_cancelled("slow collect");
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      return {};
    }
    if (name.rfind("hung", 0) == 0) {
      // Ignores the token, like a job stuck in a blocking call.
      std::this_thread::sleep_for(std::chrono::seconds(2));
      return {};
    }
    if (name.rfind("broken", 0) == 0) {
      throw std::runtime_error("clone failed");
    }
    RepoResult result;
    if (name.rfind("wf", 0) == 0) {
      add_index(org, name, ".github/workflows/ci.yml", 3, result);
      add_index(org, name, ".github/workflows/lint.yml", 1, result);
    } else {
      add_index(org, name, ".github/workflows/gone.yml", 0, result);
    }
    return result;
  }

private:
  void add_index(const std::string &org, const std::string &name,
                 const std::string &path, std::size_t commits,
                 RepoResult &result) {
    HistoryIndex idx;
    idx.org = org;
    idx.repo = name;
    idx.workflow_path = path;
    for (std::size_t i = 0; i < commits; ++i) {
      idx.commits.push_back(CommitEntry{"c" + std::to_string(i),
                                        "2024-01-01T00:00:00Z", "m", "h",
                                        "raw/x.yml"});
    }
    write_history_index(layout_.index_file(org, name, path), idx);
    result.workflows_found += 1;
    result.workflows_indexed += 1;
    result.workflows_collected += 1;
    result.revisions_indexed += commits;
  }

  OutputLayout layout_;
};

CrawlOptions fast_options() {
  CrawlOptions o;
  o.max_workers = 4;
  o.max_clones = 2;
  o.task_timeout = std::chrono::milliseconds(300);
  o.poll_interval = std::chrono::milliseconds(50);
  o.heartbeat_interval = std::chrono::milliseconds(0);
  o.log_every = 1;
  return o;
}

} // namespace

TEST_CASE("crawl counts outcomes and writes a summary", "[crawler]") {
  ScratchDir tmp("crawl");
  OutputLayout layout(tmp.path());
  GitHubClient github(
      "tok",
      std::make_unique<ListingHttpClient>(std::map<std::string, nlohmann::json>{
          {"acme", nlohmann::json::array({repo("wf-one"), repo("wf-two"),
                                          repo("empty"), repo("broken"),
                                          repo("slow"), repo("old", true),
                                          repo("copy", false, true)})}}),
      "https://api.test");
  ScriptedCollector collector(layout);
  CrawlOptions options = fast_options();
  options.keep_clone = false;
  Crawler crawler(github, collector, layout, options);

  auto start = std::chrono::steady_clock::now();
  auto summary = crawler.crawl_org("acme");
  auto elapsed = std::chrono::steady_clock::now() - start;
  REQUIRE(summary);
  CHECK(crawler.phase() == CrawlPhase::Done);
  // The watchdog fires within a poll interval of the limit.
  CHECK(elapsed < std::chrono::seconds(3));

  CHECK(summary->repos_scanned == 3);
  CHECK(summary->repos_with_workflows == 2);
  CHECK(summary->workflows_total == 5);
  CHECK(summary->snapshots_total == 8);
  CHECK(summary->timeouts == 1);
  CHECK(summary->failures == 1);
  CHECK(summary->ratio == 2.0 / 3.0);

  // Archived and forked repositories never reach the collector.
  CHECK(collector.calls.load() == 5);
  CHECK(std::filesystem::exists(layout.completion_marker("acme", "wf-one")));
  CHECK(std::filesystem::exists(layout.completion_marker("acme", "empty")));
  CHECK_FALSE(std::filesystem::exists(layout.completion_marker("acme", "broken")));
  CHECK_FALSE(std::filesystem::exists(layout.completion_marker("acme", "slow")));
  CHECK_FALSE(std::filesystem::exists(layout.clone_dir("acme", "wf-one")));

  auto written = nlohmann::json::parse(
      wfh::test::read_text(layout.summary_file("acme")));
  CHECK(written["repos_scanned"] == 3);
  CHECK(written["timeouts"] == 1);

  // Rebuilding from disk agrees with the live counters.
  RunSummary disk = summary_from_disk(layout, "acme");
  CHECK(disk.repos_scanned == summary->repos_scanned);
  CHECK(disk.repos_with_workflows == summary->repos_with_workflows);
  CHECK(disk.workflows_total == summary->workflows_total);
  CHECK(disk.snapshots_total == summary->snapshots_total);
}

TEST_CASE("timeout starts when a clone permit is obtained", "[crawler]") {
  ScratchDir tmp("crawlpermit");
  OutputLayout layout(tmp.path());
  GitHubClient github(
      "tok",
      std::make_unique<ListingHttpClient>(std::map<std::string, nlohmann::json>{
          {"acme", nlohmann::json::array(
                       {repo("slow"), repo("wf-a"), repo("wf-b")})}}),
      "https://api.test");
  ScriptedCollector collector(layout);
  CrawlOptions options = fast_options();
  options.max_clones = 1;
  Crawler crawler(github, collector, layout, options);

  auto summary = crawler.crawl_org("acme");
  REQUIRE(summary);
  // Jobs queued behind the slow one are not charged for the wait.
  CHECK(summary->timeouts == 1);
  CHECK(summary->repos_scanned == 2);
  CHECK(summary->failures == 0);
  CHECK(std::filesystem::exists(layout.clone_dir("acme", "wf-a")));
}

TEST_CASE("job ignoring cancellation does not hold back the others",
          "[crawler]") {
  ScratchDir tmp("crawlhung");
  OutputLayout layout(tmp.path());
  GitHubClient github(
      "tok",
      std::make_unique<ListingHttpClient>(std::map<std::string, nlohmann::json>{
          {"acme", nlohmann::json::array({repo("hung"), repo("wf-quick")})}}),
      "https://api.test");
  ScriptedCollector collector(layout);
  CrawlOptions options = fast_options();
  options.max_clones = 1;
  Crawler crawler(github, collector, layout, options);

  auto start = std::chrono::steady_clock::now();
  auto summary = crawler.crawl_org("acme");
  auto elapsed = std::chrono::steady_clock::now() - start;
  REQUIRE(summary);
  CHECK(crawler.phase() == CrawlPhase::Done);
  // Timeout plus a few poll intervals, well short of the stuck job.
  CHECK(elapsed < std::chrono::milliseconds(1500));
  CHECK(summary->timeouts == 1);
  CHECK(summary->repos_scanned == 1);
  CHECK(std::filesystem::exists(layout.completion_marker("acme", "wf-quick")));
  CHECK_FALSE(std::filesystem::exists(layout.completion_marker("acme", "hung")));
}

TEST_CASE("listing failure skips the organization", "[crawler]") {
  ScratchDir tmp("crawlskip");
  OutputLayout layout(tmp.path());
  GitHubClient github(
      "tok",
      std::make_unique<ListingHttpClient>(std::map<std::string, nlohmann::json>{
          {"acme", nlohmann::json::array({repo("wf-a")})}}),
      "https://api.test");
  ScriptedCollector collector(layout);
  Crawler crawler(github, collector, layout, fast_options());

  CrawlReport report = crawler.run({"ghost", "acme"});
  REQUIRE(report.skipped_orgs == std::vector<std::string>{"ghost"});
  REQUIRE(report.summaries.size() == 1);
  CHECK(report.summaries[0].org == "acme");
  CHECK(report.summaries[0].repos_scanned == 1);
  CHECK_FALSE(std::filesystem::exists(layout.summary_file("ghost")));
}

TEST_CASE("organization without repositories", "[crawler]") {
  ScratchDir tmp("crawlempty");
  OutputLayout layout(tmp.path());
  GitHubClient github(
      "tok",
      std::make_unique<ListingHttpClient>(std::map<std::string, nlohmann::json>{
          {"acme", nlohmann::json::array()}}),
      "https://api.test");
  ScriptedCollector collector(layout);
  Crawler crawler(github, collector, layout, fast_options());
  auto summary = crawler.crawl_org("acme");
  REQUIRE(summary);
  CHECK(summary->repos_scanned == 0);
  CHECK(summary->ratio == 0.0);
  CHECK(std::filesystem::exists(layout.summary_file("acme")));
  CHECK(to_string(crawler.phase()) == "done");
}
