#include "git_fixture.hpp"
#include "history_index.hpp"
#include "output_layout.hpp"
#include "util/atomic_file.hpp"
#include "util/digest.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace wfh;
using wfh::test::ScratchDir;

namespace {
HistoryIndex sample_index() {
  HistoryIndex idx;
  idx.org = "acme";
  idx.repo = "tool";
  idx.workflow_path = ".github/workflows/ci.yml";
  idx.collected_at = "2024-01-02T03:04:05Z";
  CommitEntry newest{"bbb", "2024-01-02T00:00:00Z", "second", "h2",
                     "raw/acme/tool/.github/workflows/ci.yml/h2.yml"};
  CommitEntry oldest{"aaa", "2023-12-01T00:00:00Z", "first", "h1",
                     "raw/acme/tool/.github/workflows/ci.yml/h1.yml"};
  idx.commits = {newest, oldest};
  idx.last_commit_date = newest.date;
  idx.first_commit_date = oldest.date;
  return idx;
}
} // namespace

TEST_CASE("history index survives a write and read", "[index]") {
  ScratchDir tmp("index");
  const auto path = tmp.path() / "index.json";
  write_history_index(path, sample_index());
  HistoryIndex back = read_history_index(path);
  CHECK(back.org == "acme");
  CHECK(back.nb_commits() == 2);
  CHECK(back.commits[0].sha == "bbb");
  CHECK(back.commits[1].raw_snapshot_relpath ==
        "raw/acme/tool/.github/workflows/ci.yml/h1.yml");
  CHECK(back.last_commit_date == std::string("2024-01-02T00:00:00Z"));
  CHECK(back.first_commit_date == std::string("2023-12-01T00:00:00Z"));

  auto j = nlohmann::json::parse(wfh::test::read_text(path));
  CHECK(j["nb_commits"] == 2);
  CHECK(j["snapshot_layout"] == "content");
}

TEST_CASE("empty history omits commit dates", "[index]") {
  HistoryIndex idx = sample_index();
  idx.commits.clear();
  idx.last_commit_date.reset();
  idx.first_commit_date.reset();
  nlohmann::json j = idx;
  CHECK(j["nb_commits"] == 0);
  CHECK_FALSE(j.contains("last_commit_date"));
  CHECK_FALSE(j.contains("first_commit_date"));
  HistoryIndex back = j.get<HistoryIndex>();
  CHECK_FALSE(back.last_commit_date.has_value());
}

TEST_CASE("inconsistent or incomplete indexes are rejected", "[index]") {
  ScratchDir tmp("badindex");
  nlohmann::json j = sample_index();
  j["nb_commits"] = 5;
  write_file_atomic(tmp.path() / "a.json", j.dump());
  REQUIRE_THROWS_AS(read_history_index(tmp.path() / "a.json"),
                    std::runtime_error);

  nlohmann::json k = sample_index();
  k.erase("org");
  write_file_atomic(tmp.path() / "b.json", k.dump());
  REQUIRE_THROWS_AS(read_history_index(tmp.path() / "b.json"),
                    std::runtime_error);

  write_file_atomic(tmp.path() / "c.json", "{not json");
  REQUIRE_THROWS_AS(read_history_index(tmp.path() / "c.json"),
                    std::runtime_error);
}

TEST_CASE("output layout paths", "[layout]") {
  OutputLayout layout("/data");
  const std::string wf = ".github/workflows/ci.yml";
  CHECK(layout.index_file("acme", "tool", wf) ==
        std::filesystem::path("/data/index/acme/tool/workflows") /
            (sha1_hex(wf) + ".json"));
  CHECK(layout.completion_marker("acme", "tool") ==
        std::filesystem::path("/data/index/acme/tool/repo.done"));
  CHECK(layout.snapshot_relpath("acme", "tool", wf, "abc", false) ==
        "raw/acme/tool/.github/workflows/ci.yml/abc.yml");
  CHECK(layout.snapshot_relpath("acme", "tool", wf, "abc", true) ==
        "raw/acme/tool/.github/workflows/ci.yml/abc.yml.gz");
  CHECK(layout.summary_file("acme") ==
        std::filesystem::path("/data/metrics/orgs/acme.json"));
  CHECK(layout.clone_dir("acme", "tool") ==
        std::filesystem::path("/data/.cache/git/acme/tool"));
  CHECK(OutputLayout("/data", "/cache").clone_dir("acme", "tool") ==
        std::filesystem::path("/cache/acme/tool"));

  CHECK(parse_snapshot_layout("per_revision") == SnapshotLayout::PerRevision);
  CHECK(to_string(SnapshotLayout::Content) == "content");
  REQUIRE_THROWS_AS(parse_snapshot_layout("flat"), std::invalid_argument);
}

TEST_CASE("digests and encodings", "[digest]") {
  CHECK(sha256_hex("") ==
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  CHECK(sha1_hex("abc") == "a9993e364706816aba3e25717850c26c9cd0d89d");
  CHECK(base64_encode("x-access-token:abc") == "eC1hY2Nlc3MtdG9rZW46YWJj");
  CHECK(base64_encode("a") == "YQ==");
}

TEST_CASE("atomic writes replace whole files", "[atomic]") {
  ScratchDir tmp("atomic");
  const auto plain = tmp.path() / "deep" / "dir" / "f.yml";
  write_file_atomic(plain, "one");
  write_file_atomic(plain, "two");
  CHECK(read_file(plain) == "two");

  const auto gz = tmp.path() / "f.yml.gz";
  write_file_atomic(gz, "compressed body\n", true);
  CHECK(wfh::test::read_text(gz).substr(0, 2) == "\x1f\x8b");
  CHECK(read_file(gz) == "compressed body\n");

  std::size_t entries = 0;
  for (const auto &e : std::filesystem::recursive_directory_iterator(tmp.path())) {
    (void)e;
    ++entries;
  }
  // deep, deep/dir, f.yml, f.yml.gz: no temp files left.
  CHECK(entries == 4);
}
