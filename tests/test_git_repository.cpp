#include "git_fixture.hpp"
#include "git_repository.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace wfh;
using wfh::test::ScratchDir;
using wfh::test::SourceRepo;

TEST_CASE("clone lists workflow files and their revisions", "[git]") {
  ScratchDir tmp("gitrepo");
  SourceRepo src(tmp.path() / "src");
  src.write(".github/workflows/ci.yml", "name: ci v1\n");
  src.write("README.md", "hello\n");
  const std::string c1 = src.commit("Add CI");
  src.write(".github/workflows/ci.yml", "name: ci v2\n");
  src.write(".github/workflows/nested/release.yaml", "name: release\n");
  const std::string c2 = src.commit("Update CI\n\nWith a body line.");
  src.write("README.md", "unrelated\n");
  src.commit("Docs only");

  GitRepository repo = GitRepository::clone_or_open(
      src.url(), tmp.path() / "cache" / "acme" / "src", "main");
  CHECK(repo.branch() == "main");

  auto files = repo.list_files(".github/workflows/");
  REQUIRE(files.size() == 2);
  CHECK(files[0] == ".github/workflows/ci.yml");
  CHECK(files[1] == ".github/workflows/nested/release.yaml");

  auto revs = repo.revisions_for_path(".github/workflows/ci.yml");
  REQUIRE(revs.size() == 2);
  CHECK(revs[0].id == c2);
  CHECK(revs[1].id == c1);
  CHECK(revs[0].message == "Update CI\n\nWith a body line.");
  CHECK(revs[1].message == "Add CI");
  CHECK(revs[0].author_time > revs[1].author_time);

  CHECK(repo.read_file_at(c1, ".github/workflows/ci.yml") ==
        std::string("name: ci v1\n"));
  CHECK(repo.read_file_at(c2, ".github/workflows/ci.yml") ==
        std::string("name: ci v2\n"));
  CHECK_FALSE(
      repo.read_file_at(c1, ".github/workflows/nested/release.yaml"));
}

TEST_CASE("reopening a clone fetches new commits", "[git]") {
  ScratchDir tmp("gitrefresh");
  SourceRepo src(tmp.path() / "src");
  src.write(".github/workflows/ci.yml", "a\n");
  src.commit("one");
  const auto dir = tmp.path() / "cache" / "src";
  GitRepository::clone_or_open(src.url(), dir, "main");

  src.write(".github/workflows/ci.yml", "b\n");
  src.commit("two");
  GitRepository again = GitRepository::clone_or_open(src.url(), dir, "main");
  CHECK(again.revisions_for_path(".github/workflows/ci.yml").size() == 2);
}

TEST_CASE("stale clone is reused when the remote is gone", "[git]") {
  ScratchDir tmp("gitstale");
  const auto dir = tmp.path() / "cache" / "src";
  {
    SourceRepo src(tmp.path() / "src");
    src.write(".github/workflows/ci.yml", "a\n");
    src.commit("one");
    GitRepository::clone_or_open(src.url(), dir, "main");
  }
  std::filesystem::remove_all(tmp.path() / "src");
  GitRepository cached =
      GitRepository::clone_or_open(tmp.path().string() + "/src", dir, "main");
  CHECK(cached.list_files(".github/workflows/").size() == 1);
}

TEST_CASE("failed clone leaves no directory behind", "[git]") {
  ScratchDir tmp("gitfail");
  const auto dir = tmp.path() / "cache" / "nothing";
  try {
    GitRepository::clone_or_open((tmp.path() / "missing").string(), dir,
                                 "main");
    FAIL("expected GitCommandError");
  } catch (const GitCommandError &e) {
    CHECK(e.exit_code() != 0);
    CHECK(e.command().find("clone") != std::string::npos);
  }
  CHECK_FALSE(std::filesystem::exists(dir));
}

TEST_CASE("cancelled clone raises OperationCancelled", "[git]") {
  ScratchDir tmp("gitcancel");
  SourceRepo src(tmp.path() / "src");
  src.write("x", "x\n");
  src.commit("x");
  CancellationToken token;
  token.cancel();
  REQUIRE_THROWS_AS(GitRepository::clone_or_open(src.url(),
                                                 tmp.path() / "c", "main", {},
                                                 &token),
                    OperationCancelled);
}

TEST_CASE("workflow file extensions", "[git]") {
  CHECK(is_workflow_file(".github/workflows/ci.yml"));
  CHECK(is_workflow_file(".github/workflows/ci.yaml"));
  CHECK_FALSE(is_workflow_file(".github/workflows/README.md"));
  CHECK_FALSE(is_workflow_file(".github/workflows/yml"));
}
