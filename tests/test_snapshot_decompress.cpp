#include "git_fixture.hpp"
#include "snapshot_decompress.hpp"
#include "util/atomic_file.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace wfh;
using wfh::test::ScratchDir;

TEST_CASE("compressed snapshots are expanded in place") {
  ScratchDir tmp("decompress");
  const auto dir = tmp.path() / "acme" / "tool" / ".github" / "workflows" /
                   "ci.yml";
  write_file_atomic(dir / "aaa.yml.gz", "on: push\n", true);
  write_file_atomic(dir / "bbb.yml.gz", "on: pull_request\n", true);
  write_file_atomic(dir / "ccc.yml.gz", "fresh\n", true);
  write_file_atomic(dir / "ccc.yml", "already here\n");
  wfh::test::write_text(dir / "notes.txt.gz", "ignored");

  DecompressStats stats = decompress_snapshots(tmp.path(), false, 2);
  CHECK(stats.converted == 2);
  CHECK(stats.skipped == 1);
  CHECK(stats.failed == 0);
  CHECK(wfh::test::read_text(dir / "aaa.yml") == "on: push\n");
  CHECK_FALSE(std::filesystem::exists(dir / "aaa.yml.gz"));
  CHECK(wfh::test::read_text(dir / "ccc.yml") == "already here\n");
  CHECK(std::filesystem::exists(dir / "notes.txt.gz"));
}

TEST_CASE("originals can be kept") {
  ScratchDir tmp("decompresskeep");
  write_file_atomic(tmp.path() / "x.yml.gz", "x\n", true);
  DecompressStats stats = decompress_snapshots(tmp.path(), true, 1);
  CHECK(stats.converted == 1);
  CHECK(std::filesystem::exists(tmp.path() / "x.yml.gz"));
  CHECK(std::filesystem::exists(tmp.path() / "x.yml"));
}

TEST_CASE("corrupt archives are counted and left alone") {
  ScratchDir tmp("decompressbad");
  // Valid gzip header followed by a deflate block of reserved type.
  std::string corrupt("\x1f\x8b\x08\x00\x00\x00\x00\x00\x00\x03", 10);
  corrupt += std::string(16, '\xff');
  wfh::test::write_text(tmp.path() / "bad.yml.gz", corrupt);
  // Plain text under a .gz name.
  wfh::test::write_text(tmp.path() / "plain.yml.gz", "on: push\n");

  DecompressStats stats = decompress_snapshots(tmp.path(), false, 2);
  CHECK(stats.failed == 2);
  CHECK(stats.converted == 0);
  CHECK(std::filesystem::exists(tmp.path() / "bad.yml.gz"));
  CHECK_FALSE(std::filesystem::exists(tmp.path() / "bad.yml"));
  CHECK_FALSE(std::filesystem::exists(tmp.path() / "plain.yml"));
}

TEST_CASE("decompress requires a directory") {
  ScratchDir tmp("decompressnone");
  REQUIRE_THROWS_AS(decompress_snapshots(tmp.path() / "missing"),
                    std::runtime_error);
}
