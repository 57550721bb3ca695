#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <spdlog/spdlog.h>
#include <thread>

namespace {
std::string slurp(const char *path) {
  std::ifstream f(path);
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}
} // namespace

TEST_CASE("test log") {
  const char *path = "wfh_test.log";
  std::remove(path);
  // Created before the file sink exists; must still reach the file.
  auto early = wfh::category_logger("logtest");
  wfh::init_logger(spdlog::level::info, "", path);
  spdlog::debug("debug message");
  spdlog::info("info message");
  early->debug("category debug");
  early->info("category message");

  // Loggers are asynchronous; other tests keep using them, so no shutdown.
  std::string content;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    spdlog::apply_all(
        [](const std::shared_ptr<spdlog::logger> &l) { l->flush(); });
    content = slurp(path);
    if (content.find("category message") != std::string::npos) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("category message") != std::string::npos);
  REQUIRE(content.find("debug message") == std::string::npos);
  REQUIRE(content.find("category debug") == std::string::npos);
}
