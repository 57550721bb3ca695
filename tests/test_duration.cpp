#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>

using namespace wfh;
using namespace std::chrono;

TEST_CASE("parse_duration supports combined units") {
  CHECK(parse_duration("1h30m") == seconds{3600 + 30 * 60});
  CHECK(parse_duration("2d3h4m5s") ==
        seconds{2 * 86400 + 3 * 3600 + 4 * 60 + 5});
  CHECK(parse_duration("30M") == seconds{1800});
  CHECK(parse_duration("10") == seconds{10});
  CHECK(parse_duration("") == seconds{0});
}

TEST_CASE("parse_duration rejects invalid strings") {
  CHECK_THROWS_AS(parse_duration("1h30"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("10m5"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("abc"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("1.5h"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("5w"), std::runtime_error);
}

TEST_CASE("parse_duration rejects values that overflow") {
  CHECK_THROWS_AS(parse_duration("99999999999999999999999"),
                  std::runtime_error);
  CHECK_THROWS_AS(parse_duration("9223372036854775807s"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("999999999999999d"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("9000000000000000s9000000000000000s"),
                  std::runtime_error);
  CHECK(parse_duration("3650d") == seconds{3650LL * 86400});
}

TEST_CASE("format_duration prints compact units") {
  CHECK(format_duration(seconds{0}) == "0s");
  CHECK(format_duration(seconds{-4}) == "0s");
  CHECK(format_duration(seconds{45}) == "45s");
  CHECK(format_duration(seconds{1800}) == "30m");
  CHECK(format_duration(seconds{3600 + 61}) == "1h1m1s");
  CHECK(parse_duration(format_duration(seconds{7325})) == seconds{7325});
}
