#include "util/timestamp.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace wfh {

std::string format_utc(std::int64_t epoch_seconds) {
  std::time_t t = static_cast<std::time_t>(epoch_seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string utc_now() {
  auto now = std::chrono::system_clock::now();
  return format_utc(std::chrono::duration_cast<std::chrono::seconds>(
                        now.time_since_epoch())
                        .count());
}

} // namespace wfh
