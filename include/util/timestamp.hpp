/**
 * @file timestamp.hpp
 * @brief UTC timestamp formatting for persisted records.
 */
#ifndef WORKFLOWHARVEST_UTIL_TIMESTAMP_HPP
#define WORKFLOWHARVEST_UTIL_TIMESTAMP_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace wfh {

/// Format seconds since the epoch as `YYYY-MM-DDTHH:MM:SSZ`.
std::string format_utc(std::int64_t epoch_seconds);

/// Current time formatted with format_utc().
std::string utc_now();

} // namespace wfh

#endif // WORKFLOWHARVEST_UTIL_TIMESTAMP_HPP
