/**
 * @file duration.hpp
 * @brief Human-readable duration parsing and formatting.
 *
 * Used for timeouts and heartbeat intervals given on the command line or in
 * configuration files ("30m", "1h30m", "45").
 */
#ifndef WORKFLOWHARVEST_UTIL_DURATION_HPP
#define WORKFLOWHARVEST_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace wfh {

/**
 * Parse a duration string such as "10s", "5m", "2h", "1d" or "1h30m" into
 * seconds. Units can be combined and a bare number means seconds.
 *
 * @param str Duration string; an empty string yields zero.
 * @return Parsed duration in seconds.
 * @throws std::runtime_error On an invalid format or unit suffix, or when
 *         the value does not fit in milliseconds.
 */
std::chrono::seconds parse_duration(const std::string &str);

/**
 * Render a duration as a compact string ("1h2m3s", "45s", "0s").
 */
std::string format_duration(std::chrono::seconds value);

} // namespace wfh

#endif // WORKFLOWHARVEST_UTIL_DURATION_HPP
