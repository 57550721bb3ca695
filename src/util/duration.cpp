#include "util/duration.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace wfh {

std::chrono::seconds parse_duration(const std::string &str) {
  if (str.empty()) {
    return std::chrono::seconds{0};
  }

  // Callers convert to milliseconds, which must not overflow either.
  constexpr long long kMax = std::numeric_limits<long long>::max() / 1000;
  auto too_large = [&str]() {
    return std::runtime_error("Duration out of range: " + str);
  };

  long long total = 0;
  std::size_t i = 0;
  bool has_unit = false;

  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::runtime_error("Invalid duration string: " + str);
    }

    long long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      const int digit = str[i] - '0';
      if (value > (kMax - digit) / 10) {
        throw too_large();
      }
      value = value * 10 + digit;
      ++i;
    }

    long long unit_seconds = 1;
    if (i == str.size()) {
      if (has_unit) {
        throw std::runtime_error("Missing unit in duration: " + str);
      }
    } else {
      char unit = static_cast<char>(
          std::tolower(static_cast<unsigned char>(str[i])));
      ++i;
      switch (unit) {
      case 's':
        break;
      case 'm':
        unit_seconds = 60;
        break;
      case 'h':
        unit_seconds = 3600;
        break;
      case 'd':
        unit_seconds = 86400;
        break;
      default:
        throw std::runtime_error("Invalid duration suffix in: " + str);
      }
      has_unit = true;
    }

    if (value > kMax / unit_seconds ||
        total > kMax - value * unit_seconds) {
      throw too_large();
    }
    total += value * unit_seconds;
  }

  return std::chrono::seconds{total};
}

std::string format_duration(std::chrono::seconds value) {
  long long total = value.count();
  if (total <= 0) {
    return "0s";
  }
  const long long hours = total / 3600;
  const long long minutes = (total % 3600) / 60;
  const long long seconds = total % 60;
  std::string out;
  if (hours > 0) {
    out += std::to_string(hours) + "h";
  }
  if (minutes > 0) {
    out += std::to_string(minutes) + "m";
  }
  if (seconds > 0) {
    out += std::to_string(seconds) + "s";
  }
  return out;
}

} // namespace wfh
