#include "util/time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace ghtp {

namespace {

long unit_seconds(char unit) {
  switch (std::tolower(static_cast<unsigned char>(unit))) {
  case 's':
    return 1;
  case 'm':
    return 60;
  case 'h':
    return 3600;
  case 'd':
    return 86400;
  case 'w':
    return 604800;
  default:
    throw std::runtime_error(std::string("Invalid duration suffix '") + unit +
                             "'");
  }
}

constexpr long kMaxSeconds = std::numeric_limits<long>::max();

[[noreturn]] void throw_overflow(const std::string &str) {
  throw std::runtime_error("Duration '" + str + "' is out of range");
}

} // namespace

std::chrono::seconds parse_duration(const std::string &str) {
  long total = 0;
  std::size_t i = 0;
  bool has_unit = false;
  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::runtime_error("Invalid duration string '" + str + "'");
    }
    long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      long digit = str[i] - '0';
      if (value > (kMaxSeconds - digit) / 10) {
        throw_overflow(str);
      }
      value = value * 10 + digit;
      ++i;
    }
    if (i == str.size()) {
      if (has_unit) {
        throw std::runtime_error("Missing unit in duration '" + str + "'");
      }
      if (value > kMaxSeconds - total) {
        throw_overflow(str);
      }
      total += value;
      break;
    }
    long unit = unit_seconds(str[i]);
    if (value > (kMaxSeconds - total) / unit) {
      throw_overflow(str);
    }
    total += value * unit;
    ++i;
    has_unit = true;
  }
  return std::chrono::seconds{total};
}

std::string format_duration(std::chrono::seconds value) {
  long total = static_cast<long>(value.count());
  if (total <= 0) {
    return "0s";
  }
  long hours = total / 3600;
  long minutes = (total % 3600) / 60;
  long seconds = total % 60;
  std::ostringstream oss;
  if (hours > 0) {
    oss << hours << "h";
  }
  if (minutes > 0) {
    if (hours > 0)
      oss << ' ';
    oss << minutes << "m";
  }
  if (seconds > 0 || (hours == 0 && minutes == 0)) {
    if (hours > 0 || minutes > 0)
      oss << ' ';
    oss << seconds << "s";
  }
  return oss.str();
}

std::string format_iso8601_utc(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

} // namespace ghtp
