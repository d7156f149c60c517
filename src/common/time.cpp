#include "memorybank/common/time.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace memorybank::common {

namespace {

std::time_t utc_to_time_t(std::tm *tm) {
#ifdef _WIN32
  return _mkgmtime(tm);
#else
  return timegm(tm);
#endif
}

} // namespace

std::string format_rfc3339(const std::time_t value) {
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &value);
#else
  gmtime_r(&value, &tm);
#endif

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string format_rfc3339(const std::chrono::system_clock::time_point value) {
  return format_rfc3339(std::chrono::system_clock::to_time_t(value));
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

std::optional<std::time_t> parse_rfc3339(const std::string &value) {
  if (value.size() < 10) {
    return std::nullopt;
  }

  std::tm tm{};
  std::istringstream in(value.substr(0, 10));
  in >> std::get_time(&tm, "%Y-%m-%d");
  if (in.fail()) {
    return std::nullopt;
  }
  if (value.size() == 10) {
    return utc_to_time_t(&tm);
  }

  if (value.size() < 19 || (value[10] != 'T' && value[10] != 't' && value[10] != ' ')) {
    return std::nullopt;
  }
  std::istringstream time_in(value.substr(11, 8));
  time_in >> std::get_time(&tm, "%H:%M:%S");
  if (time_in.fail()) {
    return std::nullopt;
  }

  std::size_t pos = 19;
  if (pos < value.size() && value[pos] == '.') {
    ++pos;
    while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])) != 0) {
      ++pos;
    }
  }

  std::time_t result = utc_to_time_t(&tm);
  if (pos == value.size()) {
    return result;
  }
  if ((value[pos] == 'Z' || value[pos] == 'z') && pos + 1 == value.size()) {
    return result;
  }
  if ((value[pos] == '+' || value[pos] == '-') && pos + 6 == value.size() && value[pos + 3] == ':') {
    const std::string hours = value.substr(pos + 1, 2);
    const std::string minutes = value.substr(pos + 4, 2);
    if (std::isdigit(static_cast<unsigned char>(hours[0])) == 0 ||
        std::isdigit(static_cast<unsigned char>(hours[1])) == 0 ||
        std::isdigit(static_cast<unsigned char>(minutes[0])) == 0 ||
        std::isdigit(static_cast<unsigned char>(minutes[1])) == 0) {
      return std::nullopt;
    }
    const long offset = std::stol(hours) * 3600 + std::stol(minutes) * 60;
    return value[pos] == '+' ? result - offset : result + offset;
  }
  return std::nullopt;
}

std::optional<std::string> normalize_timestamp(const std::string &value) {
  const auto parsed = parse_rfc3339(value);
  if (!parsed.has_value()) {
    return std::nullopt;
  }
  return format_rfc3339(*parsed);
}

} // namespace memorybank::common
