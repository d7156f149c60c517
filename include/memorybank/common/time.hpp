#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace memorybank::common {

[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::string format_rfc3339(std::time_t value);
[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point value);

// Accepts "YYYY-MM-DDTHH:MM:SS" optionally followed by fractional seconds and a
// "Z" or "+HH:MM" offset, or a bare "YYYY-MM-DD" date.
[[nodiscard]] std::optional<std::time_t> parse_rfc3339(const std::string &value);

// Re-emits a parseable timestamp in second-precision UTC so that values compare
// lexicographically.
[[nodiscard]] std::optional<std::string> normalize_timestamp(const std::string &value);

} // namespace memorybank::common
