#pragma once

#include "memorybank/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace memorybank::common {

// Flat view of a TOML file: keys are "section.key", values keep their raw
// right-hand side text until a typed getter interprets them.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;

  // Strict variants: nullopt when the key is missing or the value has the wrong type.
  [[nodiscard]] std::optional<bool> find_bool(const std::string &key) const;
  [[nodiscard]] std::optional<std::uint64_t> find_u64(const std::string &key) const;
  [[nodiscard]] std::optional<double> find_double(const std::string &key) const;

  [[nodiscard]] std::vector<std::string> keys_in(const std::string &section) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace memorybank::common
