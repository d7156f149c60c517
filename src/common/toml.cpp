#include "memorybank/common/toml.hpp"

#include "memorybank/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace memorybank::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && (i == 0 || line[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch == '\\' && i + 2 < value.size()) {
      const char next = value[++i];
      switch (next) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(next);
        break;
      }
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

std::optional<bool> TomlDocument::find_bool(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return std::nullopt;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  return find_bool(key).value_or(fallback);
}

std::optional<std::uint64_t> TomlDocument::find_u64(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }

  std::string normalized = trim(it->second);
  normalized.erase(std::remove(normalized.begin(), normalized.end(), '_'), normalized.end());
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last || normalized.empty()) {
    return std::nullopt;
  }
  return parsed;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  return find_u64(key).value_or(fallback);
}

std::optional<double> TomlDocument::find_double(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }

  const std::string normalized = trim(it->second);
  if (normalized.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double parsed = std::strtod(normalized.c_str(), &end);
  if (end != normalized.c_str() + normalized.size()) {
    return std::nullopt;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  return find_double(key).value_or(fallback);
}

std::vector<std::string> TomlDocument::keys_in(const std::string &section) const {
  const std::string prefix = section + ".";
  std::vector<std::string> out;
  for (const auto &[key, _] : values) {
    if (starts_with(key, prefix)) {
      out.push_back(key.substr(prefix.size()));
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure(
            ErrorCode::ConfigError, "Invalid empty section at line " + std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure(
          ErrorCode::ConfigError, "Invalid key/value at line " + std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorCode::ConfigError,
                                           "Missing key at line " + std::to_string(line_number));
    }
    if (value.empty()) {
      return Result<TomlDocument>::failure(
          ErrorCode::ConfigError, "Missing value for '" + key + "' at line " +
                                      std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace memorybank::common
