#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace memorybank::metadata {

struct FrontMatterValue {
  bool is_list = false;
  std::string scalar;
  std::vector<std::string> items;
  // False for maps, nested lists and other shapes the index does not model.
  bool well_formed = true;
};

// Header fields in file order.
class FrontMatter {
public:
  void set(const std::string &key, std::string value);
  void set_list(const std::string &key, std::vector<std::string> items);
  void set_value(const std::string &key, FrontMatterValue value);

  [[nodiscard]] const FrontMatterValue *find(const std::string &key) const;
  [[nodiscard]] bool has(const std::string &key) const { return find(key) != nullptr; }
  // Scalar fields only.
  [[nodiscard]] std::optional<std::string> get_string(const std::string &key) const;
  // A scalar is treated as a one-element list.
  [[nodiscard]] std::vector<std::string> get_list(const std::string &key) const;

  [[nodiscard]] bool empty() const { return fields_.empty(); }
  [[nodiscard]] const std::vector<std::pair<std::string, FrontMatterValue>> &fields() const {
    return fields_;
  }

private:
  std::vector<std::pair<std::string, FrontMatterValue>> fields_;
};

struct ParsedDocument {
  bool has_header = false;
  bool header_valid = false;
  std::string parse_error;
  FrontMatter header;
  std::string body;
};

// A header is a leading "---" line, YAML, and a closing "---" (or "...") line.
// Content without one parses to an empty header with the full text as body.
[[nodiscard]] ParsedDocument parse_document(const std::string &content);

[[nodiscard]] std::string render_front_matter(const FrontMatter &header);
[[nodiscard]] std::string render_document(const FrontMatter &header, const std::string &body);

} // namespace memorybank::metadata
