#pragma once

#include "memorybank/metadata/frontmatter.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace memorybank::metadata {

enum class ValidationStatus { Valid, Invalid, Unknown };

[[nodiscard]] std::string_view to_string(ValidationStatus status);
[[nodiscard]] std::optional<ValidationStatus> validation_status_from_string(std::string_view value);

enum class FieldKind { Text, TextList, Timestamp, Choice };

struct FieldRule {
  std::string field;
  FieldKind kind = FieldKind::Text;
  bool required = false;
  std::size_t min_length = 0;
  std::vector<std::string> choices;
};

struct DocumentSchema {
  std::string doc_type;
  std::vector<FieldRule> rules;
};

struct ValidationResult {
  ValidationStatus status = ValidationStatus::Unknown;
  std::vector<std::string> errors;
};

// Header checks keyed by the front-matter "type" field. Documents whose type has
// no registered schema validate as Unknown, never Invalid.
class SchemaRegistry {
public:
  SchemaRegistry() = default;
  SchemaRegistry(const SchemaRegistry &other);
  SchemaRegistry &operator=(const SchemaRegistry &other);

  [[nodiscard]] static SchemaRegistry with_defaults();
  // Rules every registered schema starts from: tags, created, updated.
  [[nodiscard]] static std::vector<FieldRule> base_rules();

  void register_schema(DocumentSchema schema);
  [[nodiscard]] bool has_schema(const std::string &doc_type) const;
  [[nodiscard]] std::vector<std::string> doc_types() const;

  [[nodiscard]] ValidationResult validate(const FrontMatter &header) const;

private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, DocumentSchema> schemas_;
};

} // namespace memorybank::metadata
