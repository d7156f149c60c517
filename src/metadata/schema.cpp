#include "memorybank/metadata/schema.hpp"

#include "memorybank/common/time.hpp"

#include <algorithm>
#include <mutex>

namespace memorybank::metadata {

namespace {

std::string join_choices(const std::vector<std::string> &choices) {
  std::string out;
  for (const auto &choice : choices) {
    if (!out.empty()) {
      out += ", ";
    }
    out += choice;
  }
  return out;
}

void check_rule(const FieldRule &rule, const FrontMatter &header, std::vector<std::string> &errors) {
  const auto *value = header.find(rule.field);
  if (value == nullptr) {
    if (rule.required) {
      errors.push_back(rule.field + " is required");
    }
    return;
  }
  if (!value->well_formed) {
    errors.push_back(rule.field + " has an unsupported structure");
    return;
  }

  switch (rule.kind) {
  case FieldKind::TextList:
    if (!value->is_list) {
      errors.push_back(rule.field + " must be a list of strings");
    }
    return;
  case FieldKind::Text:
  case FieldKind::Timestamp:
  case FieldKind::Choice:
    if (value->is_list) {
      errors.push_back(rule.field + " must be a single value");
      return;
    }
    break;
  }

  const std::string &text = value->scalar;
  if (rule.kind == FieldKind::Text && text.size() < rule.min_length) {
    if (rule.min_length <= 1) {
      errors.push_back(rule.field + " is required");
    } else {
      errors.push_back(rule.field + " must be at least " + std::to_string(rule.min_length) +
                       " characters");
    }
  } else if (rule.kind == FieldKind::Timestamp && !common::parse_rfc3339(text).has_value()) {
    errors.push_back(rule.field + " must be an RFC 3339 timestamp");
  } else if (rule.kind == FieldKind::Choice &&
             std::find(rule.choices.begin(), rule.choices.end(), text) == rule.choices.end()) {
    errors.push_back(rule.field + " must be one of: " + join_choices(rule.choices));
  }
}

DocumentSchema extend_base(std::string doc_type, std::vector<FieldRule> rules) {
  DocumentSchema schema{.doc_type = std::move(doc_type), .rules = SchemaRegistry::base_rules()};
  for (auto &rule : rules) {
    schema.rules.push_back(std::move(rule));
  }
  return schema;
}

} // namespace

std::string_view to_string(const ValidationStatus status) {
  switch (status) {
  case ValidationStatus::Valid:
    return "valid";
  case ValidationStatus::Invalid:
    return "invalid";
  case ValidationStatus::Unknown:
    return "unknown";
  }
  return "unknown";
}

std::optional<ValidationStatus> validation_status_from_string(const std::string_view value) {
  if (value == "valid") {
    return ValidationStatus::Valid;
  }
  if (value == "invalid") {
    return ValidationStatus::Invalid;
  }
  if (value == "unknown") {
    return ValidationStatus::Unknown;
  }
  return std::nullopt;
}

SchemaRegistry::SchemaRegistry(const SchemaRegistry &other) {
  std::shared_lock<std::shared_mutex> lock(other.mutex_);
  schemas_ = other.schemas_;
}

SchemaRegistry &SchemaRegistry::operator=(const SchemaRegistry &other) {
  if (this == &other) {
    return *this;
  }
  std::map<std::string, DocumentSchema> copy;
  {
    std::shared_lock<std::shared_mutex> lock(other.mutex_);
    copy = other.schemas_;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  schemas_ = std::move(copy);
  return *this;
}

std::vector<FieldRule> SchemaRegistry::base_rules() {
  return {
      FieldRule{.field = "tags", .kind = FieldKind::TextList},
      FieldRule{.field = "created", .kind = FieldKind::Timestamp},
      FieldRule{.field = "updated", .kind = FieldKind::Timestamp},
  };
}

SchemaRegistry SchemaRegistry::with_defaults() {
  SchemaRegistry registry;
  registry.register_schema(extend_base(
      "projectBrief",
      {FieldRule{.field = "title", .kind = FieldKind::Text, .required = true, .min_length = 1},
       FieldRule{.field = "description", .kind = FieldKind::Text, .required = true, .min_length = 10},
       FieldRule{.field = "status",
                 .kind = FieldKind::Choice,
                 .choices = {"draft", "active", "completed", "archived"}},
       FieldRule{.field = "priority",
                 .kind = FieldKind::Choice,
                 .choices = {"low", "medium", "high", "critical"}}}));
  registry.register_schema(extend_base(
      "researchNote",
      {FieldRule{.field = "topic", .kind = FieldKind::Text, .required = true, .min_length = 1},
       FieldRule{.field = "sources", .kind = FieldKind::TextList},
       FieldRule{.field = "confidence", .kind = FieldKind::Choice, .choices = {"low", "medium", "high"}}}));
  registry.register_schema(extend_base(
      "progress",
      {FieldRule{.field = "phase", .kind = FieldKind::Text},
       FieldRule{.field = "status",
                 .kind = FieldKind::Choice,
                 .choices = {"not-started", "in-progress", "completed", "blocked"}},
       FieldRule{.field = "blockers", .kind = FieldKind::TextList}}));
  registry.register_schema(extend_base(
      "systemPattern",
      {FieldRule{.field = "pattern", .kind = FieldKind::Text, .required = true, .min_length = 1},
       FieldRule{.field = "category",
                 .kind = FieldKind::Choice,
                 .choices = {"architecture", "design", "performance", "security"}}}));
  return registry;
}

void SchemaRegistry::register_schema(DocumentSchema schema) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  schemas_[schema.doc_type] = std::move(schema);
}

bool SchemaRegistry::has_schema(const std::string &doc_type) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return schemas_.contains(doc_type);
}

std::vector<std::string> SchemaRegistry::doc_types() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> out;
  out.reserve(schemas_.size());
  for (const auto &[doc_type, _] : schemas_) {
    out.push_back(doc_type);
  }
  return out;
}

ValidationResult SchemaRegistry::validate(const FrontMatter &header) const {
  const auto doc_type = header.get_string("type");
  if (!doc_type.has_value()) {
    return {};
  }

  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = schemas_.find(*doc_type);
  if (it == schemas_.end()) {
    return {};
  }

  ValidationResult result;
  for (const auto &rule : it->second.rules) {
    check_rule(rule, header, result.errors);
  }
  result.status = result.errors.empty() ? ValidationStatus::Valid : ValidationStatus::Invalid;
  return result;
}

} // namespace memorybank::metadata
