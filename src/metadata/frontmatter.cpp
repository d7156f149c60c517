#include "memorybank/metadata/frontmatter.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>

namespace memorybank::metadata {

namespace {

bool is_delimiter(const std::string &line, const bool closing) {
  std::string trimmed = line;
  while (!trimmed.empty() && (trimmed.back() == '\r' || trimmed.back() == ' ' || trimmed.back() == '\t')) {
    trimmed.pop_back();
  }
  return trimmed == "---" || (closing && trimmed == "...");
}

FrontMatterValue to_value(const YAML::Node &node) {
  FrontMatterValue value;
  if (node.IsNull()) {
    return value;
  }
  if (node.IsScalar()) {
    value.scalar = node.Scalar();
    return value;
  }
  if (node.IsSequence()) {
    value.is_list = true;
    for (const auto &item : node) {
      if (!item.IsScalar()) {
        value.well_formed = false;
        continue;
      }
      value.items.push_back(item.Scalar());
    }
    return value;
  }
  value.well_formed = false;
  return value;
}

} // namespace

void FrontMatter::set_value(const std::string &key, FrontMatterValue value) {
  const auto it = std::find_if(fields_.begin(), fields_.end(),
                               [&](const auto &field) { return field.first == key; });
  if (it != fields_.end()) {
    it->second = std::move(value);
    return;
  }
  fields_.emplace_back(key, std::move(value));
}

void FrontMatter::set(const std::string &key, std::string value) {
  FrontMatterValue field;
  field.scalar = std::move(value);
  set_value(key, std::move(field));
}

void FrontMatter::set_list(const std::string &key, std::vector<std::string> items) {
  FrontMatterValue field;
  field.is_list = true;
  field.items = std::move(items);
  set_value(key, std::move(field));
}

const FrontMatterValue *FrontMatter::find(const std::string &key) const {
  const auto it = std::find_if(fields_.begin(), fields_.end(),
                               [&](const auto &field) { return field.first == key; });
  return it == fields_.end() ? nullptr : &it->second;
}

std::optional<std::string> FrontMatter::get_string(const std::string &key) const {
  const auto *value = find(key);
  if (value == nullptr || value->is_list || !value->well_formed) {
    return std::nullopt;
  }
  return value->scalar;
}

std::vector<std::string> FrontMatter::get_list(const std::string &key) const {
  const auto *value = find(key);
  if (value == nullptr) {
    return {};
  }
  if (value->is_list) {
    return value->items;
  }
  if (value->well_formed && !value->scalar.empty()) {
    return {value->scalar};
  }
  return {};
}

ParsedDocument parse_document(const std::string &content) {
  ParsedDocument doc;
  doc.body = content;

  const auto first_newline = content.find('\n');
  if (first_newline == std::string::npos || !is_delimiter(content.substr(0, first_newline), false)) {
    return doc;
  }

  std::size_t pos = first_newline + 1;
  std::size_t header_end = std::string::npos;
  std::size_t body_start = content.size();
  while (pos <= content.size()) {
    const auto next = content.find('\n', pos);
    const auto line_end = next == std::string::npos ? content.size() : next;
    if (is_delimiter(content.substr(pos, line_end - pos), true)) {
      header_end = pos;
      body_start = next == std::string::npos ? content.size() : next + 1;
      break;
    }
    if (next == std::string::npos) {
      break;
    }
    pos = next + 1;
  }

  if (header_end == std::string::npos) {
    return doc;
  }

  doc.has_header = true;
  doc.body = content.substr(body_start);
  const std::string yaml = content.substr(first_newline + 1, header_end - first_newline - 1);

  try {
    const YAML::Node root = YAML::Load(yaml);
    if (root.IsNull()) {
      doc.header_valid = true;
      return doc;
    }
    if (!root.IsMap()) {
      doc.parse_error = "front matter is not a mapping";
      return doc;
    }
    for (const auto &field : root) {
      if (!field.first.IsScalar()) {
        continue;
      }
      doc.header.set_value(field.first.Scalar(), to_value(field.second));
    }
    doc.header_valid = true;
  } catch (const YAML::Exception &e) {
    doc.parse_error = e.what();
    doc.header = FrontMatter{};
  }
  return doc;
}

std::string render_front_matter(const FrontMatter &header) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  for (const auto &[key, value] : header.fields()) {
    out << YAML::Key << key << YAML::Value;
    if (value.is_list) {
      out << YAML::BeginSeq;
      for (const auto &item : value.items) {
        out << item;
      }
      out << YAML::EndSeq;
    } else {
      out << value.scalar;
    }
  }
  out << YAML::EndMap;
  return std::string("---\n") + out.c_str() + "\n---\n";
}

std::string render_document(const FrontMatter &header, const std::string &body) {
  if (header.empty()) {
    return body;
  }
  return render_front_matter(header) + body;
}

} // namespace memorybank::metadata
