#include "memorybank/core/templates.hpp"

#include "memorybank/common/hash.hpp"
#include "memorybank/common/time.hpp"

namespace memorybank::core::templates {

std::string default_template(const storage::FileType type) {
  using storage::FileType;
  switch (type) {
  case FileType::ProjectBrief:
    return std::string(PROJECT_BRIEF);
  case FileType::ProductContext:
    return std::string(PRODUCT_CONTEXT);
  case FileType::ActiveContext:
    return std::string(ACTIVE_CONTEXT);
  case FileType::ProgressCurrent:
    return std::string(PROGRESS_CURRENT);
  case FileType::ProgressHistory:
    return std::string(PROGRESS_HISTORY);
  case FileType::ProgressIndex:
    return std::string(PROGRESS_INDEX);
  case FileType::SystemPatternsIndex:
    return std::string(SYSTEM_PATTERNS_INDEX);
  case FileType::SystemPatternsArchitecture:
    return std::string(SYSTEM_PATTERNS_ARCHITECTURE);
  case FileType::SystemPatternsPatterns:
    return std::string(SYSTEM_PATTERNS_PATTERNS);
  case FileType::SystemPatternsScanning:
    return std::string(SYSTEM_PATTERNS_SCANNING);
  case FileType::TechContextIndex:
    return std::string(TECH_CONTEXT_INDEX);
  case FileType::TechContextStack:
    return std::string(TECH_CONTEXT_STACK);
  case FileType::TechContextDependencies:
    return std::string(TECH_CONTEXT_DEPENDENCIES);
  case FileType::TechContextEnvironment:
    return std::string(TECH_CONTEXT_ENVIRONMENT);
  }
  return "# " + std::string(storage::to_string(type)) + "\n\nThis file is auto-generated.\n";
}

TemplateProvider default_provider() {
  return [](const storage::FileType type) { return default_template(type); };
}

common::Result<metadata::FrontMatter> generated_header(const storage::FileType type,
                                                       const std::string &timestamp) {
  const auto &info = storage::file_type_info(type);
  const std::string id(info.id);
  const auto uuid = common::random_uuid_v4();
  if (!uuid.ok()) {
    return common::Result<metadata::FrontMatter>::failure(uuid.details());
  }

  metadata::FrontMatter header;
  header.set("id", "urn:uuid:" + uuid.value());
  header.set("title", "Title for " + id);
  header.set("description", "Description for " + id);
  header.set("type", std::string(info.doc_type));
  if (info.doc_type == "systemPattern") {
    header.set("pattern", id);
  }
  header.set_list("tags", {"autogenerated"});
  header.set("created", timestamp);
  header.set("updated", timestamp);
  return common::Result<metadata::FrontMatter>::success(std::move(header));
}

common::Result<std::string> render_initial_content(const storage::FileType type,
                                                   const TemplateProvider &provider) {
  const std::string raw = provider ? provider(type) : default_template(type);
  const auto parsed = metadata::parse_document(raw);

  auto header = generated_header(type, common::now_rfc3339());
  if (!header.ok()) {
    return common::Result<std::string>::failure(header.details());
  }
  if (parsed.has_header && parsed.header_valid) {
    for (const auto &[key, value] : parsed.header.fields()) {
      header.value().set_value(key, value);
    }
  }
  return common::Result<std::string>::success(
      metadata::render_document(header.value(), parsed.body));
}

} // namespace memorybank::core::templates
