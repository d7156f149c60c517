#include "test_framework.hpp"

#include "memorybank/common/time.hpp"
#include "memorybank/metadata/frontmatter.hpp"
#include "memorybank/metadata/index_store.hpp"
#include "memorybank/metadata/metadata_index.hpp"
#include "memorybank/metadata/schema.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>

namespace {

namespace md = memorybank::metadata;

std::string doc(const std::string &header, const std::string &body = "Body text here.\n") {
  return "---\n" + header + "---\n" + body;
}

bool has_error(const std::vector<std::string> &errors, const std::string &needle) {
  return std::any_of(errors.begin(), errors.end(), [&](const std::string &error) {
    return error.find(needle) != std::string::npos;
  });
}

std::vector<std::string> paths_of(const std::vector<md::IndexEntry> &entries) {
  std::vector<std::string> out;
  for (const auto &entry : entries) {
    out.push_back(entry.relative_path);
  }
  return out;
}

// Four documents with distinct sizes, tags and dates.
void seed(md::MetadataIndex &index) {
  index.upsert("notes/alpha.md", doc("title: Alpha Note\ntype: researchNote\ntopic: caching\n"
                                     "tags: [Cache, perf]\ncreated: 2024-01-01T00:00:00Z\n"
                                     "updated: 2024-01-10T00:00:00Z\n"));
  index.upsert("notes/beta.md", doc("title: Beta\ntags: [cache]\ncreated: 2024-02-01T00:00:00Z\n"
                                    "updated: 2024-02-10T00:00:00Z\n",
                                    std::string(500, 'b') + "\n"));
  index.upsert("core/projectBrief.md",
               doc("title: Brief\ntype: projectBrief\ndescription: A long enough description\n"
                   "tags: [core, perf]\ncreated: 2024-03-01T00:00:00Z\nupdated: 2024-03-10T00:00:00Z\n"));
  index.upsert("plain.md", "# Just a heading\n\nNo header at all.\n", "2024-04-01T00:00:00Z");
}

} // namespace

void register_metadata_tests(std::vector<memorybank::tests::TestCase> &tests) {
  using memorybank::tests::require;
  namespace mt = memorybank::testing;
  using memorybank::common::ErrorCode;

  tests.push_back({"front_matter_parses_header_and_body", [] {
                     const auto parsed = md::parse_document(
                         "---\ntitle: Hello\ntags: [a, b]\ncount: 3\n---\n# Body\n\ntext\n");
                     require(parsed.has_header && parsed.header_valid, "header expected");
                     require(parsed.header.get_string("title") == std::optional<std::string>("Hello"),
                             "title mismatch");
                     require(parsed.header.get_list("tags") == std::vector<std::string>{"a", "b"},
                             "tags mismatch");
                     require(parsed.header.get_string("count") == std::optional<std::string>("3"),
                             "scalars stay text");
                     require(parsed.body == "# Body\n\ntext\n", "body mismatch: " + parsed.body);
                     require(parsed.header.fields().front().first == "title", "order should be kept");
                   }});

  tests.push_back({"front_matter_absent_or_unclosed", [] {
                     const auto plain = md::parse_document("# Title\n---\nnot a header\n");
                     require(!plain.has_header, "header must start on the first line");
                     require(plain.body == "# Title\n---\nnot a header\n", "body should be everything");

                     const auto unclosed = md::parse_document("---\ntitle: x\nno closing line\n");
                     require(!unclosed.has_header, "unclosed header is body text");

                     const auto dots = md::parse_document("---\ntitle: x\n...\nbody");
                     require(dots.has_header && dots.body == "body", "'...' closes a header");

                     const auto empty = md::parse_document("---\n---\nbody\n");
                     require(empty.has_header && empty.header_valid && empty.header.empty(),
                             "empty header is valid");
                   }});

  tests.push_back({"front_matter_malformed_yaml", [] {
                     const auto broken = md::parse_document("---\ntitle: [unclosed\n---\nbody\n");
                     require(broken.has_header, "delimiters were present");
                     require(!broken.header_valid, "yaml error should invalidate header");
                     require(!broken.parse_error.empty(), "parse error should be recorded");
                     require(broken.body == "body\n", "body should still be split");

                     const auto list_root = md::parse_document("---\n- a\n- b\n---\n");
                     require(!list_root.header_valid, "non-mapping header is invalid");

                     const auto nested = md::parse_document("---\nauthor:\n  name: x\n---\n");
                     require(nested.header_valid, "nested maps parse");
                     const auto *author = nested.header.find("author");
                     require(author != nullptr && !author->well_formed, "nested map is not modelled");
                     require(!nested.header.get_string("author").has_value(),
                             "ill-formed values have no string form");
                   }});

  tests.push_back({"front_matter_render_round_trip", [] {
                     md::FrontMatter header;
                     header.set("title", "Round: trip");
                     header.set("description", "Contains \"quotes\" and # hash");
                     header.set_list("tags", {"one", "two words"});
                     const auto text = md::render_document(header, "Body\n");
                     require(text.rfind("---\n", 0) == 0, "rendered header should open with ---");

                     const auto parsed = md::parse_document(text);
                     require(parsed.header_valid, parsed.parse_error);
                     require(parsed.header.get_string("title") == header.get_string("title"),
                             "title changed");
                     require(parsed.header.get_string("description") ==
                                 header.get_string("description"),
                             "description changed");
                     require(parsed.header.get_list("tags") == header.get_list("tags"), "tags changed");
                     require(parsed.body == "Body\n", "body changed");
                     require(md::render_document(md::FrontMatter{}, "only body") == "only body",
                             "empty header renders body only");
                   }});

  tests.push_back({"schema_accepts_valid_project_brief", [] {
                     const auto registry = md::SchemaRegistry::with_defaults();
                     const auto parsed = md::parse_document(
                         doc("title: Brief\ntype: projectBrief\ndescription: Ten chars or more\n"
                             "status: active\ntags: [x]\ncreated: 2024-01-01T00:00:00Z\n"));
                     const auto result = registry.validate(parsed.header);
                     require(result.status == md::ValidationStatus::Valid,
                             result.errors.empty() ? "unexpected status" : result.errors.front());
                   }});

  tests.push_back({"schema_reports_every_problem", [] {
                     const auto registry = md::SchemaRegistry::with_defaults();
                     const auto parsed = md::parse_document(
                         doc("type: projectBrief\ndescription: short\nstatus: someday\n"
                             "tags: single\ncreated: last tuesday\n"));
                     const auto result = registry.validate(parsed.header);
                     require(result.status == md::ValidationStatus::Invalid, "should be invalid");
                     require(has_error(result.errors, "title is required"), "missing title");
                     require(has_error(result.errors, "description must be at least 10"),
                             "short description");
                     require(has_error(result.errors, "status must be one of"), "bad status");
                     require(has_error(result.errors, "tags must be a list"), "scalar tags");
                     require(has_error(result.errors, "created must be an RFC 3339"), "bad timestamp");
                     require(result.errors.size() == 5, "expected five errors");
                   }});

  tests.push_back({"schema_unknown_types_are_unknown", [] {
                     const auto registry = md::SchemaRegistry::with_defaults();
                     const auto untyped = md::parse_document(doc("title: x\n"));
                     require(registry.validate(untyped.header).status == md::ValidationStatus::Unknown,
                             "no type should be unknown");
                     const auto custom = md::parse_document(doc("type: meetingNotes\n"));
                     require(registry.validate(custom.header).status == md::ValidationStatus::Unknown,
                             "unregistered type should be unknown, not invalid");
                     require(registry.has_schema("systemPattern"), "default schema missing");
                     require(registry.doc_types().size() == 4, "four default schemas");
                   }});

  tests.push_back({"schema_registry_accepts_custom_schemas", [] {
                     auto registry = md::SchemaRegistry::with_defaults();
                     registry.register_schema(md::DocumentSchema{
                         .doc_type = "meetingNotes",
                         .rules = {md::FieldRule{.field = "attendees",
                                                 .kind = md::FieldKind::TextList,
                                                 .required = true}}});
                     const auto missing = md::parse_document(doc("type: meetingNotes\n"));
                     require(registry.validate(missing.header).status == md::ValidationStatus::Invalid,
                             "required attendees");
                     const auto ok = md::parse_document(doc("type: meetingNotes\nattendees: [a]\n"));
                     require(registry.validate(ok.header).status == md::ValidationStatus::Valid,
                             "attendees list satisfies schema");

                     const md::SchemaRegistry copy = registry;
                     require(copy.has_schema("meetingNotes"), "copies keep custom schemas");
                     require(md::validation_status_from_string("invalid") ==
                                 md::ValidationStatus::Invalid,
                             "status parse");
                     require(!md::validation_status_from_string("bogus").has_value(), "bogus status");
                   }});

  tests.push_back({"index_entry_derives_fields", [] {
                     md::MetadataIndex index;
                     const auto entry =
                         index.upsert("notes/Plain File.md", "no header\nsecond line words\n",
                                      "2024-04-01T12:00:00+00:00");
                     require(entry.title == "Plain File", "title should fall back to the stem");
                     require(entry.type == "unknown", "type should default to unknown");
                     require(entry.id.rfind("sha256:", 0) == 0 && entry.id.size() == 7 + 64,
                             "id should fall back to the path hash: " + entry.id);
                     require(entry.created == "2024-04-01T12:00:00Z", "created from mtime");
                     require(entry.updated == "2024-04-01T12:00:00Z", "updated from mtime");
                     require(entry.validation_status == md::ValidationStatus::Unknown, "unknown status");
                     require(entry.line_count == 3, "line count");
                     require(entry.word_count == 5, "word count");

                     const auto tagged = index.upsert(
                         "t.md", doc("id: custom-id\ntags: [b, a, b, ' a ']\n"));
                     require(tagged.id == "custom-id", "header id should win");
                     require(tagged.tags == std::vector<std::string>{"a", "b"},
                             "tags should be trimmed, sorted and unique");
                   }});

  tests.push_back({"index_timestamps_are_preserved_and_monotonic", [] {
                     md::MetadataIndex index;
                     index.upsert("a.md", doc("created: 2024-01-01T00:00:00Z\n"
                                              "updated: 2024-05-01T00:00:00Z\n"));
                     const auto second =
                         index.upsert("a.md", doc("updated: 2024-02-01T00:00:00Z\n"), std::nullopt);
                     require(second.created == "2024-01-01T00:00:00Z",
                             "created should survive a header without it");
                     require(second.updated == "2024-05-01T00:00:00Z",
                             "updated must never move backwards");

                     const auto third = index.upsert("a.md", doc("updated: 2024-06-01T08:00:00+02:00\n"));
                     require(third.updated == "2024-06-01T06:00:00Z", "later update should apply");
                   }});

  tests.push_back({"index_malformed_header_still_indexed", [] {
                     md::MetadataIndex index;
                     const auto entry = index.upsert("bad.md", "---\ntitle: [oops\n---\nbody\n");
                     require(entry.validation_status == md::ValidationStatus::Unknown,
                             "malformed header is unknown");
                     require(!entry.validation_errors.empty(), "parse error should be recorded");
                     require(entry.title == "bad", "title falls back to stem");
                     require(index.size() == 1, "entry should be stored");
                   }});

  tests.push_back({"index_query_tags_intersect_case_insensitive", [] {
                     md::MetadataIndex index;
                     seed(index);

                     md::IndexFilter filter;
                     filter.tags = {"CACHE"};
                     require(paths_of(index.query(filter).entries) ==
                                 std::vector<std::string>{"notes/alpha.md", "notes/beta.md"},
                             "cache tag match");

                     filter.tags = {"cache", "Perf"};
                     require(paths_of(index.query(filter).entries) ==
                                 std::vector<std::string>{"notes/alpha.md"},
                             "tags should intersect");

                     filter.tags = {"missing"};
                     require(index.query(filter).total == 0, "no match");
                   }});

  tests.push_back({"index_query_filters", [] {
                     md::MetadataIndex index;
                     seed(index);

                     md::IndexFilter by_type;
                     by_type.type = "projectBrief";
                     const auto briefs = index.query(by_type);
                     require(briefs.total == 1 && briefs.entries[0].relative_path == "core/projectBrief.md",
                             "type filter");
                     require(briefs.entries[0].validation_status == md::ValidationStatus::Valid,
                             "brief should validate");

                     md::IndexFilter by_status;
                     by_status.validation_status = md::ValidationStatus::Valid;
                     require(index.query(by_status).total == 2, "two valid documents");

                     md::IndexFilter by_date;
                     by_date.created_after = "2024-01-15T00:00:00Z";
                     by_date.created_before = "2024-03-15T00:00:00Z";
                     require(paths_of(index.query(by_date).entries) ==
                                 std::vector<std::string>{"core/projectBrief.md", "notes/beta.md"},
                             "created range");

                     md::IndexFilter by_updated;
                     by_updated.updated_after = "2024-03-31T00:00:00Z";
                     require(paths_of(index.query(by_updated).entries) ==
                                 std::vector<std::string>{"plain.md"},
                             "updated range");

                     md::IndexFilter by_size;
                     by_size.min_size = 400;
                     require(paths_of(index.query(by_size).entries) ==
                                 std::vector<std::string>{"notes/beta.md"},
                             "size filter");

                     md::IndexFilter by_text;
                     by_text.text = "  ALPHA ";
                     require(paths_of(index.query(by_text).entries) ==
                                 std::vector<std::string>{"notes/alpha.md"},
                             "text filter");
                   }});

  tests.push_back({"index_query_sort_and_paginate", [] {
                     md::MetadataIndex index;
                     seed(index);

                     md::IndexFilter filter;
                     filter.sort_by = md::SortField::Updated;
                     filter.descending = true;
                     filter.limit = 3;
                     const auto page = index.query(filter);
                     require(page.total == 4, "total should count every match");
                     require(page.has_more, "one more page expected");
                     require(paths_of(page.entries) ==
                                 std::vector<std::string>{"plain.md", "core/projectBrief.md",
                                                          "notes/beta.md"},
                             "newest first");

                     filter.offset = 3;
                     const auto rest = index.query(filter);
                     require(paths_of(rest.entries) == std::vector<std::string>{"notes/alpha.md"},
                             "second page");
                     require(!rest.has_more, "no further pages");

                     filter.offset = 10;
                     require(index.query(filter).entries.empty(), "offset past the end");

                     require(index.largest(1).front().relative_path == "notes/beta.md", "largest");
                     require(index.recently_updated(1).front().relative_path == "plain.md",
                             "most recent");
                   }});

  tests.push_back({"index_stats_and_aggregates", [] {
                     md::MetadataIndex index;
                     seed(index);
                     const auto stats = index.stats();
                     require(stats.total_entries == 4, "entry count");
                     require(stats.valid == 2 && stats.unknown == 2 && stats.invalid == 0,
                             "status counts");
                     require(stats.tag_counts.at("perf") == 2, "perf tag count");
                     require(stats.type_counts.at("unknown") == 2, "unknown type count");
                     require(index.all_tags().size() == 4, "distinct tags: Cache, cache, core, perf");
                     require(index.all_types().at("researchNote") == 1, "type aggregate");
                   }});

  tests.push_back({"index_rebuild_replaces_entries", [] {
                     md::MetadataIndex index;
                     seed(index);
                     index.rebuild_all({md::IndexSource{.relative_path = "only.md",
                                                        .content = doc("title: Only\n"),
                                                        .modified_at = std::nullopt}});
                     require(index.size() == 1, "rebuild should drop missing files");
                     require(index.get("only.md").has_value(), "new entry present");
                     require(!index.get("plain.md").has_value(), "old entry gone");
                     require(!index.stats().last_rebuild.empty(), "rebuild time recorded");
                     require(index.remove("only.md") && !index.remove("only.md"), "remove once");
                   }});

  tests.push_back({"count_helpers", [] {
                     require(md::count_lines("") == 0, "empty has no lines");
                     require(md::count_lines("a\nb") == 2, "two lines");
                     require(md::count_words("  one two\tthree\n") == 3, "three words");
                   }});

  tests.push_back({"index_store_round_trip", [] {
                     const mt::TempWorkspace workspace;
                     md::MetadataIndex index;
                     seed(index);

                     md::IndexStore store(workspace.path() / ".index" / "metadata.db");
                     require(!store.is_open(), "store starts closed");
                     require(store.open().ok(), "open should create the database");
                     require(store.open().ok(), "open is idempotent");
                     const auto before = store.last_build_time();
                     require(before.ok() && !before.value().has_value(), "no build recorded yet");

                     require(store.save(index.snapshot()).ok(), "save should succeed");
                     const auto built = store.last_build_time();
                     require(built.ok() && built.value().has_value(), "build time recorded");
                     require(memorybank::common::parse_rfc3339(*built.value()).has_value(),
                             "build time is RFC 3339");

                     const auto loaded = store.load();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().size() == 4, "four entries stored");
                     const auto &alpha = loaded.value()[1];
                     require(alpha.relative_path == "notes/alpha.md", "entries ordered by path");
                     require(alpha.tags == std::vector<std::string>{"Cache", "perf"}, "tags kept");
                     require(alpha.type == "researchNote", "type kept");
                     require(alpha.created == "2024-01-01T00:00:00Z", "created kept");

                     require(store.save({}).ok(), "saving nothing clears the table");
                     require(store.load().value().empty(), "entries replaced");
                   }});

  tests.push_back({"index_store_requires_open", [] {
                     const mt::TempWorkspace workspace;
                     md::IndexStore store(workspace.path() / "db.sqlite");
                     const auto loaded = store.load();
                     require(!loaded.ok() && loaded.code() == ErrorCode::IndexStoreError,
                             "closed store should fail");
                     require(store.save({}).code() == ErrorCode::IndexStoreError,
                             "closed save should fail");
                     require(store.open().ok(), "open");
                     store.close();
                     require(!store.is_open(), "closed again");
                   }});
}
