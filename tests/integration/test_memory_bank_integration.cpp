#include "test_framework.hpp"

#include "memorybank/config/config.hpp"
#include "memorybank/core/memory_bank.hpp"
#include "memorybank/observability/factory.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <optional>
#include <thread>

namespace {

namespace core = memorybank::core;
namespace mt = memorybank::testing;
using memorybank::storage::FileType;

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = std::string(existing);
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

void require_ok(const memorybank::common::Status &status, const std::string &what) {
  memorybank::tests::require(status.ok(), what + ": " + status.error());
}

} // namespace

void register_memory_bank_integration_tests(std::vector<memorybank::tests::TestCase> &tests) {
  using memorybank::tests::require;
  namespace md = memorybank::metadata;
  namespace obs = memorybank::observability;
  namespace cfg = memorybank::config;

  tests.push_back({"integration_config_to_healthy_bank", [] {
                     const mt::TempWorkspace workspace;
                     const EnvGuard env_path("MEMORYBANK_CONFIG_PATH", std::nullopt);
                     const EnvGuard env_root("MEMORYBANK_ROOT", std::nullopt);
                     const EnvGuard env_size("MEMORYBANK_CACHE_MAX_SIZE", std::nullopt);
                     const EnvGuard env_level("MEMORYBANK_LOG_LEVEL", std::nullopt);
                     const auto config_file = workspace.path() / "memorybank.toml";
                     cfg::set_config_path_override(config_file);

                     auto config = mt::test_config(workspace);
                     config.cache.max_size = 8;
                     const auto saved = cfg::save_config(config);
                     const auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require_ok(saved, "save_config");
                     require(loaded.ok(), loaded.error());

                     const auto warnings = cfg::validate_config(loaded.value());
                     require(warnings.ok() && warnings.value().empty(), "config should validate cleanly");
                     const auto options = core::MemoryBankOptions::from_config(loaded.value());
                     require(options.ok(), options.error());

                     core::MemoryBank bank(options.value(),
                                           {.observer = obs::create_observer(loaded.value())});
                     require_ok(bank.init(), "init");
                     require(bank.root() == workspace.path() / "memory-bank", "root from config");
                     require(bank.validator().resolve(FileType::ProjectBrief).ok(), "types resolve");
                     const auto created = bank.load_files();
                     require(created.ok() && created.value().size() == 14, "fresh bank is populated");
                     require(bank.cache_usage().max_size == 8, "cache size from config");
                     require(bank.cache_usage().entries == 8, "LRU bound respected");
                     require(bank.cache_stats().evictions >= 6, "overflow evicted");
                     require(bank.check_health().ok(), "bank should be healthy");
                   }});

  tests.push_back({"integration_index_persists_across_instances", [] {
                     const mt::TempWorkspace workspace;
                     const auto root = workspace.path() / "bank";
                     {
                       core::MemoryBank first(mt::test_options(root));
                       require_ok(first.init(), "first init");
                       require(first.load_files().ok(), "first load");
                       require_ok(first.write_file_by_path(
                                      "notes/design.md",
                                      "---\ntitle: Design\ntags: [Architecture]\n---\nLayers.\n"),
                                  "note write");
                       require_ok(first.dispose(), "dispose");
                     }

                     auto observer = std::make_shared<mt::RecordingObserver>();
                     core::MemoryBank second(mt::test_options(root), {.observer = observer});
                     require_ok(second.init(), "second init");

                     const auto rebuilt = observer->events_of<obs::IndexRebuiltEvent>();
                     require(rebuilt.size() == 1 && rebuilt[0].reason == "restored",
                             "fresh index should be restored, not rebuilt");
                     require(rebuilt[0].entries == 15, "14 managed files + 1 note");

                     md::IndexFilter filter;
                     filter.tags = {"architecture"};
                     const auto found = second.search(filter);
                     require(found.total == 1 && found.entries[0].title == "Design",
                             "note should be searchable before any load");
                   }});

  tests.push_back({"integration_stale_index_is_rebuilt", [] {
                     const mt::TempWorkspace workspace;
                     const auto root = workspace.path() / "bank";
                     {
                       core::MemoryBank first(mt::test_options(root));
                       require_ok(first.init(), "first init");
                       require(first.load_files().ok(), "first load");
                     }
                     workspace.create_file("bank/notes/late.md", "---\ntags: [late]\n---\nx\n");

                     auto options = mt::test_options(root);
                     options.index.max_age_hours = 0;
                     auto observer = std::make_shared<mt::RecordingObserver>();
                     core::MemoryBank second(options, {.observer = observer});
                     require_ok(second.init(), "second init");

                     const auto rebuilt = observer->events_of<obs::IndexRebuiltEvent>();
                     require(rebuilt.size() == 1 && rebuilt[0].reason == "stale", "stale rebuild");
                     md::IndexFilter filter;
                     filter.tags = {"late"};
                     require(second.search(filter).total == 1, "rebuild should see new files");
                   }});

  tests.push_back({"integration_unreadable_index_store_degrades", [] {
                     const mt::TempWorkspace workspace;
                     workspace.create_file("bank/.index/metadata.db", std::string(4096, 'z'));
                     auto observer = std::make_shared<mt::RecordingObserver>();
                     core::MemoryBank bank(mt::test_options(workspace.path() / "bank"),
                                           {.observer = observer});

                     require_ok(bank.init(), "init should fall back to an in-memory index");
                     require(bank.load_files().ok(), "load should still work");
                     require(bank.index().size() == 14, "in-memory index populated");

                     const auto errors = observer->events_of<obs::ErrorEvent>();
                     const bool reported = std::any_of(errors.begin(), errors.end(), [](const auto &e) {
                       return e.component == "index_store";
                     });
                     require(reported, "store failure should be reported");
                   }});

  tests.push_back({"integration_concurrent_updates_to_distinct_files", [] {
                     const mt::TempWorkspace workspace;
                     core::MemoryBank bank(mt::test_options(workspace.path() / "bank"));
                     require_ok(bank.init(), "init");
                     require(bank.load_files().ok(), "load");

                     const std::vector<FileType> types = {FileType::ActiveContext,
                                                          FileType::ProgressCurrent,
                                                          FileType::TechContextStack,
                                                          FileType::SystemPatternsPatterns};
                     std::atomic<int> failures{0};
                     std::atomic<bool> done{false};

                     std::thread reader([&] {
                       while (!done.load()) {
                         for (const auto type : types) {
                           const auto file = bank.get_file(type);
                           if (!file.has_value() || file->content.empty()) {
                             ++failures;
                           }
                         }
                         if (!bank.read_file_by_path("core/activeContext.md").ok()) {
                           ++failures;
                         }
                       }
                     });

                     std::vector<std::thread> writers;
                     for (std::size_t w = 0; w < types.size(); ++w) {
                       writers.emplace_back([&, w] {
                         for (int i = 0; i < 25; ++i) {
                           const auto content = "# writer " + std::to_string(w) + " round " +
                                                std::to_string(i) + "\n";
                           if (!bank.update_file(types[w], content).ok()) {
                             ++failures;
                           }
                         }
                       });
                     }
                     for (auto &writer : writers) {
                       writer.join();
                     }
                     done = true;
                     reader.join();

                     require(failures.load() == 0, "concurrent operations failed");
                     for (std::size_t w = 0; w < types.size(); ++w) {
                       const auto expected = "# writer " + std::to_string(w) + " round 24\n";
                       require(bank.get_file(types[w])->content == expected,
                               "last write should win for writer " + std::to_string(w));
                       const auto on_disk = bank.read_file_by_path(
                           std::string(memorybank::storage::relative_path_of(types[w])));
                       require(on_disk.ok() && on_disk.value() == expected, "disk should match");
                     }
                   }});

  tests.push_back({"integration_load_racing_update_keeps_latest", [] {
                     const mt::TempWorkspace workspace;
                     core::MemoryBank bank(mt::test_options(workspace.path() / "bank"));
                     require_ok(bank.init(), "init");
                     require(bank.load_files().ok(), "load");

                     std::atomic<bool> done{false};
                     std::atomic<int> failures{0};
                     std::thread loader([&] {
                       while (!done.load()) {
                         if (!bank.load_files().ok()) {
                           ++failures;
                         }
                       }
                     });

                     std::string last;
                     for (int i = 0; i < 40; ++i) {
                       // Same-size versions: stat alone cannot tell them apart.
                       last = "# active " + std::string(i < 10 ? "0" : "") + std::to_string(i) + "\n";
                       if (!bank.update_file(FileType::ActiveContext, last).ok()) {
                         ++failures;
                       }
                     }
                     done = true;
                     loader.join();

                     require(failures.load() == 0, "load or update failed");
                     require(bank.get_file(FileType::ActiveContext)->content == last,
                             "a racing load must not resurrect older content");
                     const auto entry = bank.index().get("core/activeContext.md");
                     require(entry.has_value() && entry->size_bytes == last.size(),
                             "index should describe the latest write");
                   }});

  tests.push_back({"integration_parallel_note_writes_are_all_indexed", [] {
                     const mt::TempWorkspace workspace;
                     core::MemoryBank bank(mt::test_options(workspace.path() / "bank"));
                     require_ok(bank.init(), "init");

                     std::atomic<int> failures{0};
                     std::vector<std::thread> writers;
                     for (int w = 0; w < 4; ++w) {
                       writers.emplace_back([&, w] {
                         for (int i = 0; i < 10; ++i) {
                           const auto path = "notes/w" + std::to_string(w) + "/n" + std::to_string(i) + ".md";
                           if (!bank.write_file_by_path(path, "---\ntags: [bulk]\n---\nbody\n").ok()) {
                             ++failures;
                           }
                         }
                       });
                     }
                     for (auto &writer : writers) {
                       writer.join();
                     }

                     require(failures.load() == 0, "parallel writes failed");
                     md::IndexFilter filter;
                     filter.tags = {"bulk"};
                     filter.limit = 100;
                     require(bank.search(filter).total == 40, "every note indexed");
                     require_ok(bank.rebuild_index(), "rebuild");
                     require(bank.search(filter).total == 40, "rebuild agrees with incremental index");
                   }});
}
