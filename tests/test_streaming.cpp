#include "test_framework.hpp"

#include "memorybank/core/memory_bank.hpp"
#include "memorybank/storage/streaming_reader.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <thread>

namespace {

using memorybank::testing::FlakyFileSystem;

struct StreamingFixture {
  memorybank::testing::TempWorkspace workspace;
  std::shared_ptr<FlakyFileSystem> fs = std::make_shared<FlakyFileSystem>();
  std::shared_ptr<memorybank::testing::RecordingObserver> observer =
      std::make_shared<memorybank::testing::RecordingObserver>();
  std::shared_ptr<memorybank::storage::RetryingFileOperations> ops;

  StreamingFixture() {
    memorybank::storage::RetryPolicy policy;
    policy.base_delay = std::chrono::milliseconds(1);
    policy.max_delay = std::chrono::milliseconds(2);
    ops = std::make_shared<memorybank::storage::RetryingFileOperations>(fs, policy, observer);
  }

  [[nodiscard]] memorybank::storage::StreamingReader
  make_reader(const std::uintmax_t threshold, const std::size_t chunk,
              const std::chrono::milliseconds timeout = std::chrono::seconds(5)) const {
    return memorybank::storage::StreamingReader(
        ops,
        memorybank::storage::StreamingOptions{
            .size_threshold = threshold, .chunk_size = chunk, .timeout = timeout},
        observer);
  }

  [[nodiscard]] std::filesystem::path file(const std::string &name,
                                           const std::string &content) const {
    workspace.create_file(name, content);
    return workspace.path() / name;
  }
};

std::string pattern(const std::size_t size) {
  std::string out;
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(static_cast<char>('a' + (i % 26)));
  }
  return out;
}

} // namespace

void register_streaming_tests(std::vector<memorybank::tests::TestCase> &tests) {
  using memorybank::tests::require;
  namespace st = memorybank::storage;
  namespace obs = memorybank::observability;
  using memorybank::common::ErrorCode;

  tests.push_back({"streaming_small_file_uses_plain_read", [] {
                     StreamingFixture fx;
                     auto reader = fx.make_reader(1024, 16);
                     const auto path = fx.file("small.md", pattern(100));

                     const auto result = reader.read(path);
                     require(result.ok(), result.error());
                     require(!result.value().was_streamed, "below threshold should not stream");
                     require(result.value().content == pattern(100), "content mismatch");
                     require(result.value().chunks_processed == 0, "plain read has no chunks");

                     const auto stats = reader.stats();
                     require(stats.total_operations == 1 && stats.streamed_operations == 0,
                             "one plain operation");
                     require(stats.total_bytes_read == 100, "bytes counted");
                     require(stats.largest_file_streamed == 0, "nothing streamed");
                   }});

  tests.push_back({"streaming_large_file_arrives_in_chunks", [] {
                     StreamingFixture fx;
                     auto reader = fx.make_reader(64, 16);
                     const auto path = fx.file("large.md", pattern(100));

                     std::vector<std::uintmax_t> seen;
                     std::uintmax_t reported_total = 0;
                     const auto result = reader.read(path, [&](const std::uintmax_t bytes,
                                                               const std::uintmax_t total) {
                       seen.push_back(bytes);
                       reported_total = total;
                     });
                     require(result.ok(), result.error());
                     require(result.value().was_streamed, "above threshold should stream");
                     require(result.value().content == pattern(100), "content mismatch");
                     require(result.value().chunks_processed == 7, "100 bytes in 16-byte chunks");
                     require(result.value().bytes_read == 100, "bytes_read mismatch");
                     require(seen.size() == 7 && seen.front() == 16 && seen.back() == 100,
                             "progress should climb chunk by chunk");
                     require(reported_total == 100, "progress total should be the file size");

                     const auto stats = reader.stats();
                     require(stats.streamed_operations == 1 && stats.total_operations == 1,
                             "one streamed operation");
                     require(stats.largest_file_streamed == 100, "largest streamed size");
                     const auto latencies = fx.observer->metrics_of<obs::OperationLatencyMetric>();
                     require(std::any_of(latencies.begin(), latencies.end(),
                                         [](const auto &m) { return m.operation == "stream"; }),
                             "stream latency metric");
                   }});

  tests.push_back({"streaming_threshold_is_inclusive", [] {
                     StreamingFixture fx;
                     auto reader = fx.make_reader(64, 32);
                     const auto exact = fx.file("exact.md", pattern(64));
                     const auto below = fx.file("below.md", pattern(63));

                     require(reader.would_stream(exact).value(), "size == threshold streams");
                     require(!reader.would_stream(below).value(), "size < threshold does not");
                     require(reader.read(exact).value().was_streamed, "exact size streamed");
                     require(!reader.read(below).value().was_streamed, "smaller read plainly");
                   }});

  tests.push_back({"streaming_deadline_stops_read_without_retry", [] {
                     StreamingFixture fx;
                     auto reader = fx.make_reader(1, 1, std::chrono::milliseconds(1));
                     const auto path = fx.file("slow.md", pattern(50));

                     const auto result = reader.read(path, [](std::uintmax_t, std::uintmax_t) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(3));
                     });
                     require(!result.ok(), "slow stream should time out");
                     require(result.code() == ErrorCode::Timeout, "expected Timeout");
                     require(result.error().find("timed out after 1ms") != std::string::npos,
                             "message: " + result.error());
                     require(fx.fs->calls(FlakyFileSystem::Op::Read) == 1, "timeouts are not retried");

                     const auto errors = fx.observer->events_of<obs::ErrorEvent>();
                     require(errors.size() == 1 && errors[0].component == "streaming",
                             "one streaming error event");
                     require(fx.observer->events_of<obs::RetryEvent>().empty(), "no retry events");
                     require(reader.stats().total_operations == 0, "failed reads are not counted");
                     require(fx.ops->stats().errors == 0, "a stopped read is not an I/O error");
                   }});

  tests.push_back({"streaming_retry_restarts_from_first_chunk", [] {
                     StreamingFixture fx;
                     auto reader = fx.make_reader(10, 16);
                     const auto path = fx.file("flaky.md", pattern(40));
                     fx.fs->fail_next(FlakyFileSystem::Op::Read, memorybank::testing::transient_error());

                     std::vector<std::uintmax_t> seen;
                     const auto result = reader.read(path, [&](const std::uintmax_t bytes, std::uintmax_t) {
                       seen.push_back(bytes);
                     });
                     require(result.ok(), result.error());
                     require(result.value().content == pattern(40), "no duplicated chunks");
                     require(result.value().chunks_processed == 3, "chunks of the final attempt");
                     require(seen.size() == 4 && seen[0] == 16 && seen[1] == 16 && seen[3] == 40,
                             "progress restarts with the retry");
                     require(fx.observer->events_of<obs::RetryEvent>().size() == 1, "one retry");
                   }});

  tests.push_back({"streaming_reports_missing_and_directories", [] {
                     StreamingFixture fx;
                     auto reader = fx.make_reader(10, 4);

                     const auto missing = reader.read(fx.workspace.path() / "absent.md");
                     require(!missing.ok() && missing.code() == ErrorCode::NotFound,
                             "missing file is NotFound");
                     require(reader.would_stream(fx.workspace.path() / "absent.md").code() ==
                                 ErrorCode::NotFound,
                             "would_stream on missing file");

                     std::filesystem::create_directories(fx.workspace.path() / "dir");
                     const auto dir = reader.read(fx.workspace.path() / "dir");
                     require(!dir.ok() && dir.code() == ErrorCode::IoError, "directory rejected");
                   }});

  tests.push_back({"streaming_reset_stats", [] {
                     StreamingFixture fx;
                     auto reader = fx.make_reader(8, 4);
                     const auto path = fx.file("a.md", pattern(20));
                     require(reader.read(path).ok(), "read failed");
                     require(reader.stats().total_operations == 1, "counted");

                     reader.reset_stats();
                     const auto stats = reader.stats();
                     require(stats.total_operations == 0 && stats.streamed_operations == 0 &&
                                 stats.total_bytes_read == 0 && stats.largest_file_streamed == 0,
                             "counters cleared");
                     require(!stats.last_reset.empty(), "reset time recorded");
                   }});

  tests.push_back({"memory_bank_streams_large_notes", [] {
                     const memorybank::testing::TempWorkspace workspace;
                     auto options = memorybank::testing::test_options(workspace.path() / "bank");
                     options.streaming.size_threshold = 256;
                     options.streaming.chunk_size = 64;
                     memorybank::core::MemoryBank bank(options);
                     require(bank.init().ok(), "init failed");

                     const std::string big = "# Big\n" + pattern(500) + "\n";
                     require(bank.write_file_by_path("notes/big.md", big).ok(), "write failed");
                     require(bank.write_file_by_path("notes/small.md", "# Small\n").ok(),
                             "write failed");

                     const auto streamed = bank.stream_file_by_path("notes/big.md");
                     require(streamed.ok(), streamed.error());
                     require(streamed.value().was_streamed && streamed.value().content == big,
                             "large note should stream intact");
                     require(streamed.value().chunks_processed == (big.size() + 63) / 64,
                             "chunk count");

                     const auto plain = bank.stream_file_by_path("notes/small.md");
                     require(plain.ok() && !plain.value().was_streamed, "small note read plainly");

                     const auto escaped = bank.stream_file_by_path("../outside.md");
                     require(!escaped.ok(), "paths outside the root are rejected");

                     const auto stats = bank.streaming_stats();
                     require(stats.total_operations == 2 && stats.streamed_operations == 1,
                             "bank streaming stats");
                   }});
}
