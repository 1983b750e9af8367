#include <gtest/gtest.h>
#include <atomic>
#include <limits>
#include <sstream>
#include <thread>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/system_error.hpp>
#include "chunkfs/reader/blocking.hpp"
#include "chunkfs/reader/buffered_reader.hpp"
#include "chunkfs/reader/memory_source.hpp"
#include "test_utils.hpp"

using namespace chunkfs::reader;

namespace {

// Source whose first failing_reads reads fail, shared by every handle derived from it
class FailingSource : public SourceReader {
public:
  FailingSource(boost::asio::any_io_executor executor,
                std::unique_ptr<SourceReader> inner,
                std::shared_ptr<std::atomic<int>> failing_reads)
    : executor_(std::move(executor))
    , inner_(std::move(inner))
    , failing_reads_(std::move(failing_reads)) {}

  void async_read_into(uint8_t* dest, std::size_t offset, std::size_t length, ReadHandler handler) override {
    if (failing_reads_->fetch_sub(1) > 0) {
      boost::asio::post(executor_, [handler]() {
        handler(make_error_code(reader_errc::source_failure), 0);
      });
      return;
    }
    inner_->async_read_into(dest, offset, length, std::move(handler));
  }

  void async_seek(std::uint64_t offset, SeekHandler handler) override {
    inner_->async_seek(offset, wrap(std::move(handler)));
  }

  void async_reset(SeekHandler handler) override {
    inner_->async_reset(wrap(std::move(handler)));
  }

  void close() override { inner_->close(); }

private:
  boost::asio::any_io_executor executor_;
  std::unique_ptr<SourceReader> inner_;
  std::shared_ptr<std::atomic<int>> failing_reads_;

  SeekHandler wrap(SeekHandler handler) {
    auto executor = executor_;
    auto failing_reads = failing_reads_;
    return [executor, failing_reads, handler](const boost::system::error_code& ec,
                                              std::unique_ptr<SourceReader> next) {
      if (ec) {
        handler(ec, nullptr);
        return;
      }
      handler(ec, std::make_unique<FailingSource>(executor, std::move(next), failing_reads));
    };
  }
};

} // namespace

class BufferedReaderTest : public ::testing::Test {
protected:
  static constexpr std::size_t CHUNK = 4;

  boost::asio::thread_pool pool{2};
  std::shared_ptr<MemorySourceReader::Stats> stats;

  void SetUp() override {
    chunkfs::test::init_logging();
    stats = std::make_shared<MemorySourceReader::Stats>();
  }

  void TearDown() override {
    pool.join();
  }

  std::shared_ptr<BufferedReader> open(std::shared_ptr<const std::vector<uint8_t>> data,
                                       std::size_t chunks_to_buffer,
                                       std::chrono::milliseconds latency = std::chrono::milliseconds(0)) {
    auto source = std::make_unique<MemorySourceReader>(pool.get_executor(), data, 0, latency, stats);
    return BufferedReader::create(pool.get_executor(), std::move(source),
                                  ReaderConfig{chunks_to_buffer, CHUNK}, data->size());
  }

  // Reads the whole file in pieces of piece_size, checking the window after every step
  std::vector<uint8_t> read_in_pieces(BufferedReader& reader, std::size_t piece_size) {
    std::vector<uint8_t> out(reader.file_size());
    std::size_t total = 0;
    while (true) {
      std::size_t bytes = read_blocking(reader, out.data(), total, std::min(piece_size, out.size() - total + 1));
      expect_invariants(reader.window());
      if (bytes == 0) {
        break;
      }
      total += bytes;
    }
    EXPECT_EQ(total, out.size());
    return out;
  }

  static void expect_invariants(const WindowState& state) {
    EXPECT_LE(state.buffer_start, state.read_offset) << state;
    EXPECT_LE(state.read_offset, state.buffer_end) << state;
    EXPECT_LE(state.buffer_end, state.file_size) << state;
    EXPECT_LE(state.buffered(), state.capacity) << state;
    EXPECT_LT(state.consumed(), CHUNK) << state;
    EXPECT_LT(state.start_in_buffer, state.capacity) << state;
  }

  static boost::system::error_code read_error(BufferedReader& reader, std::size_t length) {
    std::vector<uint8_t> dest(length);
    try {
      read_blocking(reader, dest.data(), 0, length);
    }
    catch (const boost::system::system_error& e) {
      return e.code();
    }
    return {};
  }

  static boost::system::error_code seek_error(BufferedReader& reader, std::uint64_t offset) {
    try {
      seek_blocking(reader, offset);
    }
    catch (const boost::system::system_error& e) {
      return e.code();
    }
    return {};
  }
};

// ---- CONSTRUCTION ----

TEST_F(BufferedReaderTest, RejectsInvalidConfiguration) {
  auto data = chunkfs::test::make_pattern(32);
  auto make_source = [&]() { return std::make_unique<MemorySourceReader>(pool.get_executor(), data); };

  EXPECT_THROW(BufferedReader::create(pool.get_executor(), make_source(), ReaderConfig{0, CHUNK}, 32),
               ConfigurationError);
  EXPECT_THROW(BufferedReader::create(pool.get_executor(), make_source(), ReaderConfig{2, 0}, 32),
               ConfigurationError);
  EXPECT_THROW(BufferedReader::create(pool.get_executor(), nullptr, ReaderConfig{2, CHUNK}, 32),
               ConfigurationError);
  EXPECT_THROW(BufferedReader::create(pool.get_executor(), make_source(),
                                      ReaderConfig{std::numeric_limits<std::size_t>::max(), CHUNK}, 32),
               ConfigurationError);
  // Anchor off a chunk boundary, and anchor past the end
  EXPECT_THROW(BufferedReader::create(pool.get_executor(), make_source(), ReaderConfig{2, CHUNK}, 32, 3),
               ConfigurationError);
  EXPECT_THROW(BufferedReader::create(pool.get_executor(), make_source(), ReaderConfig{2, CHUNK}, 32, 36),
               ConfigurationError);
}

TEST_F(BufferedReaderTest, ConfigFromCapacity) {
  ReaderConfig config = ReaderConfig::from_capacity(16, CHUNK);
  EXPECT_EQ(config.chunks_to_buffer, 4u);
  EXPECT_EQ(config.capacity(), 16u);

  EXPECT_THROW(ReaderConfig::from_capacity(0, CHUNK), ConfigurationError);
  EXPECT_THROW(ReaderConfig::from_capacity(10, CHUNK), ConfigurationError);
  EXPECT_THROW(ReaderConfig::from_capacity(16, 0), ConfigurationError);
}

TEST_F(BufferedReaderTest, StartsWithEmptyWindowAtAnchor) {
  auto data = chunkfs::test::make_pattern(32);
  auto source = std::make_unique<MemorySourceReader>(pool.get_executor(), data, 8);
  auto reader = BufferedReader::create(pool.get_executor(), std::move(source), ReaderConfig{2, CHUNK}, 32, 8);

  WindowState state = reader->window();
  EXPECT_EQ(state.read_offset, 8u);
  EXPECT_EQ(state.buffer_start, 8u);
  EXPECT_EQ(state.buffer_end, 8u);
  EXPECT_EQ(state.start_in_buffer, 0u);
  EXPECT_EQ(reader->capacity(), 2 * CHUNK);

  std::vector<uint8_t> out(3);
  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 3), 3u);
  EXPECT_EQ(out, std::vector<uint8_t>(data->begin() + 8, data->begin() + 11));
}

// ---- READ SERVICING ----

TEST_F(BufferedReaderTest, WorkedExampleTwoChunkBuffer) {
  auto data = chunkfs::test::make_bytes("ABCDEFGH");
  auto reader = open(data, 2);
  std::vector<uint8_t> out(4);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 3), 3u);
  EXPECT_EQ(std::string(out.begin(), out.begin() + 3), "ABC");
  // Less than a chunk consumed, nothing evicted
  EXPECT_EQ(reader->window().buffer_start, 0u);
  EXPECT_EQ(reader->window().read_offset, 3u);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 4), 4u);
  EXPECT_EQ(std::string(out.begin(), out.end()), "DEFG");

  WindowState state = reader->window();
  EXPECT_EQ(state.read_offset, 7u);
  EXPECT_EQ(state.buffer_start, 4u);
  expect_invariants(state);
}

TEST_F(BufferedReaderTest, RoundTripMatchesSingleRead) {
  auto data = chunkfs::test::make_pattern(10 * CHUNK + 3);

  auto whole_reader = open(data, 3);
  std::vector<uint8_t> whole(data->size());
  ASSERT_EQ(read_blocking(*whole_reader, whole.data(), 0, whole.size()), data->size());
  ASSERT_EQ(whole, *data);

  for (std::size_t piece : {std::size_t{1}, std::size_t{7}, CHUNK, CHUNK + 1}) {
    auto reader = open(data, 3);
    EXPECT_EQ(read_in_pieces(*reader, piece), whole) << "piece size " << piece;
  }
}

TEST_F(BufferedReaderTest, ReadLargerThanCapacity) {
  auto data = chunkfs::test::make_pattern(9 * CHUNK);
  auto reader = open(data, 2);
  std::vector<uint8_t> out(data->size());

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, out.size()), data->size());
  EXPECT_EQ(out, *data);
  expect_invariants(reader->window());
}

TEST_F(BufferedReaderTest, WritesAtDestinationOffset) {
  auto data = chunkfs::test::make_bytes("ABCDEFGH");
  auto reader = open(data, 2);
  std::vector<uint8_t> out(8, '.');

  ASSERT_EQ(read_blocking(*reader, out.data(), 3, 5), 5u);
  EXPECT_EQ(std::string(out.begin(), out.end()), "...ABCDE");
}

TEST_F(BufferedReaderTest, EvictsOnlyWholeConsumedChunks) {
  auto data = chunkfs::test::make_pattern(8 * CHUNK);
  auto reader = open(data, 4);
  std::vector<uint8_t> out(16);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, CHUNK - 1), CHUNK - 1);
  EXPECT_EQ(reader->window().buffer_start, 0u);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 1), 1u);
  EXPECT_EQ(reader->window().buffer_start, CHUNK);
  EXPECT_EQ(reader->window().start_in_buffer, CHUNK);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 2 * CHUNK + 2), 2 * CHUNK + 2);
  WindowState state = reader->window();
  EXPECT_EQ(state.read_offset, 3 * CHUNK + 2);
  EXPECT_EQ(state.buffer_start, 3 * CHUNK);
  expect_invariants(state);
}

TEST_F(BufferedReaderTest, ClampsAtEndOfFile) {
  auto data = chunkfs::test::make_pattern(2 * CHUNK + 1);
  auto reader = open(data, 2);
  std::vector<uint8_t> out(32);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 5), 5u);
  EXPECT_EQ(read_blocking(*reader, out.data(), 0, 32), data->size() - 5);
  EXPECT_EQ(reader->window().read_offset, data->size());

  // At end of file a read is an immediate zero-byte success
  EXPECT_EQ(read_blocking(*reader, out.data(), 0, 32), 0u);
  EXPECT_EQ(read_blocking(*reader, out.data(), 0, 0), 0u);
  expect_invariants(reader->window());
}

TEST_F(BufferedReaderTest, EmptyFile) {
  auto data = chunkfs::test::make_bytes("");
  auto reader = open(data, 2);
  std::vector<uint8_t> out(4);

  EXPECT_EQ(read_blocking(*reader, out.data(), 0, 4), 0u);
  EXPECT_EQ(stats->reads.load(), 0u);
}

// ---- PREFETCH ----

TEST_F(BufferedReaderTest, IsolatedReadDoesNotGrowWindow) {
  auto data = chunkfs::test::make_pattern(16 * CHUNK);
  auto reader = open(data, 4);
  std::vector<uint8_t> out(2);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 2), 2u);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  EXPECT_EQ(reader->window().buffered(), CHUNK);
  EXPECT_EQ(stats->reads.load(), 1u);
}

TEST_F(BufferedReaderTest, SequentialReadsPrefetchUntilFull) {
  auto data = chunkfs::test::make_pattern(16 * CHUNK);
  auto reader = open(data, 4);
  std::vector<uint8_t> out(2);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 2), 2u);
  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 2), 2u);

  EXPECT_TRUE(chunkfs::test::wait_until([&]() { return reader->window().buffered() == reader->capacity(); }))
    << reader->window();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  // The second read evicted the first chunk, so four more fill the window and then it stops
  EXPECT_EQ(reader->window().buffered(), reader->capacity());
  EXPECT_EQ(stats->reads.load(), 5u);
  expect_invariants(reader->window());
}

TEST_F(BufferedReaderTest, PrefetchStopsAtEndOfFile) {
  auto data = chunkfs::test::make_pattern(2 * CHUNK + 1);
  auto reader = open(data, 8);
  std::vector<uint8_t> out(2);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 1), 1u);
  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 1), 1u);

  EXPECT_TRUE(chunkfs::test::wait_until([&]() { return reader->window().buffer_end == data->size(); }));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(reader->window().buffer_end, data->size());
  EXPECT_EQ(stats->reads.load(), 3u);
}

TEST_F(BufferedReaderTest, AtMostOneSourceReadInFlight) {
  auto data = chunkfs::test::make_pattern(24 * CHUNK + 3);
  auto reader = open(data, 3, std::chrono::milliseconds(2));

  EXPECT_EQ(read_in_pieces(*reader, CHUNK + 1), *data);
  EXPECT_EQ(stats->max_in_flight.load(), 1);
}

// ---- SEEK AND RESET ----

TEST_F(BufferedReaderTest, SeekThenReadMatchesLinearContent) {
  auto data = chunkfs::test::make_pattern(5 * CHUNK + 2);
  const std::size_t file_size = data->size();

  for (std::uint64_t target : {std::uint64_t{0}, std::uint64_t{CHUNK - 1}, std::uint64_t{CHUNK},
                               std::uint64_t{CHUNK + 1}, std::uint64_t{file_size - 1}}) {
    auto reader = open(data, 2);
    auto moved = seek_blocking(*reader, target);
    ASSERT_NE(moved, nullptr);
    EXPECT_EQ(moved->window().read_offset, target);
    EXPECT_EQ(moved->window().buffer_start, target - target % CHUNK);
    expect_invariants(moved->window());

    uint8_t byte = 0;
    ASSERT_EQ(read_blocking(*moved, &byte, 0, 1), 1u) << "target " << target;
    EXPECT_EQ(byte, (*data)[target]) << "target " << target;
    moved->close();
  }
}

TEST_F(BufferedReaderTest, SeekToCurrentOffsetReturnsSameInstance) {
  auto data = chunkfs::test::make_pattern(4 * CHUNK);
  auto reader = open(data, 2);
  std::vector<uint8_t> out(5);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 5), 5u);
  auto same = seek_blocking(*reader, 5);
  EXPECT_EQ(same, reader);
  EXPECT_FALSE(reader->is_closed());
  EXPECT_EQ(stats->seeks.load(), 0u);
}

TEST_F(BufferedReaderTest, SeekBackwardsAfterEviction) {
  auto data = chunkfs::test::make_pattern(6 * CHUNK);
  auto reader = open(data, 2);
  std::vector<uint8_t> out(5 * CHUNK);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, out.size()), out.size());
  auto moved = seek_blocking(*reader, 2);

  ASSERT_EQ(read_blocking(*moved, out.data(), 0, 6), 6u);
  EXPECT_EQ(std::vector<uint8_t>(out.begin(), out.begin() + 6),
            std::vector<uint8_t>(data->begin() + 2, data->begin() + 8));
}

TEST_F(BufferedReaderTest, SeekToEndOfFile) {
  auto data = chunkfs::test::make_pattern(3 * CHUNK);
  auto reader = open(data, 2);

  auto moved = seek_blocking(*reader, data->size());
  uint8_t byte = 0;
  EXPECT_EQ(read_blocking(*moved, &byte, 0, 1), 0u);
}

TEST_F(BufferedReaderTest, SeekBeyondEndFailsWithoutRetiring) {
  auto data = chunkfs::test::make_pattern(3 * CHUNK);
  auto reader = open(data, 2);

  EXPECT_EQ(seek_error(*reader, data->size() + 1), make_error_code(reader_errc::invalid_seek));
  EXPECT_FALSE(reader->is_closed());

  uint8_t byte = 0;
  ASSERT_EQ(read_blocking(*reader, &byte, 0, 1), 1u);
  EXPECT_EQ(byte, (*data)[0]);
}

TEST_F(BufferedReaderTest, ResetStartsOver) {
  auto data = chunkfs::test::make_pattern(6 * CHUNK + 1);
  auto reader = open(data, 2);
  std::vector<uint8_t> out(data->size());

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 3 * CHUNK + 1), 3 * CHUNK + 1);
  auto fresh = reset_blocking(*reader);
  ASSERT_NE(fresh, nullptr);
  EXPECT_NE(fresh, reader);
  EXPECT_EQ(fresh->window().read_offset, 0u);

  EXPECT_EQ(read_in_pieces(*fresh, CHUNK + 1), *data);
  EXPECT_EQ(stats->resets.load(), 1u);
}

TEST_F(BufferedReaderTest, RetiredInstanceRejectsEverything) {
  auto data = chunkfs::test::make_pattern(4 * CHUNK);
  auto reader = open(data, 2);
  std::vector<uint8_t> out(2);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 2), 2u);
  auto moved = seek_blocking(*reader, CHUNK + 1);
  EXPECT_TRUE(reader->is_closed());

  const auto closed = make_error_code(reader_errc::closed);
  EXPECT_EQ(read_error(*reader, 1), closed);
  EXPECT_EQ(seek_error(*reader, 0), closed);
  EXPECT_THROW(reset_blocking(*reader), boost::system::system_error);

  // The successor is unaffected
  ASSERT_EQ(read_blocking(*moved, out.data(), 0, 2), 2u);
  EXPECT_EQ(out[0], (*data)[CHUNK + 1]);
  EXPECT_EQ(out[1], (*data)[CHUNK + 2]);
}

TEST_F(BufferedReaderTest, CloseIsIdempotent) {
  auto data = chunkfs::test::make_pattern(4 * CHUNK);
  auto reader = open(data, 2);

  reader->close();
  reader->close();
  EXPECT_TRUE(reader->is_closed());
  EXPECT_EQ(read_error(*reader, 1), make_error_code(reader_errc::closed));
}

TEST_F(BufferedReaderTest, CloseDuringPrefetchLeavesWindowIntact) {
  auto data = chunkfs::test::make_pattern(32 * CHUNK);
  auto reader = open(data, 8, std::chrono::milliseconds(5));
  std::vector<uint8_t> out(2);

  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 1), 1u);
  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 1), 1u);
  reader->close();

  WindowState at_close = reader->window();
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  WindowState later = reader->window();

  // A refill completion that checked closed_ just before close() still commits its chunk,
  // so one chunk past the snapshot may land. Nothing is scheduled after it.
  EXPECT_LE(later.buffer_end, at_close.buffer_end + CHUNK);
  EXPECT_EQ(later.read_offset, at_close.read_offset);
  expect_invariants(later);
}

// ---- FAILURES ----

TEST_F(BufferedReaderTest, SourceFailureSurfacesAndReaderRecovers) {
  auto data = chunkfs::test::make_pattern(4 * CHUNK);
  auto failing_reads = std::make_shared<std::atomic<int>>(1);
  auto source = std::make_unique<FailingSource>(
    pool.get_executor(), std::make_unique<MemorySourceReader>(pool.get_executor(), data), failing_reads);
  auto reader = BufferedReader::create(pool.get_executor(), std::move(source), ReaderConfig{2, CHUNK},
                                       data->size());

  EXPECT_EQ(read_error(*reader, 3), make_error_code(reader_errc::source_failure));
  expect_invariants(reader->window());

  // The gate is not jammed by the failed refill
  std::vector<uint8_t> out(3);
  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 3), 3u);
  EXPECT_EQ(out, std::vector<uint8_t>(data->begin(), data->begin() + 3));
}

TEST_F(BufferedReaderTest, BackgroundPrefetchFailureNeverReachesForegroundReads) {
  auto data = chunkfs::test::make_pattern(8 * CHUNK);
  auto failing_reads = std::make_shared<std::atomic<int>>(0);
  auto source = std::make_unique<FailingSource>(
    pool.get_executor(), std::make_unique<MemorySourceReader>(pool.get_executor(), data), failing_reads);
  auto reader = BufferedReader::create(pool.get_executor(), std::move(source), ReaderConfig{4, CHUNK},
                                       data->size());
  std::vector<uint8_t> out(data->size());

  // Isolated first read, no prefetch
  ASSERT_EQ(read_blocking(*reader, out.data(), 0, 1), 1u);

  // The sequential second read is served from the window and starts a prefetch whose first refill fails
  *failing_reads = 1;
  ASSERT_EQ(read_blocking(*reader, out.data(), 1, 1), 1u);
  EXPECT_TRUE(chunkfs::test::wait_until([&]() { return failing_reads->load() <= 0; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  // The chain stopped without loading anything
  EXPECT_EQ(reader->window().buffer_end, static_cast<uint64_t>(CHUNK));
  expect_invariants(reader->window());

  // Foreground reads refill normally all the way to EOF
  std::size_t total = 2;
  while (total < out.size()) {
    std::size_t bytes = read_blocking(*reader, out.data(), total, out.size() - total);
    ASSERT_GT(bytes, 0u);
    expect_invariants(reader->window());
    total += bytes;
  }
  EXPECT_EQ(out, *data);
  EXPECT_FALSE(reader->is_closed());
  EXPECT_EQ(read_blocking(*reader, out.data(), 0, 1), 0u);
}

TEST_F(BufferedReaderTest, SourceEndingEarlyIsAFailure) {
  auto data = chunkfs::test::make_pattern(6);
  auto source = std::make_unique<MemorySourceReader>(pool.get_executor(), data);
  // Declared size larger than what the source holds
  auto reader = BufferedReader::create(pool.get_executor(), std::move(source), ReaderConfig{2, CHUNK}, 10);

  EXPECT_EQ(read_error(*reader, 10), make_error_code(reader_errc::source_failure));
  EXPECT_LE(reader->window().buffer_end, 6u);
}

TEST_F(BufferedReaderTest, WindowStatePrints) {
  WindowState state{5, 4, 8, 4, 8, 20};
  std::ostringstream os;
  os << state;
  EXPECT_EQ(os.str(), "BufferedReader{read_offset=5, buffer_start=4, buffer_end=8, start_in_buffer=4}");
  EXPECT_EQ(state.buffered(), 4u);
  EXPECT_EQ(state.available(), 3u);
  EXPECT_EQ(state.consumed(), 1u);
}
