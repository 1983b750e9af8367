#ifndef CHUNKFS_BUFFERED_READER_HPP
#define CHUNKFS_BUFFERED_READER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/system/error_code.hpp>
#include "chunkfs/reader/reader_config.hpp"
#include "chunkfs/reader/reader_error.hpp"
#include "chunkfs/reader/refill_gate.hpp"
#include "chunkfs/reader/source_reader.hpp"

namespace chunkfs {
namespace reader {

// Snapshot of a reader's window bookkeeping.
// buffer_start <= read_offset <= buffer_end <= file_size and
// buffer_end - buffer_start <= capacity hold for every snapshot.
struct WindowState {
  std::uint64_t read_offset{0};
  std::uint64_t buffer_start{0};
  std::uint64_t buffer_end{0};
  std::size_t start_in_buffer{0};
  std::size_t capacity{0};
  std::uint64_t file_size{0};

  // Bytes held in the window
  std::size_t buffered() const { return static_cast<std::size_t>(buffer_end - buffer_start); }
  // Bytes held but not yet delivered
  std::size_t available() const { return static_cast<std::size_t>(buffer_end - read_offset); }
  // Bytes delivered but not yet evicted
  std::size_t consumed() const { return static_cast<std::size_t>(read_offset - buffer_start); }
};

std::ostream& operator<<(std::ostream& os, const WindowState& state);

// Adaptive read-ahead cache over a chunk-granular asynchronous source.
//
// Reads are served from a circular buffer of config.capacity() bytes. Data is
// pulled from the source one chunk at a time through a RefillGate, so at most one
// source read is in flight. Two consecutive reads that continue where the previous
// one ended switch on background prefetch until the buffer is full.
//
// seek() and reset() retire this instance and hand its source to a new one; every
// operation on a retired instance fails with reader_errc::closed.
class BufferedReader : public std::enable_shared_from_this<BufferedReader> {
public:
  using ReadHandler = std::function<void(const boost::system::error_code&, std::size_t)>;
  using ReaderHandler = std::function<void(const boost::system::error_code&, std::shared_ptr<BufferedReader>)>;

  // Delete copy operations, background refills refer to this instance
  BufferedReader(const BufferedReader&) = delete;
  BufferedReader& operator=(const BufferedReader&) = delete;


  // ---- CONSTRUCTION ----
  // Throws ConfigurationError on an empty buffer, a zero chunk size, a null source
  // or an anchor that is not a chunk boundary within the file.
  static std::shared_ptr<BufferedReader> create(boost::asio::any_io_executor executor,
                                                std::unique_ptr<SourceReader> source,
                                                const ReaderConfig& config,
                                                std::uint64_t file_size,
                                                std::uint64_t anchor = 0);


  // ---- CALLER OPERATIONS ----
  // Delivers min(length, file_size - read_offset) bytes into dest + offset.
  // A short count only ever means end of file.
  void async_read_into(uint8_t* dest, std::size_t offset, std::size_t length, ReadHandler handler);
  // Handler receives the instance positioned at offset (this one if already there)
  void async_seek(std::uint64_t offset, ReaderHandler handler);
  // Handler receives a new instance positioned at the start of the file
  void async_reset(ReaderHandler handler);
  // Idempotent. Pending background refills notice on their next step.
  void close();


  // ---- QUERY METHODS ----
  bool is_closed() const { return closed_; }
  WindowState window() const;
  std::uint64_t file_size() const { return file_size_; }
  std::size_t capacity() const { return buffer_.size(); }
  const ReaderConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  boost::asio::any_io_executor executor_;
  // Only touched by operations admitted through gate_
  std::unique_ptr<SourceReader> source_;
  const ReaderConfig config_;
  const std::uint64_t file_size_;
  std::vector<uint8_t> buffer_;
  std::shared_ptr<RefillGate> gate_;

  // Guards the window bookkeeping below; never held across a source call
  mutable std::mutex mutex_;
  std::uint64_t read_offset_;
  std::uint64_t buffer_start_;
  std::uint64_t buffer_end_;
  std::size_t start_in_buffer_{0};
  std::optional<std::uint64_t> last_read_end_;
  std::atomic<bool> closed_{false};


  BufferedReader(boost::asio::any_io_executor executor, std::unique_ptr<SourceReader> source,
                 const ReaderConfig& config, std::uint64_t file_size, std::uint64_t anchor);


  // ---- READ SERVICING ----
  // Copies what the window holds, then refills and continues until length bytes are delivered
  void serve(uint8_t* dest, std::size_t length, std::size_t delivered, ReadHandler handler);
  // Copies up to length available bytes and evicts consumed chunks. Requires mutex_.
  std::size_t copy_from_window(uint8_t* dest, std::size_t length);
  // Advances the window start past whole consumed chunks. Requires mutex_.
  void evict_consumed_chunks();
  std::size_t available() const;


  // ---- REFILL PIPELINE ----
  // Pulls at most one chunk from the source into the free part of the buffer.
  // Must run under gate_.
  void refill_one_chunk(RefillGate::Completion finish);
  // Starts background prefetch sized to the free window after a sequential read
  void prefetch_after_sequential_read();
  void async_prefetch(std::size_t chunks);


  // ---- SESSION REPLACEMENT ----
  using Reposition = std::function<void(SourceReader&, SourceReader::SeekHandler)>;
  // Moves the source out under gate_, repositions it and builds the successor at anchor
  void replace_source(Reposition reposition, std::uint64_t anchor, std::uint64_t target,
                      ReaderHandler handler);
  // Advances a fresh instance from its anchor to target without touching read history
  void catch_up(std::size_t gap, ReaderHandler handler);

  void post_read_result(ReadHandler handler, const boost::system::error_code& ec, std::size_t bytes);
  void post_reader_result(ReaderHandler handler, const boost::system::error_code& ec,
                          std::shared_ptr<BufferedReader> reader);
};

} // namespace reader
} // namespace chunkfs

#endif // CHUNKFS_BUFFERED_READER_HPP
