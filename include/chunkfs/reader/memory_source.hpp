#ifndef CHUNKFS_MEMORY_SOURCE_HPP
#define CHUNKFS_MEMORY_SOURCE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include "chunkfs/reader/source_reader.hpp"

namespace chunkfs {
namespace reader {

// SourceReader over an immutable byte array held in memory.
// Completions run on the executor, optionally after a simulated latency.
class MemorySourceReader : public SourceReader {
public:
  // Counters shared by a handle and every handle derived from it by seek/reset
  struct Stats {
    std::atomic<std::size_t> reads{0};
    std::atomic<std::size_t> bytes_read{0};
    std::atomic<std::size_t> seeks{0};
    std::atomic<std::size_t> resets{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
  };

  MemorySourceReader(boost::asio::any_io_executor executor,
                     std::shared_ptr<const std::vector<uint8_t>> data,
                     std::uint64_t position = 0,
                     std::chrono::milliseconds latency = std::chrono::milliseconds(0),
                     std::shared_ptr<Stats> stats = nullptr);

  void async_read_into(uint8_t* dest, std::size_t offset, std::size_t length, ReadHandler handler) override;
  void async_seek(std::uint64_t offset, SeekHandler handler) override;
  void async_reset(SeekHandler handler) override;
  void close() override;

  std::uint64_t position() const;
  const std::shared_ptr<Stats>& stats() const { return stats_; }

private:
  // ---- PARAMETERS ----
  boost::asio::any_io_executor executor_;
  std::shared_ptr<const std::vector<uint8_t>> data_;
  mutable std::mutex mutex_;
  std::uint64_t position_;
  std::chrono::milliseconds latency_;
  std::shared_ptr<Stats> stats_;
  std::atomic<bool> closed_{false};

  // Runs work on the executor once the simulated latency has elapsed
  void complete_later(std::function<void()> work);
};

} // namespace reader
} // namespace chunkfs

#endif // CHUNKFS_MEMORY_SOURCE_HPP
