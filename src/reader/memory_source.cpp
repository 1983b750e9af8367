#include "chunkfs/reader/memory_source.hpp"
#include "chunkfs/reader/reader_error.hpp"
#include <algorithm>
#include <cstring>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/log/trivial.hpp>

namespace chunkfs {
namespace reader {

MemorySourceReader::MemorySourceReader(boost::asio::any_io_executor executor,
                                       std::shared_ptr<const std::vector<uint8_t>> data,
                                       std::uint64_t position,
                                       std::chrono::milliseconds latency,
                                       std::shared_ptr<Stats> stats)
  : executor_(std::move(executor))
  , data_(std::move(data))
  , position_(position)
  , latency_(latency)
  , stats_(stats ? std::move(stats) : std::make_shared<Stats>()) {
  if (!data_) {
    data_ = std::make_shared<const std::vector<uint8_t>>();
  }
}

void MemorySourceReader::async_read_into(uint8_t* dest, std::size_t offset, std::size_t length,
                                         ReadHandler handler) {
  if (closed_) {
    complete_later([handler]() { handler(make_error_code(reader_errc::closed), 0); });
    return;
  }

  stats_->reads++;
  int in_flight = ++stats_->in_flight;
  int observed = stats_->max_in_flight.load();
  while (in_flight > observed && !stats_->max_in_flight.compare_exchange_weak(observed, in_flight)) {
  }

  complete_later([this, dest, offset, length, handler]() {
    std::size_t copied = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      std::uint64_t remaining = data_->size() > position_ ? data_->size() - position_ : 0;
      copied = static_cast<std::size_t>(std::min<std::uint64_t>(length, remaining));
      if (copied > 0) {
        std::memcpy(dest + offset, data_->data() + position_, copied);
      }
      position_ += copied;
    }
    stats_->bytes_read += copied;
    stats_->in_flight--;
    handler({}, copied);
  });
}

void MemorySourceReader::async_seek(std::uint64_t offset, SeekHandler handler) {
  if (closed_ || offset > data_->size()) {
    auto ec = make_error_code(closed_ ? reader_errc::closed : reader_errc::invalid_seek);
    complete_later([handler, ec]() { handler(ec, nullptr); });
    return;
  }

  stats_->seeks++;
  auto executor = executor_;
  auto data = data_;
  auto latency = latency_;
  auto stats = stats_;
  complete_later([handler, executor, data, offset, latency, stats]() {
    handler({}, std::make_unique<MemorySourceReader>(executor, data, offset, latency, stats));
  });
}

void MemorySourceReader::async_reset(SeekHandler handler) {
  if (closed_) {
    complete_later([handler]() { handler(make_error_code(reader_errc::closed), nullptr); });
    return;
  }

  stats_->resets++;
  auto executor = executor_;
  auto data = data_;
  auto latency = latency_;
  auto stats = stats_;
  complete_later([handler, executor, data, latency, stats]() {
    handler({}, std::make_unique<MemorySourceReader>(executor, data, 0, latency, stats));
  });
}

void MemorySourceReader::close() {
  closed_ = true;
}

std::uint64_t MemorySourceReader::position() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return position_;
}

void MemorySourceReader::complete_later(std::function<void()> work) {
  if (latency_.count() <= 0) {
    boost::asio::post(executor_, std::move(work));
    return;
  }

  auto timer = std::make_shared<boost::asio::steady_timer>(executor_, latency_);
  timer->async_wait([timer, work](const boost::system::error_code& ec) {
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "Memory source: Latency timer ended early: " << ec.message();
    }
    work();
  });
}

} // namespace reader
} // namespace chunkfs
