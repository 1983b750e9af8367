#include "chunkfs/reader/buffered_reader.hpp"
#include <algorithm>
#include <cstring>
#include <limits>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include "chunkfs/chunk/chunk.hpp"

namespace chunkfs {
namespace reader {

std::ostream& operator<<(std::ostream& os, const WindowState& state) {
  return os << "BufferedReader{read_offset=" << state.read_offset
            << ", buffer_start=" << state.buffer_start
            << ", buffer_end=" << state.buffer_end
            << ", start_in_buffer=" << state.start_in_buffer << "}";
}

//==============================================
// CONSTRUCTION
//==============================================

std::shared_ptr<BufferedReader> BufferedReader::create(boost::asio::any_io_executor executor,
                                                       std::unique_ptr<SourceReader> source,
                                                       const ReaderConfig& config,
                                                       std::uint64_t file_size,
                                                       std::uint64_t anchor) {
  if (!source) {
    throw ConfigurationError("a source reader is required");
  }
  if (config.chunk_size == 0) {
    throw ConfigurationError("chunk size must be positive");
  }
  if (config.chunks_to_buffer == 0) {
    throw ConfigurationError("buffer must hold at least one chunk");
  }
  if (config.chunks_to_buffer > std::numeric_limits<std::size_t>::max() / config.chunk_size) {
    throw ConfigurationError("buffer capacity overflows");
  }
  if (anchor % config.chunk_size != 0 || anchor > file_size) {
    throw ConfigurationError("anchor " + std::to_string(anchor) +
                             " is not a chunk boundary within the file");
  }

  // Private constructor, so no make_shared
  return std::shared_ptr<BufferedReader>(
    new BufferedReader(std::move(executor), std::move(source), config, file_size, anchor));
}

BufferedReader::BufferedReader(boost::asio::any_io_executor executor, std::unique_ptr<SourceReader> source,
                               const ReaderConfig& config, std::uint64_t file_size, std::uint64_t anchor)
  : executor_(executor)
  , source_(std::move(source))
  , config_(config)
  , file_size_(file_size)
  , buffer_(config.capacity())
  , gate_(RefillGate::create(executor))
  , read_offset_(anchor)
  , buffer_start_(anchor)
  , buffer_end_(anchor) {
  BOOST_LOG_TRIVIAL(debug) << "Buffered reader: Created with " << config_.chunks_to_buffer
                           << " chunks of " << config_.chunk_size << " bytes, file size "
                           << file_size_ << ", anchor " << anchor;
}

//==============================================
// CALLER OPERATIONS
//==============================================

void BufferedReader::async_read_into(uint8_t* dest, std::size_t offset, std::size_t length, ReadHandler handler) {
  if (closed_) {
    post_read_result(std::move(handler), make_error_code(reader_errc::closed), 0);
    return;
  }

  bool sequential = false;
  std::size_t clamped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t remaining = file_size_ - read_offset_;
    clamped = static_cast<std::size_t>(std::min<std::uint64_t>(length, remaining));
    sequential = last_read_end_ && *last_read_end_ == read_offset_;
    last_read_end_ = read_offset_ + clamped;
  }

  BOOST_LOG_TRIVIAL(trace) << "Buffered reader: Read " << length << " (clamped " << clamped
                           << ", sequential " << sequential << ") from " << window();

  // Nothing left before end of file
  if (clamped == 0) {
    post_read_result(std::move(handler), {}, 0);
    return;
  }

  auto self = shared_from_this();
  serve(dest + offset, clamped, 0,
    [self, sequential, handler](const boost::system::error_code& ec, std::size_t bytes) {
      // Only prefetch after two consecutive reads, i.e. the caller is probably streaming
      if (!ec && sequential) {
        self->prefetch_after_sequential_read();
      }
      handler(ec, bytes);
    });
}

void BufferedReader::async_seek(std::uint64_t offset, ReaderHandler handler) {
  if (closed_) {
    post_reader_result(std::move(handler), make_error_code(reader_errc::closed), nullptr);
    return;
  }
  if (offset > file_size_) {
    BOOST_LOG_TRIVIAL(warning) << "Buffered reader: Seek to " << offset << " beyond file size " << file_size_;
    post_reader_result(std::move(handler), make_error_code(reader_errc::invalid_seek), nullptr);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (offset == read_offset_) {
      post_reader_result(std::move(handler), {}, shared_from_this());
      return;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Buffered reader: Seek to " << offset << " on " << window();
  close();

  // The source only seeks to chunk boundaries, the successor reads forward from there
  std::uint64_t aligned = chunk::align_down(offset, config_.chunk_size);
  replace_source(
    [aligned](SourceReader& source, SourceReader::SeekHandler done) {
      source.async_seek(aligned, std::move(done));
    },
    aligned, offset, std::move(handler));
}

void BufferedReader::async_reset(ReaderHandler handler) {
  if (closed_) {
    post_reader_result(std::move(handler), make_error_code(reader_errc::closed), nullptr);
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Buffered reader: Reset on " << window();
  close();

  replace_source(
    [](SourceReader& source, SourceReader::SeekHandler done) {
      source.async_reset(std::move(done));
    },
    0, 0, std::move(handler));
}

void BufferedReader::close() {
  if (!closed_.exchange(true)) {
    BOOST_LOG_TRIVIAL(debug) << "Buffered reader: Closed at " << window();
  }
}

WindowState BufferedReader::window() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return WindowState{read_offset_, buffer_start_, buffer_end_, start_in_buffer_, buffer_.size(), file_size_};
}

//==============================================
// READ SERVICING
//==============================================

void BufferedReader::serve(uint8_t* dest, std::size_t length, std::size_t delivered, ReadHandler handler) {
  std::size_t copied = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    copied = copy_from_window(dest, length);
  }

  if (copied == length) {
    post_read_result(std::move(handler), {}, delivered + copied);
    return;
  }

  if (copied > 0) {
    BOOST_LOG_TRIVIAL(trace) << "Buffered reader: Partial read from buffer of " << copied;
  }

  uint8_t* next_dest = dest + copied;
  std::size_t remaining = length - copied;
  std::size_t total = delivered + copied;
  auto self = shared_from_this();

  gate_->run_exclusive(
    [self](RefillGate::Completion finish) {
      // A background refill may have completed while this one waited for admission
      if (self->available() > 0) {
        finish({}, 0);
        return;
      }
      BOOST_LOG_TRIVIAL(trace) << "Buffered reader: Buffer empty, refilling";
      self->refill_one_chunk(std::move(finish));
    },
    [self, next_dest, remaining, total, handler](const boost::system::error_code& ec, std::size_t added) {
      if (ec) {
        BOOST_LOG_TRIVIAL(debug) << "Buffered reader: Read failed after " << total << " bytes: " << ec.message();
        handler(ec, total);
        return;
      }
      if (added == 0 && self->available() == 0) {
        // remaining > 0 means read_offset < file_size, so the source stopped early
        BOOST_LOG_TRIVIAL(error) << "Buffered reader: Source ended before declared file size at "
                                 << self->window();
        handler(make_error_code(reader_errc::source_failure), total);
        return;
      }
      self->serve(next_dest, remaining, total, handler);
    });
}

std::size_t BufferedReader::copy_from_window(uint8_t* dest, std::size_t length) {
  std::size_t to_copy = std::min<std::size_t>(length, static_cast<std::size_t>(buffer_end_ - read_offset_));
  if (to_copy == 0) {
    return 0;
  }

  const std::size_t capacity = buffer_.size();
  std::size_t read_start = (start_in_buffer_ + static_cast<std::size_t>(read_offset_ - buffer_start_)) % capacity;

  // Second segment only when the window wraps physically
  std::size_t first = std::min(to_copy, capacity - read_start);
  std::memcpy(dest, buffer_.data() + read_start, first);
  if (first < to_copy) {
    std::memcpy(dest + first, buffer_.data(), to_copy - first);
  }

  read_offset_ += to_copy;
  evict_consumed_chunks();
  return to_copy;
}

void BufferedReader::evict_consumed_chunks() {
  while (read_offset_ - buffer_start_ >= config_.chunk_size) {
    buffer_start_ += config_.chunk_size;
    start_in_buffer_ = (start_in_buffer_ + config_.chunk_size) % buffer_.size();
  }
}

std::size_t BufferedReader::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(buffer_end_ - read_offset_);
}

//==============================================
// REFILL PIPELINE
//==============================================

void BufferedReader::refill_one_chunk(RefillGate::Completion finish) {
  if (closed_) {
    finish(make_error_code(reader_errc::closed), 0);
    return;
  }

  std::uint64_t initial_end = 0;
  std::size_t write_offset = 0;
  std::size_t to_copy = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t capacity = buffer_.size();
    std::size_t occupied = static_cast<std::size_t>(buffer_end_ - buffer_start_);
    if (occupied >= capacity) {
      BOOST_LOG_TRIVIAL(trace) << "Buffered reader: Buffer full";
    } else {
      write_offset = (start_in_buffer_ + occupied) % capacity;
      // Stop at the physical wrap, the free space, the next chunk boundary and end of file
      std::uint64_t run = std::min<std::uint64_t>(capacity - write_offset, capacity - occupied);
      run = std::min<std::uint64_t>(run, config_.chunk_size - buffer_end_ % config_.chunk_size);
      run = std::min<std::uint64_t>(run, file_size_ - buffer_end_);
      to_copy = static_cast<std::size_t>(run);
      initial_end = buffer_end_;
    }
  }

  if (to_copy == 0) {
    finish({}, 0);
    return;
  }

  BOOST_LOG_TRIVIAL(trace) << "Buffered reader: Buffering " << to_copy << " bytes at " << write_offset;

  auto self = shared_from_this();
  source_->async_read_into(buffer_.data(), write_offset, to_copy,
    [self, initial_end, to_copy, finish](const boost::system::error_code& ec, std::size_t bytes) {
      if (ec) {
        BOOST_LOG_TRIVIAL(warning) << "Buffered reader: Source read failed: " << ec.message();
        finish(ec, 0);
        return;
      }
      if (self->closed_) {
        BOOST_LOG_TRIVIAL(debug) << "Buffered reader: Discarding refill completed after close";
        finish(make_error_code(reader_errc::closed), 0);
        return;
      }
      if (bytes > to_copy) {
        BOOST_LOG_TRIVIAL(error) << "Buffered reader: Source returned " << bytes
                                 << " bytes for a request of " << to_copy;
        finish(make_error_code(reader_errc::source_failure), 0);
        return;
      }
      {
        std::lock_guard<std::mutex> lock(self->mutex_);
        self->buffer_end_ = initial_end + bytes;
      }
      finish({}, bytes);
    });
}

void BufferedReader::prefetch_after_sequential_read() {
  std::size_t chunks = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t occupied = static_cast<std::size_t>(buffer_end_ - buffer_start_);
    if (!closed_ && occupied < buffer_.size() && buffer_end_ < file_size_) {
      chunks = (buffer_.size() - occupied) / config_.chunk_size;
    }
  }

  if (chunks > 0) {
    BOOST_LOG_TRIVIAL(debug) << "Buffered reader: Async buffer fill of " << chunks << " chunks";
    async_prefetch(chunks);
  }
}

void BufferedReader::async_prefetch(std::size_t chunks) {
  if (chunks == 0 || closed_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffer_end_ - buffer_start_ >= buffer_.size()) {
      return;
    }
  }

  auto self = shared_from_this();
  gate_->run_exclusive(
    [self](RefillGate::Completion finish) {
      self->refill_one_chunk(std::move(finish));
    },
    [self, chunks](const boost::system::error_code& ec, std::size_t added) {
      // Background failures end the chain here and never reach foreground reads
      if (ec) {
        BOOST_LOG_TRIVIAL(debug) << "Buffered reader: Prefetch stopped: " << ec.message();
        return;
      }
      // End of file or window full
      if (added == 0) {
        return;
      }
      self->async_prefetch(chunks - 1);
    });
}

//==============================================
// SESSION REPLACEMENT
//==============================================

void BufferedReader::replace_source(Reposition reposition, std::uint64_t anchor, std::uint64_t target,
                                    ReaderHandler handler) {
  auto self = shared_from_this();
  auto successor = std::make_shared<std::unique_ptr<SourceReader>>();

  // Admission waits for any refill still writing through the current source
  gate_->run_exclusive(
    [self, reposition, successor](RefillGate::Completion finish) {
      std::shared_ptr<SourceReader> retiring(std::move(self->source_));
      if (!retiring) {
        finish(make_error_code(reader_errc::closed), 0);
        return;
      }
      reposition(*retiring,
        [retiring, successor, finish](const boost::system::error_code& ec, std::unique_ptr<SourceReader> next) {
          *successor = std::move(next);
          finish(ec, 0);
        });
    },
    [self, successor, anchor, target, handler](const boost::system::error_code& ec, std::size_t) {
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "Buffered reader: Repositioning source failed: " << ec.message();
        handler(ec, nullptr);
        return;
      }
      if (!*successor) {
        BOOST_LOG_TRIVIAL(error) << "Buffered reader: Source returned no handle after repositioning";
        handler(make_error_code(reader_errc::source_failure), nullptr);
        return;
      }

      auto next = BufferedReader::create(self->executor_, std::move(*successor), self->config_,
                                         self->file_size_, anchor);
      std::size_t gap = static_cast<std::size_t>(target - anchor);
      if (gap == 0) {
        handler({}, next);
        return;
      }
      next->catch_up(gap, handler);
    });
}

void BufferedReader::catch_up(std::size_t gap, ReaderHandler handler) {
  BOOST_LOG_TRIVIAL(trace) << "Buffered reader: Catching up " << gap << " bytes from " << window();

  auto self = shared_from_this();
  auto scratch = std::make_shared<std::vector<uint8_t>>(gap);
  serve(scratch->data(), gap, 0,
    [self, scratch, handler](const boost::system::error_code& ec, std::size_t) {
      if (ec) {
        handler(ec, nullptr);
        return;
      }
      handler({}, self);
    });
}

void BufferedReader::post_read_result(ReadHandler handler, const boost::system::error_code& ec, std::size_t bytes) {
  boost::asio::post(executor_, [handler, ec, bytes]() { handler(ec, bytes); });
}

void BufferedReader::post_reader_result(ReaderHandler handler, const boost::system::error_code& ec,
                                        std::shared_ptr<BufferedReader> reader) {
  boost::asio::post(executor_, [handler, ec, reader]() { handler(ec, reader); });
}

} // namespace reader
} // namespace chunkfs
