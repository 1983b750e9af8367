#include "chunkfs/file/store_source.hpp"
#include "chunkfs/reader/reader_error.hpp"
#include <algorithm>
#include <cstring>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace chunkfs {
namespace file {

StoreSourceReader::StoreSourceReader(boost::asio::any_io_executor executor,
                                     std::shared_ptr<const store::ChunkStore> store,
                                     std::shared_ptr<const crypto::ChunkCipher> cipher,
                                     std::string file_name,
                                     FileManifest manifest,
                                     std::uint64_t position)
  : executor_(std::move(executor))
  , store_(std::move(store))
  , cipher_(std::move(cipher))
  , file_name_(std::move(file_name))
  , manifest_(manifest)
  , position_(position) {
  BOOST_LOG_TRIVIAL(debug) << "Store source: Opened " << file_name_ << " at offset " << position_;
}

//==============================================
// SOURCE OPERATIONS
//==============================================

void StoreSourceReader::async_read_into(uint8_t* dest, std::size_t offset, std::size_t length,
                                        ReadHandler handler) {
  if (closed_) {
    boost::asio::post(executor_, [handler]() {
      handler(make_error_code(reader::reader_errc::closed), 0);
    });
    return;
  }

  boost::asio::post(executor_, [this, dest, offset, length, handler]() {
    std::size_t copied = 0;
    try {
      std::lock_guard<std::mutex> lock(mutex_);
      while (copied < length && position_ < manifest_.file_size) {
        std::uint64_t index = position_ / manifest_.chunk_size;
        const std::vector<uint8_t>& chunk = chunk_at(index);

        std::size_t in_chunk = static_cast<std::size_t>(position_ % manifest_.chunk_size);
        std::size_t n = std::min(length - copied, chunk.size() - in_chunk);
        std::memcpy(dest + offset + copied, chunk.data() + in_chunk, n);

        copied += n;
        position_ += n;
      }
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Store source: Failed to read " << file_name_ << ": " << e.what();
      handler(make_error_code(reader::reader_errc::source_failure), 0);
      return;
    }

    BOOST_LOG_TRIVIAL(trace) << "Store source: Read " << copied << " bytes of " << file_name_;
    handler({}, copied);
  });
}

void StoreSourceReader::async_seek(std::uint64_t offset, SeekHandler handler) {
  if (closed_ || offset > manifest_.file_size) {
    auto ec = make_error_code(closed_ ? reader::reader_errc::closed : reader::reader_errc::invalid_seek);
    boost::asio::post(executor_, [handler, ec]() { handler(ec, nullptr); });
    return;
  }

  if (offset % manifest_.chunk_size != 0) {
    BOOST_LOG_TRIVIAL(debug) << "Store source: Unaligned seek to " << offset << " in " << file_name_;
  }

  boost::asio::post(executor_, [this, offset, handler]() { handler({}, derive(offset)); });
}

void StoreSourceReader::async_reset(SeekHandler handler) {
  if (closed_) {
    boost::asio::post(executor_, [handler]() {
      handler(make_error_code(reader::reader_errc::closed), nullptr);
    });
    return;
  }

  boost::asio::post(executor_, [this, handler]() { handler({}, derive(0)); });
}

void StoreSourceReader::close() {
  if (!closed_.exchange(true)) {
    BOOST_LOG_TRIVIAL(debug) << "Store source: Closed " << file_name_;
  }
}

std::uint64_t StoreSourceReader::position() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return position_;
}

//==============================================
// CHUNK LOADING
//==============================================

const std::vector<uint8_t>& StoreSourceReader::chunk_at(std::uint64_t index) {
  if (cached_index_ && *cached_index_ == index) {
    return cached_chunk_;
  }

  std::vector<uint8_t> sealed = store_->get(store::ChunkStore::chunk_key(file_name_, index));
  std::vector<uint8_t> plain = cipher_->open(sealed);

  std::size_t expected = manifest_.chunk_length(index);
  if (plain.size() != expected) {
    throw FileStoreError("Store source: Chunk " + std::to_string(index) + " of " + file_name_ +
                         " holds " + std::to_string(plain.size()) + " bytes, expected " +
                         std::to_string(expected));
  }

  BOOST_LOG_TRIVIAL(trace) << "Store source: Loaded chunk " << index << " of " << file_name_;
  cached_chunk_ = std::move(plain);
  cached_index_ = index;
  return cached_chunk_;
}

std::unique_ptr<reader::SourceReader> StoreSourceReader::derive(std::uint64_t offset) const {
  return std::make_unique<StoreSourceReader>(executor_, store_, cipher_, file_name_, manifest_, offset);
}

} // namespace file
} // namespace chunkfs
