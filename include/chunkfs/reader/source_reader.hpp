#ifndef CHUNKFS_SOURCE_READER_HPP
#define CHUNKFS_SOURCE_READER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <boost/system/error_code.hpp>

namespace chunkfs {
namespace reader {

// Asynchronous, chunk-granular byte source such as a decrypting store reader.
//
// Completion handlers are invoked on the source's executor, never inline from the
// initiating call. At most one operation is outstanding on a handle at a time; the
// caller must keep the handle alive until that operation completes.
class SourceReader {
public:
  using ReadHandler = std::function<void(const boost::system::error_code&, std::size_t)>;
  using SeekHandler = std::function<void(const boost::system::error_code&, std::unique_ptr<SourceReader>)>;

  virtual ~SourceReader() = default;

  // Reads up to length bytes into dest + offset. Fewer bytes only at end of stream.
  virtual void async_read_into(uint8_t* dest, std::size_t offset, std::size_t length,
                               ReadHandler handler) = 0;

  // Yields a new handle positioned at offset; this handle must not be used afterwards.
  // Offsets are expected to be chunk-aligned.
  virtual void async_seek(std::uint64_t offset, SeekHandler handler) = 0;

  // Yields a new handle positioned at the start of the stream
  virtual void async_reset(SeekHandler handler) = 0;

  // Idempotent. Later reads fail with reader_errc::closed.
  virtual void close() = 0;
};

} // namespace reader
} // namespace chunkfs

#endif // CHUNKFS_SOURCE_READER_HPP
