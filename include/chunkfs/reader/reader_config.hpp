#ifndef CHUNKFS_READER_CONFIG_HPP
#define CHUNKFS_READER_CONFIG_HPP

#include <cstddef>
#include <string>
#include "chunkfs/chunk/chunk.hpp"
#include "chunkfs/reader/reader_error.hpp"

namespace chunkfs {
namespace reader {

// Construction-time settings of a BufferedReader
struct ReaderConfig {
  // Buffer capacity in chunks
  std::size_t chunks_to_buffer{4};
  // Chunk granularity of the source, shared with the storage layer
  std::size_t chunk_size{chunk::MAX_SIZE};

  std::size_t capacity() const { return chunks_to_buffer * chunk_size; }

  // Builds a config from a byte capacity, which must be a positive multiple of chunk_size
  static ReaderConfig from_capacity(std::size_t capacity, std::size_t chunk_size = chunk::MAX_SIZE) {
    if (chunk_size == 0) {
      throw ConfigurationError("chunk size must be positive");
    }
    if (capacity == 0 || capacity % chunk_size != 0) {
      throw ConfigurationError("buffer capacity " + std::to_string(capacity) +
                               " is not a positive multiple of chunk size " + std::to_string(chunk_size));
    }
    return ReaderConfig{capacity / chunk_size, chunk_size};
  }
};

} // namespace reader
} // namespace chunkfs

#endif // CHUNKFS_READER_CONFIG_HPP
