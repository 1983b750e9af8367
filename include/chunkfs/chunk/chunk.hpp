#ifndef CHUNKFS_CHUNK_HPP
#define CHUNKFS_CHUNK_HPP

#include <cstddef>
#include <cstdint>

namespace chunkfs {
namespace chunk {

// Maximum size of a stored chunk in bytes. Every offset the storage layer seeks to
// is a multiple of this value.
constexpr std::size_t MAX_SIZE = 5 * 1024 * 1024;

// Number of chunks needed to hold file_size bytes
inline std::uint64_t chunk_count(std::uint64_t file_size, std::size_t chunk_size = MAX_SIZE) {
  return (file_size + chunk_size - 1) / chunk_size;
}

// Largest chunk boundary at or below offset
inline std::uint64_t align_down(std::uint64_t offset, std::size_t chunk_size = MAX_SIZE) {
  return offset - offset % chunk_size;
}

} // namespace chunk
} // namespace chunkfs

#endif // CHUNKFS_CHUNK_HPP
