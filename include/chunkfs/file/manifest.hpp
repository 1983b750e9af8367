#ifndef CHUNKFS_FILE_MANIFEST_HPP
#define CHUNKFS_FILE_MANIFEST_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkfs {
namespace file {

class FileStoreError : public std::runtime_error {
public:
  explicit FileStoreError(const std::string& message) : std::runtime_error(message) {}
};

// Describes how a stored file is split into chunks.
// Wire layout, all integers big endian:
//   magic (4) | version (1) | file_size (8) | chunk_size (4) | chunk_count (8)
struct FileManifest {
  static constexpr std::uint32_t MAGIC = 0x43465331;  // "CFS1"
  static constexpr std::uint8_t VERSION = 1;
  static constexpr std::size_t ENCODED_SIZE = 4 + 1 + 8 + 4 + 8;

  std::uint64_t file_size{0};
  std::uint32_t chunk_size{0};
  std::uint64_t chunk_count{0};

  std::vector<uint8_t> encode() const;
  // Throws FileStoreError on a bad header or inconsistent sizes
  static FileManifest decode(const std::vector<uint8_t>& bytes);

  // Plaintext length of chunk index; only the last chunk may be short
  std::size_t chunk_length(std::uint64_t index) const;
};

} // namespace file
} // namespace chunkfs

#endif // CHUNKFS_FILE_MANIFEST_HPP
