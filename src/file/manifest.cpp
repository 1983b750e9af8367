#include "chunkfs/file/manifest.hpp"
#include "chunkfs/chunk/chunk.hpp"
#include <algorithm>
#include <cstring>
#include <boost/endian/conversion.hpp>

namespace chunkfs {
namespace file {

namespace {

template <typename T>
void write_value(std::vector<uint8_t>& out, T host_value) {
  T network_value = boost::endian::native_to_big(host_value);
  const auto* bytes = reinterpret_cast<const uint8_t*>(&network_value);
  out.insert(out.end(), bytes, bytes + sizeof(T));
}

template <typename T>
T read_value(const std::vector<uint8_t>& in, std::size_t& cursor) {
  T network_value;
  std::memcpy(&network_value, in.data() + cursor, sizeof(T));
  cursor += sizeof(T);
  return boost::endian::big_to_native(network_value);
}

} // namespace

std::vector<uint8_t> FileManifest::encode() const {
  std::vector<uint8_t> out;
  out.reserve(ENCODED_SIZE);
  write_value<std::uint32_t>(out, MAGIC);
  out.push_back(VERSION);
  write_value<std::uint64_t>(out, file_size);
  write_value<std::uint32_t>(out, chunk_size);
  write_value<std::uint64_t>(out, chunk_count);
  return out;
}

FileManifest FileManifest::decode(const std::vector<uint8_t>& bytes) {
  if (bytes.size() != ENCODED_SIZE) {
    throw FileStoreError("Manifest: Unexpected size " + std::to_string(bytes.size()));
  }

  std::size_t cursor = 0;
  if (read_value<std::uint32_t>(bytes, cursor) != MAGIC) {
    throw FileStoreError("Manifest: Bad magic");
  }
  std::uint8_t version = bytes[cursor++];
  if (version != VERSION) {
    throw FileStoreError("Manifest: Unsupported version " + std::to_string(version));
  }

  FileManifest manifest;
  manifest.file_size = read_value<std::uint64_t>(bytes, cursor);
  manifest.chunk_size = read_value<std::uint32_t>(bytes, cursor);
  manifest.chunk_count = read_value<std::uint64_t>(bytes, cursor);

  if (manifest.chunk_size == 0 ||
      manifest.chunk_count != chunk::chunk_count(manifest.file_size, manifest.chunk_size)) {
    throw FileStoreError("Manifest: Chunk layout does not match file size");
  }
  return manifest;
}

std::size_t FileManifest::chunk_length(std::uint64_t index) const {
  if (index >= chunk_count) {
    return 0;
  }
  std::uint64_t start = index * chunk_size;
  return static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, file_size - start));
}

} // namespace file
} // namespace chunkfs
