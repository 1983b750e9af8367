#ifndef CHUNKFS_STORE_SOURCE_HPP
#define CHUNKFS_STORE_SOURCE_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include "chunkfs/crypto/chunk_cipher.hpp"
#include "chunkfs/file/manifest.hpp"
#include "chunkfs/reader/source_reader.hpp"
#include "chunkfs/store/store.hpp"

namespace chunkfs {
namespace file {

// SourceReader that loads sealed chunks of one file from the chunk store and
// decrypts them on the executor. The most recently opened chunk stays cached, so
// consecutive reads inside one chunk hit the store once.
class StoreSourceReader : public reader::SourceReader {
public:
  StoreSourceReader(boost::asio::any_io_executor executor,
                    std::shared_ptr<const store::ChunkStore> store,
                    std::shared_ptr<const crypto::ChunkCipher> cipher,
                    std::string file_name,
                    FileManifest manifest,
                    std::uint64_t position = 0);

  void async_read_into(uint8_t* dest, std::size_t offset, std::size_t length, ReadHandler handler) override;
  void async_seek(std::uint64_t offset, SeekHandler handler) override;
  void async_reset(SeekHandler handler) override;
  void close() override;

  std::uint64_t position() const;

private:
  // ---- PARAMETERS ----
  boost::asio::any_io_executor executor_;
  std::shared_ptr<const store::ChunkStore> store_;
  std::shared_ptr<const crypto::ChunkCipher> cipher_;
  std::string file_name_;
  FileManifest manifest_;

  mutable std::mutex mutex_;
  std::uint64_t position_;
  std::optional<std::uint64_t> cached_index_;
  std::vector<uint8_t> cached_chunk_;
  std::atomic<bool> closed_{false};


  // Returns the plaintext of chunk index, loading it if needed. Requires mutex_.
  const std::vector<uint8_t>& chunk_at(std::uint64_t index);
  // Handle for the same file positioned at offset
  std::unique_ptr<reader::SourceReader> derive(std::uint64_t offset) const;
};

} // namespace file
} // namespace chunkfs

#endif // CHUNKFS_STORE_SOURCE_HPP
