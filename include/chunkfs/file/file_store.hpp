#ifndef CHUNKFS_FILE_STORE_HPP
#define CHUNKFS_FILE_STORE_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include "chunkfs/chunk/chunk.hpp"
#include "chunkfs/crypto/chunk_cipher.hpp"
#include "chunkfs/file/manifest.hpp"
#include "chunkfs/reader/buffered_reader.hpp"
#include "chunkfs/reader/source_reader.hpp"
#include "chunkfs/store/store.hpp"

namespace chunkfs {
namespace file {

// Splits files into sealed chunks in a ChunkStore and opens buffered readers over them.
// Each file is described by a sealed manifest stored beside its chunks.
class FileStore {
public:
  // ---- CONSTRUCTOR ----
  FileStore(std::shared_ptr<store::ChunkStore> store, const std::vector<uint8_t>& key,
            std::size_t chunk_size = chunk::MAX_SIZE);


  // ---- WRITE PATH ----
  // Chunks, seals and stores the whole stream under name, replacing any previous file
  FileManifest store_file(const std::string& name, std::istream& input);
  // Removes the manifest and every chunk of name
  void remove_file(const std::string& name);


  // ---- READ PATH ----
  bool has_file(const std::string& name) const;
  // Throws FileStoreError if name is unknown or its manifest cannot be opened
  FileManifest manifest(const std::string& name) const;
  // Buffered reader over name holding chunks_to_buffer chunks
  std::shared_ptr<reader::BufferedReader> open_file(const std::string& name,
                                                    boost::asio::any_io_executor executor,
                                                    std::size_t chunks_to_buffer) const;


  // ---- GETTERS ----
  store::ChunkStore& get_store() { return *store_; }
  std::size_t chunk_size() const { return chunk_size_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<store::ChunkStore> store_;
  std::shared_ptr<const crypto::ChunkCipher> cipher_;
  std::size_t chunk_size_;


  void write_manifest(const std::string& name, const FileManifest& manifest);
  // Drops chunks [from, to) left behind by a previous, longer version of name
  void remove_chunks(const std::string& name, std::uint64_t from, std::uint64_t to);
};

} // namespace file
} // namespace chunkfs

#endif // CHUNKFS_FILE_STORE_HPP
