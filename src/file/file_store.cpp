#include "chunkfs/file/file_store.hpp"
#include "chunkfs/file/store_source.hpp"
#include <limits>
#include <boost/log/trivial.hpp>

namespace chunkfs {
namespace file {

//==============================================
// CONSTRUCTOR
//==============================================

FileStore::FileStore(std::shared_ptr<store::ChunkStore> store, const std::vector<uint8_t>& key,
                     std::size_t chunk_size)
  : store_(std::move(store))
  , cipher_(std::make_shared<const crypto::ChunkCipher>(key))
  , chunk_size_(chunk_size) {
  if (!store_) {
    throw FileStoreError("File store: A chunk store is required");
  }
  if (chunk_size_ == 0 || chunk_size_ > std::numeric_limits<std::uint32_t>::max()) {
    BOOST_LOG_TRIVIAL(error) << "File store: Invalid chunk size: " << chunk_size_;
    throw FileStoreError("File store: Invalid chunk size");
  }
  BOOST_LOG_TRIVIAL(info) << "File store: Initialized with chunk size " << chunk_size_;
}

//==============================================
// WRITE PATH
//==============================================

FileManifest FileStore::store_file(const std::string& name, std::istream& input) {
  BOOST_LOG_TRIVIAL(info) << "File store: Storing file: " << name;

  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "File store: Invalid input stream for: " << name;
    throw FileStoreError("File store: Invalid input stream");
  }

  // Remember the previous layout so stale trailing chunks can be dropped
  std::uint64_t previous_chunks = 0;
  if (has_file(name)) {
    previous_chunks = manifest(name).chunk_count;
  }

  FileManifest result;
  result.chunk_size = static_cast<std::uint32_t>(chunk_size_);

  std::vector<uint8_t> chunk(chunk_size_);
  while (input) {
    input.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
    std::streamsize bytes_read = input.gcount();
    if (bytes_read <= 0) {
      break;
    }

    std::vector<uint8_t> sealed = cipher_->seal(chunk.data(), static_cast<size_t>(bytes_read));
    store_->put(store::ChunkStore::chunk_key(name, result.chunk_count), sealed);

    result.file_size += static_cast<std::uint64_t>(bytes_read);
    result.chunk_count++;
    BOOST_LOG_TRIVIAL(debug) << "File store: Stored chunk " << result.chunk_count - 1
                             << " of " << name << " (" << bytes_read << " bytes)";
  }

  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "File store: Failed reading input for: " << name;
    throw FileStoreError("File store: Failed to read input stream");
  }

  write_manifest(name, result);
  if (previous_chunks > result.chunk_count) {
    remove_chunks(name, result.chunk_count, previous_chunks);
  }

  BOOST_LOG_TRIVIAL(info) << "File store: Stored " << result.file_size << " bytes of " << name
                          << " in " << result.chunk_count << " chunks";
  return result;
}

void FileStore::remove_file(const std::string& name) {
  BOOST_LOG_TRIVIAL(info) << "File store: Removing file: " << name;

  FileManifest current = manifest(name);
  remove_chunks(name, 0, current.chunk_count);
  store_->remove(store::ChunkStore::manifest_key(name));
}

//==============================================
// READ PATH
//==============================================

bool FileStore::has_file(const std::string& name) const {
  return store_->has(store::ChunkStore::manifest_key(name));
}

FileManifest FileStore::manifest(const std::string& name) const {
  if (!has_file(name)) {
    BOOST_LOG_TRIVIAL(error) << "File store: No such file: " << name;
    throw FileStoreError("File store: No such file: " + name);
  }

  try {
    std::vector<uint8_t> sealed = store_->get(store::ChunkStore::manifest_key(name));
    return FileManifest::decode(cipher_->open(sealed));
  }
  catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "File store: Cannot open manifest of " << name << ": " << e.what();
    throw FileStoreError("File store: Cannot open manifest of " + name);
  }
}

std::shared_ptr<reader::BufferedReader> FileStore::open_file(const std::string& name,
                                                             boost::asio::any_io_executor executor,
                                                             std::size_t chunks_to_buffer) const {
  FileManifest layout = manifest(name);

  // The reader must step in the same chunk size the file was written with
  reader::ReaderConfig config;
  config.chunks_to_buffer = chunks_to_buffer;
  config.chunk_size = layout.chunk_size;

  BOOST_LOG_TRIVIAL(debug) << "File store: Opening " << name << " (" << layout.file_size
                           << " bytes) with " << chunks_to_buffer << " buffered chunks";

  auto source = std::make_unique<StoreSourceReader>(executor, store_, cipher_, name, layout);
  return reader::BufferedReader::create(executor, std::move(source), config, layout.file_size);
}

//==============================================
// MANIFEST AND CHUNK HOUSEKEEPING
//==============================================

void FileStore::write_manifest(const std::string& name, const FileManifest& manifest) {
  std::vector<uint8_t> encoded = manifest.encode();
  store_->put(store::ChunkStore::manifest_key(name), cipher_->seal(encoded.data(), encoded.size()));
}

void FileStore::remove_chunks(const std::string& name, std::uint64_t from, std::uint64_t to) {
  for (std::uint64_t index = from; index < to; ++index) {
    std::string key = store::ChunkStore::chunk_key(name, index);
    if (store_->has(key)) {
      store_->remove(key);
    } else {
      BOOST_LOG_TRIVIAL(warning) << "File store: Chunk " << index << " of " << name << " already missing";
    }
  }
}

} // namespace file
} // namespace chunkfs
