#include "chunkfs/store/store.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace chunkfs {
namespace store {

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

ChunkStore::ChunkStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing chunk store with base path: " << base_path;
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path;
}

//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void ChunkStore::put(const std::string& key, const std::vector<uint8_t>& blob) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Storing " << blob.size() << " bytes with key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp";

  std::lock_guard<std::mutex> lock(write_mutex_);
  check_directory_exists(file_path.parent_path());

  // Write beside the target and rename, so readers never observe a partial blob
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Store: Failed to create file: " + temp_path.string());
    }
    file.write(reinterpret_cast<const char*>(blob.data()), static_cast<std::streamsize>(blob.size()));
    if (!file.good()) {
      throw StoreError("Store: Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to commit blob for key " << key << ": " << ec.message();
    std::filesystem::remove(temp_path, ec);
    throw StoreError("Store: Failed to commit blob: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Store: Successfully stored " << blob.size() << " bytes with key: " << key;
}

std::vector<uint8_t> ChunkStore::get(const std::string& key) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Retrieving blob for key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);
  verify_file_exists(file_path);

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }

  std::vector<uint8_t> blob(static_cast<size_t>(std::filesystem::file_size(file_path)));
  if (!blob.empty() && !file.read(reinterpret_cast<char*>(blob.data()), static_cast<std::streamsize>(blob.size()))) {
    BOOST_LOG_TRIVIAL(error) << "Store: Short read from " << file_path.string();
    throw StoreError("Store: Failed to read file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(trace) << "Store: Loaded " << blob.size() << " bytes for key: " << key;
  return blob;
}

void ChunkStore::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing blob with key: " << key;

  std::filesystem::path file_path = resolve_key_path(key);

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!std::filesystem::remove(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove blob with key: " << key;
    throw StoreError("Store: Failed to remove blob");
  }

  // Clean up empty parent directories up to base_path_
  auto current = file_path.parent_path();
  while (current != base_path_ && std::filesystem::is_empty(current)) {
    std::filesystem::remove(current);
    current = current.parent_path();
  }
}

void ChunkStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Store: Clearing entire store at: " << base_path_;
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
}

//==============================================
// QUERY OPERATIONS
//==============================================

bool ChunkStore::has(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);
  bool exists = std::filesystem::exists(file_path);

  BOOST_LOG_TRIVIAL(trace) << "Store: Key " << key << (exists ? " exists" : " not found");
  return exists;
}

std::uintmax_t ChunkStore::blob_size(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);
  verify_file_exists(file_path);
  return std::filesystem::file_size(file_path);
}

//==============================================
// KEY NAMING
//==============================================

std::string ChunkStore::chunk_key(const std::string& file_name, std::uint64_t index) {
  return "chunk:" + file_name + ":" + std::to_string(index);
}

std::string ChunkStore::manifest_key(const std::string& file_name) {
  return "manifest:" + file_name;
}

//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string ChunkStore::hash_key(const std::string& key) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw StoreError("Store: Failed to create hash context");
  }
  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw StoreError("Store: Failed to initialize hash context");
  }
  if (!EVP_DigestUpdate(ctx.get(), key.data(), key.size())) {
    throw StoreError("Store: Failed to update hash");
  }
  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw StoreError("Store: Failed to finalize hash");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::filesystem::path ChunkStore::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

std::filesystem::path ChunkStore::resolve_key_path(const std::string& key) const {
  return get_path_for_hash(hash_key(key));
}

void ChunkStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void ChunkStore::verify_file_exists(const std::filesystem::path& file_path) const {
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Blob not found: " << file_path.string();
    throw StoreError("Store: Blob not found");
  }
}

} // namespace store
} // namespace chunkfs
