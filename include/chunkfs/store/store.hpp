#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkfs {
namespace store {

// Content-addressed blob store on the local file system.
// Keys are hashed with SHA-256 and the digest picks the on-disk location, so
// arbitrary key strings never reach the file system as path components.
class ChunkStore {
public:

  // ---- CONSTRUCTOR ----
  explicit ChunkStore(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores blob under key, replacing any previous blob
  void put(const std::string& key, const std::vector<uint8_t>& blob);
  // Loads the blob stored under key, throws StoreError if absent
  std::vector<uint8_t> get(const std::string& key) const;
  // Removes the blob stored under key and prunes empty directories
  void remove(const std::string& key);
  // Removes all stored blobs
  void clear();


  // ---- QUERY OPERATIONS ----
  bool has(const std::string& key) const;
  std::uintmax_t blob_size(const std::string& key) const;
  const std::filesystem::path& base_path() const { return base_path_; }


  // ---- KEY NAMING ----
  static std::string chunk_key(const std::string& file_name, std::uint64_t index);
  static std::string manifest_key(const std::string& file_name);

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  // Serializes writers; readers of distinct keys never contend
  mutable std::mutex write_mutex_;


  // ---- CAS STORAGE SUPPORT ----
  // Hex encoded SHA-256 of key using OpenSSL EVP
  std::string hash_key(const std::string& key) const;
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  std::filesystem::path resolve_key_path(const std::string& key) const;

  void check_directory_exists(const std::filesystem::path& path) const;
  void verify_file_exists(const std::filesystem::path& file_path) const;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace chunkfs
