#ifndef CHUNKFS_CRYPTO_ERROR_HPP
#define CHUNKFS_CRYPTO_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace chunkfs::crypto {

class CryptoError : public std::runtime_error {
public:
  explicit CryptoError(const std::string& message)
    : std::runtime_error(message) {}
};

// Key material, IV generation or cipher context setup failed
class InitializationError : public CryptoError {
public:
  explicit InitializationError(const std::string& message)
    : CryptoError("Chunk cipher setup failed: " + message) {}
};

// Sealing a plaintext chunk failed
class EncryptionError : public CryptoError {
public:
  EncryptionError(const std::string& message, std::size_t chunk_size)
    : CryptoError("Sealing chunk of " + std::to_string(chunk_size) + " bytes failed: " + message)
    , chunk_size_(chunk_size) {}

  std::size_t chunk_size() const { return chunk_size_; }

private:
  std::size_t chunk_size_;
};

// A sealed blob could not be opened: too short to carry an IV, not block aligned,
// sealed under another key, or tampered with
class DecryptionError : public CryptoError {
public:
  DecryptionError(const std::string& message, std::size_t blob_size)
    : CryptoError("Opening sealed blob of " + std::to_string(blob_size) + " bytes failed: " + message)
    , blob_size_(blob_size) {}

  std::size_t blob_size() const { return blob_size_; }

private:
  std::size_t blob_size_;
};

} // namespace chunkfs::crypto

#endif // CHUNKFS_CRYPTO_ERROR_HPP
