#ifndef CHUNKFS_CHUNK_CIPHER_HPP
#define CHUNKFS_CHUNK_CIPHER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace chunkfs::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// Encrypts and decrypts whole chunks with AES-256-CBC.
// A sealed blob is laid out as IV || ciphertext, so every chunk carries its own IV.
// Each call uses its own cipher context, so one instance may be shared across threads.
class ChunkCipher {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR ----
  explicit ChunkCipher(const std::vector<uint8_t>& key);


  // ---- CHUNK OPERATIONS ----
  // Encrypts length bytes under a fresh IV and returns IV || ciphertext
  std::vector<uint8_t> seal(const uint8_t* data, size_t length) const;
  // Encrypts under the given IV (deterministic, used when the caller owns IV choice)
  std::vector<uint8_t> seal(const uint8_t* data, size_t length,
                            const std::array<uint8_t, IV_SIZE>& iv) const;
  // Splits off the IV and decrypts the remainder
  std::vector<uint8_t> open(const std::vector<uint8_t>& blob) const;


  // ---- KEY AND IV MATERIAL ----
  std::array<uint8_t, IV_SIZE> generate_IV() const;
  // SHA-256 of a passphrase, sized for KEY_SIZE
  static std::vector<uint8_t> derive_key(const std::string& passphrase);

  // Ciphertext size for a plaintext of the given size, IV prefix included
  static size_t sealed_size(size_t plaintext_size);

private:
  // ---- PARAMETERS ----
  std::vector<uint8_t> key_;


  // ---- CIPHER PROCESSING ----
  // Runs one full update/final pass over the input
  std::vector<uint8_t> process(const uint8_t* input, size_t length,
                               const uint8_t* iv, bool encrypting) const;
};

} // namespace chunkfs::crypto

#endif // CHUNKFS_CHUNK_CIPHER_HPP
