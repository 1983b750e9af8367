#include "chunkfs/crypto/chunk_cipher.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <limits>
#include <string>

namespace chunkfs::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("cannot allocate cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR
//==============================================

ChunkCipher::ChunkCipher(const std::vector<uint8_t>& key) : key_(key) {
  if (key_.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Chunk cipher: Invalid key size: " << key_.size()
                             << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("key must be " + std::to_string(KEY_SIZE) + " bytes, got " + std::to_string(key_.size()));
  }
  BOOST_LOG_TRIVIAL(debug) << "Chunk cipher: Initialized with AES-256-CBC key";
}

//==============================================
// CHUNK OPERATIONS
//==============================================

std::vector<uint8_t> ChunkCipher::seal(const uint8_t* data, size_t length) const {
  return seal(data, length, generate_IV());
}

std::vector<uint8_t> ChunkCipher::seal(const uint8_t* data, size_t length,
                                       const std::array<uint8_t, IV_SIZE>& iv) const {
  BOOST_LOG_TRIVIAL(trace) << "Chunk cipher: Sealing chunk of " << length << " bytes";

  std::vector<uint8_t> ciphertext = process(data, length, iv.data(), true);

  std::vector<uint8_t> blob;
  blob.reserve(IV_SIZE + ciphertext.size());
  blob.insert(blob.end(), iv.begin(), iv.end());
  blob.insert(blob.end(), ciphertext.begin(), ciphertext.end());
  return blob;
}

std::vector<uint8_t> ChunkCipher::open(const std::vector<uint8_t>& blob) const {
  // IV plus at least one padded block
  if (blob.size() < IV_SIZE + BLOCK_SIZE || (blob.size() - IV_SIZE) % BLOCK_SIZE != 0) {
    BOOST_LOG_TRIVIAL(error) << "Chunk cipher: Malformed sealed chunk of " << blob.size() << " bytes";
    throw DecryptionError("malformed IV or ciphertext length", blob.size());
  }

  BOOST_LOG_TRIVIAL(trace) << "Chunk cipher: Opening chunk of " << blob.size() << " bytes";
  return process(blob.data() + IV_SIZE, blob.size() - IV_SIZE, blob.data(), false);
}

//==============================================
// CIPHER PROCESSING
//==============================================

std::vector<uint8_t> ChunkCipher::process(const uint8_t* input, size_t length,
                                          const uint8_t* iv, bool encrypting) const {
  if (length > static_cast<size_t>(std::numeric_limits<int>::max()) - BLOCK_SIZE) {
    if (encrypting) {
      throw EncryptionError("too large for a single cipher pass", length);
    }
    throw DecryptionError("too large for a single cipher pass", length + IV_SIZE);
  }

  CipherContext context;
  const EVP_CIPHER* cipher = EVP_aes_256_cbc();

  if (encrypting) {
    if (!EVP_EncryptInit_ex(context.get(), cipher, nullptr, key_.data(), iv)) {
      throw EncryptionError("cannot initialize encryption context", length);
    }
  } else {
    if (!EVP_DecryptInit_ex(context.get(), cipher, nullptr, key_.data(), iv)) {
      throw DecryptionError("cannot initialize decryption context", length + IV_SIZE);
    }
  }

  std::vector<uint8_t> output(length + BLOCK_SIZE);
  int outlen = 0;
  int final_outlen = 0;

  if (encrypting) {
    if (!EVP_EncryptUpdate(context.get(), output.data(), &outlen, input, static_cast<int>(length))) {
      throw EncryptionError("cipher update failed", length);
    }
    if (!EVP_EncryptFinal_ex(context.get(), output.data() + outlen, &final_outlen)) {
      throw EncryptionError("cipher finalization failed", length);
    }
  } else {
    if (!EVP_DecryptUpdate(context.get(), output.data(), &outlen, input, static_cast<int>(length))) {
      throw DecryptionError("cipher update failed", length + IV_SIZE);
    }
    // Padding check fails here on a wrong key or tampered ciphertext
    if (!EVP_DecryptFinal_ex(context.get(), output.data() + outlen, &final_outlen)) {
      throw DecryptionError("padding check failed, wrong key or tampered data", length + IV_SIZE);
    }
  }

  output.resize(static_cast<size_t>(outlen + final_outlen));
  return output;
}

//==============================================
// KEY AND IV MATERIAL
//==============================================

std::array<uint8_t, ChunkCipher::IV_SIZE> ChunkCipher::generate_IV() const {
  std::array<uint8_t, IV_SIZE> iv;
  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw InitializationError("cannot generate random IV");
  }
  return iv;
}

std::vector<uint8_t> ChunkCipher::derive_key(const std::string& passphrase) {
  std::vector<uint8_t> key(EVP_MAX_MD_SIZE);
  unsigned int key_len = 0;

  if (!EVP_Digest(passphrase.data(), passphrase.size(), key.data(), &key_len, EVP_sha256(), nullptr)) {
    throw InitializationError("cannot derive key from passphrase");
  }

  key.resize(key_len);
  return key;
}

size_t ChunkCipher::sealed_size(size_t plaintext_size) {
  // PKCS#7 always adds between 1 and BLOCK_SIZE bytes
  return IV_SIZE + (plaintext_size / BLOCK_SIZE + 1) * BLOCK_SIZE;
}

} // namespace chunkfs::crypto
