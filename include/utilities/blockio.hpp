#ifndef BLOCKIO_HPP
#define BLOCKIO_HPP

#include <array>    // For std::array
#include <cstddef>  // For std::byte
#include <sodium.h> // For libsodium
#include <string>   // For std::string
#include <vector>

// Define DigestResult struct
struct DigestResult {
  std::array<uint8_t, crypto_hash_sha256_BYTES> digest; // 32 bytes for SHA-256
  std::string cid; // Content Identifier (CID) of the hashed data
  std::vector<std::byte> raw;
};

/**
 * @brief Buffered chunk processing: accumulates bytes, optionally zero-pads
 * them to a fixed chunk size and hashes the result with SHA-256.
 */
class BlockIO {
public:
  BlockIO();
  ~BlockIO(); ///< Destructor

  // Appends data to the internal buffer.
  void ingest(const std::byte *data, size_t size);

  /**
   * @brief Zero-pad the buffered data up to @p size bytes.
   *
   * Does nothing when the buffer already holds @p size bytes or more.
   * @throw std::logic_error If called after finalize_hashed().
   */
  void pad_to(size_t size);

  // Number of bytes ingested so far, padding included.
  size_t size() const { return buffer_.size(); }

  // Returns a copy of the concatenated data.
  std::vector<std::byte> finalize_raw();

  // Finalizes the hash and returns the digest, CID and raw data.
  DigestResult finalize_hashed();

private:
  std::vector<std::byte> buffer_;
  crypto_hash_sha256_state hash_state_; // Libsodium SHA-256 state
  bool finalized_ = false; // Tracks if finalize_hashed() has been called
};

#endif // BLOCKIO_HPP
