#include "utilities/blockio.hpp"
#include "utilities/cid_utils.hpp"

#include <stdexcept> // For std::runtime_error

BlockIO::BlockIO() {
  if (sodium_init() < 0) {
    // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
    throw std::runtime_error("Failed to initialize libsodium");
  }
  crypto_hash_sha256_init(&hash_state_);
}

// Destructor
BlockIO::~BlockIO() {
  // No explicit cleanup needed for hash_state_
}

void BlockIO::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize_hashed() has been called.");
  }
  if (data && size > 0) { // Check for null data pointer and non-zero size
    buffer_.insert(buffer_.end(), data, data + size);
    crypto_hash_sha256_update(
        &hash_state_, reinterpret_cast<const unsigned char *>(data), size);
  }
}

void BlockIO::pad_to(size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot pad data after finalize_hashed() has been called.");
  }
  if (buffer_.size() >= size) {
    return;
  }
  const std::vector<std::byte> zeros(size - buffer_.size(), std::byte{0});
  ingest(zeros.data(), zeros.size());
}

std::vector<std::byte> BlockIO::finalize_raw() {
  // Return a copy of the buffer; the hash state is unaffected.
  return buffer_;
}

DigestResult BlockIO::finalize_hashed() {
  if (finalized_) {
    throw std::logic_error("finalize_hashed() already called.");
  }

  DigestResult result;
  crypto_hash_sha256_final(&hash_state_, result.digest.data());
  result.raw = buffer_; // Copy the raw data

  // Convert digest to CID
  result.cid = tfs::utils::digest_to_cid(result.digest);

  finalized_ = true; // Mark as finalized

  return result;
}
