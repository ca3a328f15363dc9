#ifndef CID_UTILS_HPP
#define CID_UTILS_HPP

#include <cstdint>   // For uint8_t
#include <stdexcept> // For std::runtime_error
#include <string>
#include <vector>

#include "digest.hpp"

namespace tfs::utils {

/// CIDv1, raw codec, sha2-256, 32-byte digest.
extern const std::vector<uint8_t> CID_PREFIX_SHA256_RAW;

/// Multibase tag for lowercase, unpadded RFC 4648 base32.
inline constexpr char MULTIBASE_BASE32 = 'b';

/**
 * @brief Converts a SHA-256 digest to a CIDv1 string.
 *
 * The binary CID (prefix followed by the digest) is base32 encoded in
 * lowercase without padding and tagged with the 'b' multibase prefix, so the
 * result can be used as a key in an IPFS-compatible block store.
 *
 * @param digest The hash digest.
 * @return The CIDv1 string.
 */
std::string digest_to_cid(const DigestArray &digest);

/**
 * @brief Converts a CIDv1 string to its digest.
 * @param cid The CIDv1 string.
 * @return The extracted digest.
 * @throws std::runtime_error if the CID is invalid.
 */
DigestArray cid_to_digest(const std::string &cid);

/**
 * @brief Convert a CIDv1 string to its raw byte representation.
 */
std::vector<uint8_t> cid_to_bytes(const std::string &cid);

} // namespace tfs::utils

#endif // CID_UTILS_HPP
