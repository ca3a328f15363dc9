#ifndef TFS_DIGEST_HPP
#define TFS_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tfs::utils {

/// Digest size of SHA-256 (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/// One-shot SHA-256 over a byte range.
DigestArray sha256(const void *data, size_t size);

/// SHA-256 of left || right, used to combine two tree nodes.
DigestArray sha256_pair(const uint8_t *left, const uint8_t *right);

/// Lowercase hex encoding of arbitrary bytes.
std::string to_hex(const uint8_t *data, size_t size);
std::string to_hex(const DigestArray &digest);
std::string to_hex(const std::vector<uint8_t> &bytes);

/**
 * @brief Decode a hex string (either case) to bytes.
 * @throws std::invalid_argument on odd length or a non-hex character.
 */
std::vector<uint8_t> from_hex(const std::string &hex);

} // namespace tfs::utils

#endif // TFS_DIGEST_HPP
