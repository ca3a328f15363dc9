#include "utilities/digest.hpp"

#include <sodium.h>
#include <stdexcept>

namespace tfs::utils {

DigestArray sha256(const void *data, size_t size) {
  DigestArray out;
  crypto_hash_sha256(out.data(), static_cast<const unsigned char *>(data),
                     size);
  return out;
}

DigestArray sha256_pair(const uint8_t *left, const uint8_t *right) {
  DigestArray out;
  crypto_hash_sha256_state state;
  crypto_hash_sha256_init(&state);
  crypto_hash_sha256_update(&state, left, DIGEST_SIZE);
  crypto_hash_sha256_update(&state, right, DIGEST_SIZE);
  crypto_hash_sha256_final(&state, out.data());
  return out;
}

std::string to_hex(const uint8_t *data, size_t size) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0f]);
  }
  return out;
}

std::string to_hex(const DigestArray &digest) {
  return to_hex(digest.data(), digest.size());
}

std::string to_hex(const std::vector<uint8_t> &bytes) {
  return to_hex(bytes.data(), bytes.size());
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::vector<uint8_t> from_hex(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("Hex string has odd length: " +
                                std::to_string(hex.size()));
  }
  std::vector<uint8_t> out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("Invalid hex character at offset " +
                                  std::to_string(i));
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

} // namespace tfs::utils
