#include "utilities/cid_utils.hpp"
#include "cppcodec/base32_rfc4648.hpp" // For Base32 encoding/decoding
#include "utilities/digest.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept> // For std::runtime_error
#include <vector>

namespace tfs::utils {

// CIDv1 (0x01)
// multicodec for raw binary (0x55)
// multicodec for SHA2-256 (0x12)
// length of hash (0x20)
const std::vector<uint8_t> CID_PREFIX_SHA256_RAW = {0x01, 0x55, 0x12, 0x20};

std::string digest_to_cid(const DigestArray &digest) {
  std::vector<uint8_t> bytes_to_encode;
  bytes_to_encode.reserve(CID_PREFIX_SHA256_RAW.size() + digest.size());
  bytes_to_encode.insert(bytes_to_encode.end(), CID_PREFIX_SHA256_RAW.begin(),
                         CID_PREFIX_SHA256_RAW.end());
  bytes_to_encode.insert(bytes_to_encode.end(), digest.begin(), digest.end());

  // cppcodec emits the uppercase, padded RFC 4648 alphabet; multibase 'b'
  // wants lowercase without '='.
  std::string encoded = cppcodec::base32_rfc4648::encode(bytes_to_encode);
  encoded.erase(std::remove(encoded.begin(), encoded.end(), '='),
                encoded.end());
  std::transform(encoded.begin(), encoded.end(), encoded.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  std::string cid;
  cid.reserve(encoded.size() + 1);
  cid.push_back(MULTIBASE_BASE32);
  cid += encoded;
  return cid;
}

DigestArray cid_to_digest(const std::string &cid) {
  if (cid.empty()) {
    throw std::runtime_error("CID string cannot be empty.");
  }
  if (cid[0] != MULTIBASE_BASE32) {
    throw std::runtime_error("Invalid CID: unsupported multibase prefix '" +
                             std::string(1, cid[0]) + "'.");
  }

  // Multibase 'b' is lowercase only; uppercase is a different encoding.
  std::string body = cid.substr(1);
  if (std::any_of(body.begin(), body.end(),
                  [](unsigned char c) { return std::isupper(c); })) {
    throw std::runtime_error(
        "Invalid CID: uppercase characters under multibase 'b'.");
  }
  // Undo the multibase normalisation before handing the text to cppcodec.
  std::transform(body.begin(), body.end(), body.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  while (body.size() % 8 != 0) {
    body.push_back('=');
  }

  std::vector<uint8_t> decoded_bytes;
  try {
    decoded_bytes = cppcodec::base32_rfc4648::decode(body.data(), body.size());
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to decode Base32 CID: " +
                             std::string(e.what()));
  }

  if (decoded_bytes.size() < CID_PREFIX_SHA256_RAW.size()) {
    throw std::runtime_error(
        "Invalid CID: Decoded data too short to contain prefix.");
  }

  if (!std::equal(CID_PREFIX_SHA256_RAW.begin(), CID_PREFIX_SHA256_RAW.end(),
                  decoded_bytes.begin())) {
    throw std::runtime_error("Invalid CID: Prefix mismatch.");
  }

  if (decoded_bytes.size() != CID_PREFIX_SHA256_RAW.size() + DIGEST_SIZE) {
    throw std::runtime_error("Invalid CID: Decoded data length does not match "
                             "expected digest size.");
  }

  DigestArray digest;
  std::copy(decoded_bytes.begin() + CID_PREFIX_SHA256_RAW.size(),
            decoded_bytes.end(), digest.begin());
  return digest;
}

std::vector<uint8_t> cid_to_bytes(const std::string &cid) {
  auto digest = cid_to_digest(cid);
  std::vector<uint8_t> bytes;
  bytes.insert(bytes.end(), CID_PREFIX_SHA256_RAW.begin(),
               CID_PREFIX_SHA256_RAW.end());
  bytes.insert(bytes.end(), digest.begin(), digest.end());
  return bytes;
}

} // namespace tfs::utils
