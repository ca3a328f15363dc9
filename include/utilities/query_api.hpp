#ifndef QUERY_API_HPP
#define QUERY_API_HPP

#include "utilities/file_registry.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace tfs {

/// Error code carried by every query error object.
inline constexpr int kQueryRuntimeError = 1;

/**
 * @brief Text boundary of the registry: roots and proofs travel as hex.
 *
 * Responses mirror the procedure-call layer of the file server:
 *   list_files -> [{"hash": "<hex>", "pieces": n}, ...]
 *   get_proof  -> {"content": "<cid>", "proof": ["<hex>", ...]}
 * Failures come back as {"code": 1, "message": "Runtime error", "data": ...}.
 */
class QueryApi {
public:
  explicit QueryApi(const FileRegistry &registry) : registry_(registry) {}

  nlohmann::json listFiles() const;
  nlohmann::json getProof(const std::string &merkleRootHex,
                          uint32_t position) const;

  static bool isError(const nlohmann::json &response);

  /**
   * @brief Parse a get_proof response back into raw hashes.
   * @throws std::invalid_argument If the JSON does not have the get_proof
   *         shape or a hash is not 32 bytes of hex.
   */
  static ChunkProof parseProof(const nlohmann::json &response);

private:
  static nlohmann::json error(const std::string &detail);

  const FileRegistry &registry_;
};

} // namespace tfs

#endif // QUERY_API_HPP
