#include "utilities/query_api.hpp"
#include "utilities/digest.hpp"

#include <algorithm>
#include <stdexcept>

namespace tfs {

nlohmann::json QueryApi::error(const std::string &detail) {
  return nlohmann::json{{"code", kQueryRuntimeError},
                        {"message", "Runtime error"},
                        {"data", detail}};
}

bool QueryApi::isError(const nlohmann::json &response) {
  return response.is_object() && response.contains("code") &&
         response.contains("message");
}

nlohmann::json QueryApi::listFiles() const {
  nlohmann::json items = nlohmann::json::array();
  for (const auto &file : registry_.listFiles()) {
    items.push_back(
        {{"hash", utils::to_hex(file.merkleRoot)}, {"pieces", file.pieces}});
  }
  return items;
}

nlohmann::json QueryApi::getProof(const std::string &merkleRootHex,
                                  uint32_t position) const {
  Bytes root;
  try {
    root = utils::from_hex(merkleRootHex);
  } catch (const std::invalid_argument &e) {
    return error(e.what());
  }
  auto result = registry_.getProof(root, position);
  if (!result) {
    return error("Failure getting the merkle proof");
  }
  nlohmann::json proof = nlohmann::json::array();
  for (const auto &hash : result->proof) {
    proof.push_back(utils::to_hex(hash));
  }
  return nlohmann::json{{"content", result->contentAddress},
                        {"proof", proof}};
}

ChunkProof QueryApi::parseProof(const nlohmann::json &response) {
  if (!response.is_object() || !response.contains("content") ||
      !response.contains("proof") || !response["content"].is_string() ||
      !response["proof"].is_array()) {
    throw std::invalid_argument("Response is not a get_proof result.");
  }
  ChunkProof out;
  out.contentAddress = response["content"].get<std::string>();
  for (const auto &item : response["proof"]) {
    if (!item.is_string()) {
      throw std::invalid_argument("Proof entries must be hex strings.");
    }
    Bytes bytes = utils::from_hex(item.get<std::string>());
    if (bytes.size() != utils::DIGEST_SIZE) {
      throw std::invalid_argument("Proof entry is not a 32-byte hash.");
    }
    Hash hash;
    std::copy(bytes.begin(), bytes.end(), hash.begin());
    out.proof.push_back(hash);
  }
  return out;
}

} // namespace tfs
