#include "utilities/file_registry.hpp"
#include "utilities/cid_utils.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <stdexcept>

namespace tfs {

FileRegistry::FileRegistry(KeyValueStore &ledger, ChunkStore *chunks)
    : ledger_(ledger), chunks_(chunks) {}

Bytes FileRegistry::encodeEntry(const std::string &owner,
                                const FileMerkleTree &tree) {
  const auto ownerLen = static_cast<uint32_t>(owner.size());
  Bytes out;
  out.push_back(static_cast<uint8_t>(ownerLen & 0xff));
  out.push_back(static_cast<uint8_t>((ownerLen >> 8) & 0xff));
  out.push_back(static_cast<uint8_t>((ownerLen >> 16) & 0xff));
  out.push_back(static_cast<uint8_t>((ownerLen >> 24) & 0xff));
  out.insert(out.end(), owner.begin(), owner.end());
  Bytes record = tree.encode();
  out.insert(out.end(), record.begin(), record.end());
  return out;
}

StoredFile FileRegistry::decodeEntry(const Bytes &entry) {
  if (entry.size() < sizeof(uint32_t)) {
    throw DecodeError("Ledger entry too short to hold the owner length.");
  }
  const uint32_t ownerLen = static_cast<uint32_t>(entry[0]) |
                            (static_cast<uint32_t>(entry[1]) << 8) |
                            (static_cast<uint32_t>(entry[2]) << 16) |
                            (static_cast<uint32_t>(entry[3]) << 24);
  if (entry.size() - sizeof(uint32_t) < ownerLen) {
    throw DecodeError("Ledger entry truncated inside the owner field.");
  }
  auto ownerBegin = entry.begin() + sizeof(uint32_t);
  std::string owner(ownerBegin, ownerBegin + ownerLen);
  Bytes record(ownerBegin + ownerLen, entry.end());
  return StoredFile{std::move(owner), FileMerkleTree::decode(record)};
}

UploadReceipt FileRegistry::uploadFile(const std::string &owner,
                                       const std::vector<std::byte> &fileBytes) {
  if (owner.empty()) {
    throw std::invalid_argument("Upload requires a non-empty owner.");
  }

  FileMerkleTree tree = FileMerkleTree::build(fileBytes);
  const Hash root = tree.merkleRoot();
  const Bytes key(root.begin(), root.end());
  const std::string rootHex = utils::to_hex(root);

  if (ledger_.contains(key)) {
    Logger::getInstance().log(LogLevel::WARN, "File " + rootHex +
                                                  " already recorded; "
                                                  "replacing owner entry");
  }
  ledger_.insert(key, encodeEntry(owner, tree));

  if (chunks_) {
    for (auto &chunk : distributeChunks(fileBytes)) {
      chunks_->putChunk(chunk.cid, chunk.data);
    }
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Published " + std::to_string(tree.pieces()) +
                                  " chunks for " + rootHex);
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "File uploaded by " + owner + ": root " + rootHex +
                                ", " + std::to_string(tree.pieces()) +
                                " pieces, " + std::to_string(tree.fileSize()) +
                                " bytes");

  return UploadReceipt{owner, root, tree.pieces(), tree.fileSize()};
}

std::optional<StoredFile> FileRegistry::getFile(const Bytes &merkleRoot) const {
  if (merkleRoot.size() != utils::DIGEST_SIZE) {
    return std::nullopt;
  }
  auto entry = ledger_.get(merkleRoot);
  if (!entry) {
    return std::nullopt;
  }
  return decodeEntry(*entry);
}

std::vector<FileSummary> FileRegistry::listFiles() const {
  std::vector<FileSummary> files;
  for (const Bytes &key : ledger_.keys()) {
    auto entry = ledger_.get(key);
    if (!entry)
      continue;
    try {
      StoredFile stored = decodeEntry(*entry);
      files.push_back({stored.tree.merkleRoot(), stored.tree.pieces()});
    } catch (const DecodeError &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "Skipping corrupt ledger entry " +
                                    utils::to_hex(key) + ": " + e.what());
    }
  }
  return files;
}

std::optional<ChunkProof> FileRegistry::getProof(const Bytes &merkleRoot,
                                                 uint32_t position) const {
  std::optional<StoredFile> stored;
  try {
    stored = getFile(merkleRoot);
  } catch (const DecodeError &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Corrupt ledger entry " +
                                  utils::to_hex(merkleRoot) + ": " + e.what());
    return std::nullopt;
  }
  if (!stored) {
    return std::nullopt;
  }
  auto proof = stored->tree.proofFor(position);
  auto leaf = stored->tree.leafHashAt(position);
  if (!proof || !leaf) {
    return std::nullopt;
  }
  return ChunkProof{utils::digest_to_cid(*leaf), std::move(*proof)};
}

} // namespace tfs
