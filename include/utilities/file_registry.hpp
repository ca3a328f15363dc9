#ifndef FILE_REGISTRY_HPP
#define FILE_REGISTRY_HPP

#include "utilities/chunk_store.hpp"
#include "utilities/key_value_store.hpp"
#include "utilities/merkle_tree.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tfs {

/// Returned by FileRegistry::uploadFile in place of an upload notification.
struct UploadReceipt {
  std::string owner;
  Hash merkleRoot;
  uint32_t pieces{0};
  uint32_t size{0};
};

struct FileSummary {
  Hash merkleRoot;
  uint32_t pieces{0};
};

struct ChunkProof {
  std::string contentAddress;
  MerkleProof proof;
};

struct StoredFile {
  std::string owner;
  FileMerkleTree tree;
};

/**
 * @brief Ledger of uploaded files keyed by Merkle root.
 *
 * Each entry is owner length (u32 LE), owner bytes, then the tree record
 * from FileMerkleTree::encode(). When a ChunkStore is attached, uploads also
 * publish the file's chunks to it.
 */
class FileRegistry {
public:
  explicit FileRegistry(KeyValueStore &ledger, ChunkStore *chunks = nullptr);

  /**
   * @brief Build the tree for @p fileBytes and record it under its root.
   * @throw std::invalid_argument If @p owner is empty.
   * @throw tfs::InvalidInputError If the file cannot be chunked.
   */
  UploadReceipt uploadFile(const std::string &owner,
                           const std::vector<std::byte> &fileBytes);

  /**
   * @throw tfs::DecodeError If the stored entry for @p merkleRoot is corrupt.
   */
  std::optional<StoredFile> getFile(const Bytes &merkleRoot) const;

  std::vector<FileSummary> listFiles() const;

  /**
   * @brief Content address of the chunk at @p position and its proof.
   *
   * The address names the chunk as published, which for the boundary chunk
   * is the zero-padded block, so hashing the fetched bytes and folding the
   * proof reproduces the root. Returns std::nullopt for an unknown root, a
   * corrupt ledger entry (logged at ERROR) or a position out of range.
   */
  std::optional<ChunkProof> getProof(const Bytes &merkleRoot,
                                     uint32_t position) const;

  static Bytes encodeEntry(const std::string &owner,
                           const FileMerkleTree &tree);
  /// @throw tfs::DecodeError On a malformed entry.
  static StoredFile decodeEntry(const Bytes &entry);

private:
  KeyValueStore &ledger_;
  ChunkStore *chunks_;
};

} // namespace tfs

#endif // FILE_REGISTRY_HPP
