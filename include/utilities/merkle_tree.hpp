#ifndef MERKLE_TREE_HPP
#define MERKLE_TREE_HPP

#include "utilities/digest.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace tfs {

using Hash = utils::DigestArray;
/// Sibling hashes ordered from the leaf level up to just below the root.
using MerkleProof = std::vector<Hash>;

/**
 * @brief Balanced binary SHA-256 Merkle tree over the chunks of one file.
 *
 * Nodes are kept in a flat buffer in level order: the leaves (padded with
 * all-zero hashes up to a power of two) come first, then every parent level,
 * and the root is the final 32 bytes. Instances are immutable once built.
 */
class FileMerkleTree {
public:
  /**
   * @brief Chunk @p fileBytes and build the tree over the chunk hashes.
   *
   * A short final chunk is zero-padded to the chunk size before it is hashed
   * into the tree; the hash of its unpadded bytes is kept separately as the
   * boundary hash.
   *
   * @throw tfs::InvalidInputError If the file is empty, needs more than
   *        kMaxPieces pieces, or its size does not fit in 32 bits.
   */
  static FileMerkleTree build(const std::byte *data, size_t size);
  static FileMerkleTree build(const std::vector<std::byte> &fileBytes);

  /**
   * @brief Parse a persisted record produced by encode().
   * @throw tfs::DecodeError If the record is truncated or its length does not
   *        match what the declared file size implies.
   */
  static FileMerkleTree decode(const std::vector<uint8_t> &record);

  /// file_size (u32 LE) | boundary hash when present | node buffer.
  std::vector<uint8_t> encode() const;

  uint32_t fileSize() const { return fileSize_; }
  uint32_t chunkSize() const { return chunkSize_; }
  uint32_t pieces() const { return pieces_; }
  bool hasBoundary() const { return boundaryHash_.has_value(); }
  const std::optional<Hash> &boundaryHash() const { return boundaryHash_; }
  /// Leaf slots in the tree, i.e. pieces rounded up to a power of two.
  size_t leafCount() const { return leafCount_; }
  const std::vector<uint8_t> &nodes() const { return nodes_; }

  Hash merkleRoot() const;

  /**
   * @brief Content hash of the chunk at @p position.
   *
   * For the boundary chunk this is the hash of its unpadded bytes, which is
   * NOT the leaf stored in the tree. Use leafHashAt() to verify proofs.
   * @return std::nullopt if @p position >= pieces().
   */
  std::optional<Hash> chunkHashAt(uint32_t position) const;

  /// Leaf value stored in the tree at @p position, or std::nullopt if out of
  /// range.
  std::optional<Hash> leafHashAt(uint32_t position) const;

  /// Sibling path for @p position; std::nullopt if @p position >= pieces().
  std::optional<MerkleProof> proofFor(uint32_t position) const;

  /**
   * @brief Recompute the root from a leaf hash and its sibling path.
   *
   * Every proof entry is consumed and the final comparison is constant time,
   * so the running time depends only on the proof length.
   */
  static bool verify(const Hash &leafHash, uint32_t position,
                     const MerkleProof &proof, const Hash &expectedRoot);

  bool operator==(const FileMerkleTree &other) const;
  bool operator!=(const FileMerkleTree &other) const {
    return !(*this == other);
  }

private:
  FileMerkleTree(uint32_t fileSize, std::vector<uint8_t> nodes,
                 std::optional<Hash> boundaryHash);

  Hash nodeAt(size_t index) const;

  uint32_t fileSize_{0};
  uint32_t chunkSize_{0};
  uint32_t pieces_{0};
  size_t leafCount_{0};
  std::vector<uint8_t> nodes_;
  std::optional<Hash> boundaryHash_;
};

} // namespace tfs

#endif // MERKLE_TREE_HPP
