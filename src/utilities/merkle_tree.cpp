#include "utilities/merkle_tree.hpp"
#include "utilities/chunk_planner.hpp"
#include "utilities/errors.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <sodium.h>
#include <string>
#include <utility>

namespace tfs {

using utils::DIGEST_SIZE;

namespace {

// Hash filler for the leaf slots past the last piece.
const Hash kChunkFiller{};

size_t nodeCountFor(size_t leaves) { return 2 * leaves - 1; }

void appendHash(std::vector<uint8_t> &buffer, const Hash &hash) {
  buffer.insert(buffer.end(), hash.begin(), hash.end());
}

} // namespace

FileMerkleTree::FileMerkleTree(uint32_t fileSize, std::vector<uint8_t> nodes,
                               std::optional<Hash> boundaryHash)
    : fileSize_(fileSize), nodes_(std::move(nodes)),
      boundaryHash_(boundaryHash) {
  ChunkPlan plan = planChunks(fileSize_);
  chunkSize_ = plan.chunkSize;
  pieces_ = plan.pieces;
  leafCount_ = nextPowerOfTwo(pieces_);
}

FileMerkleTree FileMerkleTree::build(const std::vector<std::byte> &fileBytes) {
  return build(fileBytes.data(), fileBytes.size());
}

FileMerkleTree FileMerkleTree::build(const std::byte *data, size_t size) {
  if (size == 0 || data == nullptr) {
    throw InvalidInputError("Cannot build a Merkle tree for an empty file.");
  }
  if (size > std::numeric_limits<uint32_t>::max()) {
    throw InvalidInputError("File of " + std::to_string(size) +
                            " bytes exceeds the 32-bit size field.");
  }
  const auto fileSize = static_cast<uint32_t>(size);
  const ChunkPlan plan = planChunks(fileSize);
  if (plan.pieces > kMaxPieces) {
    throw InvalidInputError("File of " + std::to_string(fileSize) +
                            " bytes needs " + std::to_string(plan.pieces) +
                            " pieces; the limit is " +
                            std::to_string(kMaxPieces) + ".");
  }

  const size_t leaves = nextPowerOfTwo(plan.pieces);
  std::vector<uint8_t> tree;
  tree.reserve(nodeCountFor(leaves) * DIGEST_SIZE);

  std::optional<Hash> boundary;
  for (uint32_t piece = 0; piece < plan.pieces; ++piece) {
    const size_t offset = static_cast<size_t>(piece) * plan.chunkSize;
    const size_t length = std::min<size_t>(plan.chunkSize, size - offset);
    if (length == plan.chunkSize) {
      appendHash(tree, utils::sha256(data + offset, length));
      continue;
    }
    // process last chunk
    boundary = utils::sha256(data + offset, length);
    std::vector<std::byte> padded(plan.chunkSize, std::byte{0});
    std::memcpy(padded.data(), data + offset, length);
    appendHash(tree, utils::sha256(padded.data(), padded.size()));
  }

  // make the tree a totally balanced binary tree
  for (size_t i = plan.pieces; i < leaves; ++i) {
    appendHash(tree, kChunkFiller);
  }

  size_t levelStart = 0;
  size_t width = leaves;
  while (width > 1) {
    for (size_t i = levelStart; i < levelStart + width; i += 2) {
      const uint8_t *left = tree.data() + i * DIGEST_SIZE;
      const uint8_t *right = left + DIGEST_SIZE;
      Hash parent = utils::sha256_pair(left, right);
      appendHash(tree, parent);
    }
    levelStart += width;
    width /= 2;
  }

  return FileMerkleTree(fileSize, std::move(tree), boundary);
}

FileMerkleTree FileMerkleTree::decode(const std::vector<uint8_t> &record) {
  if (record.size() < sizeof(uint32_t)) {
    throw DecodeError("Record of " + std::to_string(record.size()) +
                      " bytes is too short to hold the file size.");
  }
  const uint32_t fileSize = static_cast<uint32_t>(record[0]) |
                            (static_cast<uint32_t>(record[1]) << 8) |
                            (static_cast<uint32_t>(record[2]) << 16) |
                            (static_cast<uint32_t>(record[3]) << 24);
  if (fileSize == 0) {
    throw DecodeError("Record declares an empty file.");
  }
  const ChunkPlan plan = planChunks(fileSize);
  if (plan.pieces > kMaxPieces) {
    throw DecodeError("Record declares " + std::to_string(plan.pieces) +
                      " pieces; the limit is " + std::to_string(kMaxPieces) +
                      ".");
  }

  size_t offset = sizeof(uint32_t);
  std::optional<Hash> boundary;
  if (plan.hasBoundary) {
    if (record.size() - offset < DIGEST_SIZE) {
      throw DecodeError("Record is truncated before the boundary hash.");
    }
    Hash h;
    std::copy_n(record.begin() + offset, DIGEST_SIZE, h.begin());
    boundary = h;
    offset += DIGEST_SIZE;
  }

  const size_t expected =
      nodeCountFor(nextPowerOfTwo(plan.pieces)) * DIGEST_SIZE;
  const size_t remaining = record.size() - offset;
  if (remaining != expected) {
    throw DecodeError("Record holds " + std::to_string(remaining) +
                      " tree bytes; file size " + std::to_string(fileSize) +
                      " implies " + std::to_string(expected) + ".");
  }

  std::vector<uint8_t> nodes(record.begin() + offset, record.end());
  return FileMerkleTree(fileSize, std::move(nodes), boundary);
}

std::vector<uint8_t> FileMerkleTree::encode() const {
  std::vector<uint8_t> out;
  out.reserve(sizeof(uint32_t) + (boundaryHash_ ? DIGEST_SIZE : 0) +
              nodes_.size());
  out.push_back(static_cast<uint8_t>(fileSize_ & 0xff));
  out.push_back(static_cast<uint8_t>((fileSize_ >> 8) & 0xff));
  out.push_back(static_cast<uint8_t>((fileSize_ >> 16) & 0xff));
  out.push_back(static_cast<uint8_t>((fileSize_ >> 24) & 0xff));
  if (boundaryHash_) {
    appendHash(out, *boundaryHash_);
  }
  out.insert(out.end(), nodes_.begin(), nodes_.end());
  return out;
}

Hash FileMerkleTree::nodeAt(size_t index) const {
  Hash h;
  std::copy_n(nodes_.begin() + index * DIGEST_SIZE, DIGEST_SIZE, h.begin());
  return h;
}

Hash FileMerkleTree::merkleRoot() const {
  return nodeAt(nodes_.size() / DIGEST_SIZE - 1);
}

std::optional<Hash> FileMerkleTree::chunkHashAt(uint32_t position) const {
  if (position >= pieces_) {
    return std::nullopt;
  }
  if (boundaryHash_ && position == pieces_ - 1) {
    return boundaryHash_;
  }
  return nodeAt(position);
}

std::optional<Hash> FileMerkleTree::leafHashAt(uint32_t position) const {
  if (position >= pieces_) {
    return std::nullopt;
  }
  return nodeAt(position);
}

std::optional<MerkleProof> FileMerkleTree::proofFor(uint32_t position) const {
  if (position >= pieces_) {
    return std::nullopt;
  }
  MerkleProof proof;
  proof.reserve(treeDepth(leafCount_));
  size_t index = position;
  size_t levelStart = 0;
  size_t width = leafCount_;
  // The root level (width 1) is never part of the proof.
  while (width > 1) {
    const size_t sibling = (index % 2 == 0) ? index + 1 : index - 1;
    proof.push_back(nodeAt(levelStart + sibling));
    levelStart += width;
    index /= 2;
    width /= 2;
  }
  return proof;
}

bool FileMerkleTree::verify(const Hash &leafHash, uint32_t position,
                            const MerkleProof &proof,
                            const Hash &expectedRoot) {
  Hash current = leafHash;
  uint64_t index = position;
  for (const Hash &sibling : proof) {
    if (index % 2 == 0) {
      current = utils::sha256_pair(current.data(), sibling.data());
    } else {
      current = utils::sha256_pair(sibling.data(), current.data());
    }
    index /= 2;
  }
  const bool rootMatches =
      sodium_memcmp(current.data(), expectedRoot.data(), DIGEST_SIZE) == 0;
  // A position beyond the width the proof spans cannot belong to this tree.
  return rootMatches && index == 0;
}

bool FileMerkleTree::operator==(const FileMerkleTree &other) const {
  return fileSize_ == other.fileSize_ && nodes_ == other.nodes_ &&
         boundaryHash_ == other.boundaryHash_;
}

} // namespace tfs
