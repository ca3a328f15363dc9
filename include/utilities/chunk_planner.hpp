#ifndef CHUNK_PLANNER_HPP
#define CHUNK_PLANNER_HPP

#include <cstddef>
#include <cstdint>

namespace tfs {

/// Smallest chunk the planner will produce.
inline constexpr uint32_t kMinChunkSize = 1024;
/// The planner aims for roughly this many pieces per file.
inline constexpr uint32_t kTargetPieces = 64;
/// Largest number of pieces a tree may hold.
inline constexpr uint32_t kMaxPieces = 64;

struct ChunkPlan {
  uint32_t chunkSize{0};
  uint32_t pieces{0};
  bool hasBoundary{false};
};

/**
 * @brief Derive chunk size, piece count and boundary presence from a file
 * size.
 *
 * chunkSize = max(fileSize / 64, 1024), pieces = ceil(fileSize / chunkSize).
 * A zero fileSize yields zero pieces; callers reject it, and likewise reject
 * plans with more than kMaxPieces pieces.
 */
ChunkPlan planChunks(uint32_t fileSize);

/// Smallest power of two >= n. Returns 1 for n == 0.
size_t nextPowerOfTwo(size_t n);

/// log2 of a power of two.
size_t treeDepth(size_t leaves);

} // namespace tfs

#endif // CHUNK_PLANNER_HPP
