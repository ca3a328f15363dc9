#include "utilities/chunk_planner.hpp"

#include <algorithm>

namespace tfs {

ChunkPlan planChunks(uint32_t fileSize) {
  ChunkPlan plan;
  plan.chunkSize = std::max(fileSize / kTargetPieces, kMinChunkSize);
  plan.pieces = fileSize / plan.chunkSize;
  plan.hasBoundary = (fileSize % plan.chunkSize) != 0;
  if (plan.hasBoundary) {
    ++plan.pieces;
  }
  return plan;
}

size_t nextPowerOfTwo(size_t n) {
  size_t p = 1;
  while (p < n)
    p <<= 1;
  return p;
}

size_t treeDepth(size_t leaves) {
  size_t depth = 0;
  while (leaves > 1) {
    ++depth;
    leaves >>= 1;
  }
  return depth;
}

} // namespace tfs
