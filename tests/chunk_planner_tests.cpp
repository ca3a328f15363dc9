#include "utilities/chunk_planner.hpp"
#include <gtest/gtest.h>

TEST(ChunkPlanner, OneByteFileUsesMinimumChunk) {
  auto plan = tfs::planChunks(1);
  EXPECT_EQ(plan.chunkSize, 1024u);
  EXPECT_EQ(plan.pieces, 1u);
  EXPECT_TRUE(plan.hasBoundary);
}

TEST(ChunkPlanner, ExactMultipleHasNoBoundary) {
  auto plan = tfs::planChunks(12 * 1024);
  EXPECT_EQ(plan.chunkSize, 1024u);
  EXPECT_EQ(plan.pieces, 12u);
  EXPECT_FALSE(plan.hasBoundary);
}

TEST(ChunkPlanner, PartialLastChunkCountsAsPiece) {
  auto plan = tfs::planChunks(3000);
  EXPECT_EQ(plan.chunkSize, 1024u);
  EXPECT_EQ(plan.pieces, 3u);
  EXPECT_TRUE(plan.hasBoundary);
}

TEST(ChunkPlanner, LargeFilesAimForSixtyFourPieces) {
  auto plan = tfs::planChunks(1000000);
  EXPECT_EQ(plan.chunkSize, 15625u);
  EXPECT_EQ(plan.pieces, 64u);
  EXPECT_FALSE(plan.hasBoundary);

  auto big = tfs::planChunks(64u * 65536u);
  EXPECT_EQ(big.chunkSize, 65536u);
  EXPECT_EQ(big.pieces, 64u);
}

TEST(ChunkPlanner, RemainderPastSixtyFourChunksExceedsBudget) {
  // Integer division leaves a remainder that spills into a 65th piece.
  auto plan = tfs::planChunks(100000);
  EXPECT_EQ(plan.chunkSize, 1562u);
  EXPECT_EQ(plan.pieces, 65u);
  EXPECT_GT(plan.pieces, tfs::kMaxPieces);

  EXPECT_EQ(tfs::planChunks(65537).pieces, 65u);
}

TEST(ChunkPlanner, EmptyFileHasNoPieces) {
  auto plan = tfs::planChunks(0);
  EXPECT_EQ(plan.chunkSize, 1024u);
  EXPECT_EQ(plan.pieces, 0u);
  EXPECT_FALSE(plan.hasBoundary);
}

TEST(ChunkPlanner, PowerOfTwoHelpers) {
  EXPECT_EQ(tfs::nextPowerOfTwo(0), 1u);
  EXPECT_EQ(tfs::nextPowerOfTwo(1), 1u);
  EXPECT_EQ(tfs::nextPowerOfTwo(3), 4u);
  EXPECT_EQ(tfs::nextPowerOfTwo(12), 16u);
  EXPECT_EQ(tfs::nextPowerOfTwo(64), 64u);
  EXPECT_EQ(tfs::nextPowerOfTwo(65), 128u);

  EXPECT_EQ(tfs::treeDepth(1), 0u);
  EXPECT_EQ(tfs::treeDepth(16), 4u);
  EXPECT_EQ(tfs::treeDepth(64), 6u);
}
