#include "gtest/gtest.h"
#include "utilities/blockio.hpp"
#include "utilities/digest.hpp"
#include <algorithm> // For std::equal
#include <array>     // For std::array
#include <cstddef>   // For std::byte
#include <stdexcept> // For std::logic_error
#include <string>
#include <vector>

// Helper function to create a vector of bytes from a string literal
static std::vector<std::byte> string_to_byte_vector(const std::string &str) {
  std::vector<std::byte> vec(str.length());
  std::transform(str.begin(), str.end(), vec.begin(),
                 [](char c) { return std::byte(c); });
  return vec;
}

// Helper function to create a vector of bytes with sequential values
static std::vector<std::byte> create_byte_vector(size_t size) {
  std::vector<std::byte> vec(size);
  for (size_t i = 0; i < size; ++i) {
    vec[i] = std::byte(i % 256);
  }
  return vec;
}

TEST(BlockIOTest, IngestEmpty) {
  BlockIO bio;
  std::vector<std::byte> empty_data;
  bio.ingest(empty_data.data(), empty_data.size());
  std::vector<std::byte> result = bio.finalize_raw();
  EXPECT_TRUE(result.empty());
}

TEST(BlockIOTest, Ingest64KiB) {
  BlockIO bio;
  const size_t data_size = 64 * 1024; // 64 KiB
  std::vector<std::byte> data = create_byte_vector(data_size);
  bio.ingest(data.data(), data.size());
  std::vector<std::byte> result = bio.finalize_raw();
  ASSERT_EQ(result.size(), data_size);
  EXPECT_TRUE(std::equal(result.begin(), result.end(), data.begin()));
}

TEST(BlockIOTest, HashKnownString) {
  BlockIO bio;
  auto data = string_to_byte_vector("hello world");
  bio.ingest(data.data(), data.size());
  DigestResult dr = bio.finalize_hashed();
  EXPECT_EQ(tfs::utils::to_hex(dr.digest),
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
  EXPECT_EQ(dr.cid,
            "bafkreifzjut3te2nhyekklss27nh3k72ysco7y32koao5eei66wof36n5e");
  EXPECT_EQ(dr.raw, data);
}

TEST(BlockIOTest, PadToZeroFillsAndHashesPaddedBytes) {
  BlockIO bio;
  std::vector<std::byte> one{std::byte{'a'}};
  bio.ingest(one.data(), one.size());
  bio.pad_to(1024);
  EXPECT_EQ(bio.size(), 1024u);
  DigestResult dr = bio.finalize_hashed();

  ASSERT_EQ(dr.raw.size(), 1024u);
  EXPECT_EQ(dr.raw[0], std::byte{'a'});
  EXPECT_TRUE(std::all_of(dr.raw.begin() + 1, dr.raw.end(),
                          [](std::byte b) { return b == std::byte{0}; }));
  EXPECT_EQ(tfs::utils::to_hex(dr.digest),
            "502a8e52c7006559b0cfa3c7b1a4dcd8f8552dba983cfeafce6ab386697b3292");
}

TEST(BlockIOTest, PadToShorterSizeIsNoOp) {
  BlockIO bio;
  auto data = create_byte_vector(10);
  bio.ingest(data.data(), data.size());
  bio.pad_to(4);
  EXPECT_EQ(bio.finalize_raw(), data);
}

TEST(BlockIOTest, IngestAfterFinalizeThrows) {
  BlockIO bio;
  auto data = create_byte_vector(8);
  bio.ingest(data.data(), data.size());
  bio.finalize_hashed();
  EXPECT_THROW(bio.ingest(data.data(), data.size()), std::logic_error);
  EXPECT_THROW(bio.pad_to(64), std::logic_error);
  EXPECT_THROW(bio.finalize_hashed(), std::logic_error);
}
