#ifndef CHUNK_STORE_HPP
#define CHUNK_STORE_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/// One chunk as handed to the object store.
struct DistributedChunk {
  std::string cid;
  std::vector<std::byte> data;
};

/**
 * @brief Split a file into the chunks published to the object store.
 *
 * Chunk boundaries follow tfs::planChunks(). The final partial chunk is
 * zero-padded to the chunk size so that every published chunk hashes to the
 * leaf the Merkle tree holds for it.
 *
 * @throw tfs::InvalidInputError For input FileMerkleTree::build() rejects.
 */
std::vector<DistributedChunk>
distributeChunks(const std::vector<std::byte> &fileBytes);

class ChunkStore {
public:
  /**
   * @brief Add a chunk to the store.
   * @param data Raw bytes that make up the chunk.
   * @return A content identifier (CID) derived from the chunk contents.
   */
  std::string addChunk(const std::vector<std::byte> &data);

  // Insert a chunk with a precomputed CID.
  void putChunk(const std::string &cid, const std::vector<std::byte> &data);

  /**
   * @brief Check if a chunk exists.
   * @param cid Content identifier returned by @ref addChunk.
   */
  bool hasChunk(const std::string &cid) const;

  /**
   * @brief Retrieve a chunk by CID.
   * @param cid Identifier of the desired chunk.
   * @return The chunk data, or an empty vector if not found.
   */
  std::vector<std::byte> getChunk(const std::string &cid) const;

  size_t size() const;

  /**
   * @brief Load every regular file in @p dir as a chunk named by its
   * filename.
   * @return Number of chunks loaded.
   */
  size_t loadDirectory(const std::string &dir);

  /**
   * @brief Write every chunk to @p dir, one file per CID.
   * @throw std::runtime_error If a chunk file cannot be written.
   */
  void saveDirectory(const std::string &dir) const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<std::byte>> chunks_;
};

#endif // CHUNK_STORE_HPP
