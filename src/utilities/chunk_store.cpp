#include "utilities/chunk_store.hpp"
#include "utilities/blockio.hpp"
#include "utilities/chunk_planner.hpp"
#include "utilities/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>

std::vector<DistributedChunk>
distributeChunks(const std::vector<std::byte> &fileBytes) {
  if (fileBytes.empty()) {
    throw tfs::InvalidInputError("Cannot distribute an empty file.");
  }
  if (fileBytes.size() > std::numeric_limits<uint32_t>::max()) {
    throw tfs::InvalidInputError("File exceeds the 32-bit size field.");
  }
  const tfs::ChunkPlan plan =
      tfs::planChunks(static_cast<uint32_t>(fileBytes.size()));
  if (plan.pieces > tfs::kMaxPieces) {
    throw tfs::InvalidInputError("File needs " + std::to_string(plan.pieces) +
                                 " pieces; the limit is " +
                                 std::to_string(tfs::kMaxPieces) + ".");
  }

  std::vector<DistributedChunk> chunks;
  chunks.reserve(plan.pieces);
  for (size_t pos = 0; pos < fileBytes.size(); pos += plan.chunkSize) {
    const size_t limit = std::min(pos + plan.chunkSize, fileBytes.size());
    BlockIO bio;
    bio.ingest(fileBytes.data() + pos, limit - pos);
    bio.pad_to(plan.chunkSize);
    DigestResult dr = bio.finalize_hashed();
    chunks.push_back({dr.cid, std::move(dr.raw)});
  }
  return chunks;
}

std::string ChunkStore::addChunk(const std::vector<std::byte> &data) {
  BlockIO bio;

  // Feed the data into the digest calculator. Empty chunks are
  // still hashed to produce a unique CID.
  if (!data.empty()) {
    bio.ingest(data.data(), data.size());
  }

  // Finalize and obtain both the CID and raw bytes.
  DigestResult dr = bio.finalize_hashed();

  // Store the chunk thread-safely.
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_[dr.cid] = dr.raw;
  return dr.cid;
}

void ChunkStore::putChunk(const std::string &cid,
                          const std::vector<std::byte> &data) {
  std::lock_guard<std::mutex> lock(mutex_);
  chunks_[cid] = data;
}

bool ChunkStore::hasChunk(const std::string &cid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.count(cid) > 0;
}

std::vector<std::byte> ChunkStore::getChunk(const std::string &cid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(cid);
  if (it != chunks_.end()) {
    return it->second;
  }
  return {};
}

size_t ChunkStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

size_t ChunkStore::loadDirectory(const std::string &dir) {
  namespace fs = std::filesystem;
  if (!fs::is_directory(dir)) {
    return 0;
  }
  size_t loaded = 0;
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file())
      continue;
    std::ifstream in(entry.path(), std::ios::binary);
    std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                          std::istreambuf_iterator<char>());
    std::vector<std::byte> data;
    data.reserve(tmp.size());
    for (char c : tmp)
      data.push_back(std::byte(c));
    putChunk(entry.path().filename().string(), data);
    ++loaded;
  }
  return loaded;
}

void ChunkStore::saveDirectory(const std::string &dir) const {
  namespace fs = std::filesystem;
  fs::create_directories(dir);
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &kv : chunks_) {
    const fs::path path = fs::path(dir) / kv.first;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Could not open chunk file: " + path.string());
    }
    out.write(reinterpret_cast<const char *>(kv.second.data()),
              static_cast<std::streamsize>(kv.second.size()));
    if (!out) {
      throw std::runtime_error("Failed to write chunk file: " + path.string());
    }
  }
}
