#include "utilities/key_value_store.hpp"
#include "utilities/digest.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace tfs {

namespace fs = std::filesystem;

static const char *kEntrySuffix = ".rec";

std::optional<Bytes> InMemoryKeyValueStore::get(const Bytes &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryKeyValueStore::insert(const Bytes &key, const Bytes &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = value;
}

bool InMemoryKeyValueStore::contains(const Bytes &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(key) > 0;
}

std::vector<Bytes> InMemoryKeyValueStore::keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Bytes> out;
  out.reserve(entries_.size());
  for (const auto &kv : entries_) {
    out.push_back(kv.first);
  }
  return out;
}

DirectoryKeyValueStore::DirectoryKeyValueStore(std::string directory)
    : directory_(std::move(directory)) {
  fs::create_directories(directory_);
}

std::string DirectoryKeyValueStore::pathFor(const Bytes &key) const {
  return (fs::path(directory_) / (utils::to_hex(key) + kEntrySuffix)).string();
}

std::optional<Bytes> DirectoryKeyValueStore::get(const Bytes &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ifstream in(pathFor(key), std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  return Bytes((std::istreambuf_iterator<char>(in)),
               std::istreambuf_iterator<char>());
}

void DirectoryKeyValueStore::insert(const Bytes &key, const Bytes &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string path = pathFor(key);
  const std::string tmpPath = path + ".tmp";
  {
    std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Could not open ledger entry for writing: " +
                               tmpPath);
    }
    out.write(reinterpret_cast<const char *>(value.data()),
              static_cast<std::streamsize>(value.size()));
    if (!out) {
      throw std::runtime_error("Failed to write ledger entry: " + tmpPath);
    }
  }
  fs::rename(tmpPath, path);
}

bool DirectoryKeyValueStore::contains(const Bytes &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fs::exists(pathFor(key));
}

std::vector<Bytes> DirectoryKeyValueStore::keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Bytes> out;
  for (const auto &entry : fs::directory_iterator(directory_)) {
    if (!entry.is_regular_file() || entry.path().extension() != kEntrySuffix)
      continue;
    try {
      out.push_back(utils::from_hex(entry.path().stem().string()));
    } catch (const std::invalid_argument &) {
      // Not one of ours; leave it alone.
      continue;
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace tfs
