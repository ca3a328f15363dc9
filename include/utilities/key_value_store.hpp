#ifndef KEY_VALUE_STORE_HPP
#define KEY_VALUE_STORE_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tfs {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Minimal ledger storage: opaque byte values keyed by opaque bytes.
 *
 * The Merkle core never talks to a store directly; FileRegistry does.
 */
class KeyValueStore {
public:
  virtual ~KeyValueStore() = default;

  virtual std::optional<Bytes> get(const Bytes &key) const = 0;
  /// Inserts or replaces the value stored under @p key.
  virtual void insert(const Bytes &key, const Bytes &value) = 0;
  virtual bool contains(const Bytes &key) const = 0;
  /// All keys, in ascending byte order.
  virtual std::vector<Bytes> keys() const = 0;
};

class InMemoryKeyValueStore : public KeyValueStore {
public:
  std::optional<Bytes> get(const Bytes &key) const override;
  void insert(const Bytes &key, const Bytes &value) override;
  bool contains(const Bytes &key) const override;
  std::vector<Bytes> keys() const override;

private:
  mutable std::mutex mutex_;
  std::map<Bytes, Bytes> entries_;
};

/**
 * @brief One file per entry under a directory; the filename is the hex key.
 *
 * The directory is created on construction.
 * @throw std::runtime_error from insert() if the entry cannot be written.
 */
class DirectoryKeyValueStore : public KeyValueStore {
public:
  explicit DirectoryKeyValueStore(std::string directory);

  std::optional<Bytes> get(const Bytes &key) const override;
  void insert(const Bytes &key, const Bytes &value) override;
  bool contains(const Bytes &key) const override;
  std::vector<Bytes> keys() const override;

  const std::string &directory() const { return directory_; }

private:
  std::string pathFor(const Bytes &key) const;

  std::string directory_;
  mutable std::mutex mutex_;
};

} // namespace tfs

#endif // KEY_VALUE_STORE_HPP
