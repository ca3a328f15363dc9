#ifndef TFS_ERRORS_HPP
#define TFS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tfs {

/// Construction input the tree cannot represent (empty file, too many
/// pieces, size beyond the 32-bit record field). Indicates a caller bug.
class InvalidInputError : public std::invalid_argument {
public:
  explicit InvalidInputError(const std::string &message)
      : std::invalid_argument(message) {}
};

/// Malformed persisted record bytes.
class DecodeError : public std::runtime_error {
public:
  explicit DecodeError(const std::string &message)
      : std::runtime_error(message) {}
};

} // namespace tfs

#endif // TFS_ERRORS_HPP
