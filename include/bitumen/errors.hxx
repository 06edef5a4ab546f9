#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace bitumen {
/**
 * @class ArchiveError
 * @brief Fatal failure while producing an archive.
 *
 * Thrown by the encoder on any I/O failure. The output stream is left with
 * whatever bytes were already written and must be treated as invalid.
 */
class ArchiveError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @class UnsupportedKindError
 * @brief The object to archive is neither a regular file nor a directory.
 */
class UnsupportedKindError : public ArchiveError {
public:
  explicit UnsupportedKindError(const std::filesystem::path &path);

  /// @brief The offending path.
  const std::filesystem::path &path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
};

/**
 * @class PathTooLongError
 * @brief The raw path does not fit the 16-bit path length field.
 */
class PathTooLongError : public ArchiveError {
public:
  PathTooLongError(const std::filesystem::path &path, std::size_t length);

  /// @brief Byte length of the rejected path.
  std::size_t length() const noexcept { return length_; }

private:
  std::size_t length_;
};
} // namespace bitumen
