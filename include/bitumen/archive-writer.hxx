#pragma once

#include <bitumen/errors.hxx>
#include <bitumen/tree-linearizer.hxx>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <ostream>

namespace bitumen {
/**
 * @class ArchiveWriter
 * @brief Appends filesystem objects to an archive stream.
 *
 * Each entry is written as header record, raw path bytes, file body (files
 * only) and footer record. The stream is owned by the caller. Every failure
 * throws; the stream then holds a partial archive that must be discarded.
 */
class ArchiveWriter {
public:
  explicit ArchiveWriter(std::ostream &out) : out_(out) {}

  /**
   * @brief Append one regular file or directory.
   *
   * The path is stored exactly as given. A file is opened only for the
   * duration of this call and its whole content is copied as the body.
   *
   * @param path Object to archive.
   * @throws UnsupportedKindError for anything but a file or directory.
   * @throws PathTooLongError if the path exceeds 65535 bytes; nothing is
   * written in that case.
   * @throws ArchiveError on any read or write failure.
   * @throws std::filesystem::filesystem_error if the object cannot be
   * inspected.
   */
  void append(const std::filesystem::path &path);

  /**
   * @brief Append a whole subtree, directories first.
   *
   * Uses linearize_tree(), so every directory entry precedes every file
   * entry and each group follows depth-first pre-order. The first failure
   * aborts the operation.
   */
  void append_tree(const std::filesystem::path &root);

  std::size_t entries_written() const noexcept { return entries_; }
  std::uint64_t bytes_written() const noexcept { return bytes_; }

private:
  void append_node(const TreeNode &node);
  void write(const void *data, std::size_t size, const char *what);

  std::ostream &out_;
  std::size_t entries_ = 0;
  std::uint64_t bytes_ = 0;
};

/// @brief Append one object to @p archive; see ArchiveWriter::append.
void append_to_archive(std::ostream &archive,
                       const std::filesystem::path &path);

/// @brief Write the subtree at @p root; see ArchiveWriter::append_tree.
void recursive_archive(std::ostream &archive,
                       const std::filesystem::path &root);
} // namespace bitumen
