#pragma once

#include <bitumen/entry-kind.hxx>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace bitumen {
/**
 * @enum DecodeError
 * @brief Why an entry could not be decoded.
 */
enum class DecodeError {
  Exhausted, /**< @brief No byte left where a header was expected. */
  Header,    /**< @brief Header record has a bad magic or header flag. */
  Footer,    /**< @brief Footer record is malformed or disagrees with the
                header. */
  Checksum,  /**< @brief A record's checksum does not match its bytes. */
  Crop,      /**< @brief The stream ends inside the entry. */
};

std::string_view to_string(DecodeError error) noexcept;

/**
 * @struct ArchiveEntry
 * @brief An entry reported by the decoder. The body is never read.
 */
struct ArchiveEntry {
  EntryKind kind = EntryKind::File;
  std::string path;              /**< @brief Raw path bytes as stored. */
  std::uint64_t file_size = 0;   /**< @brief Body length in bytes. */
  std::uint64_t modified_at = 0; /**< @brief Seconds since the Unix epoch. */
  std::uint64_t offset = 0;      /**< @brief Stream offset of the header. */

  /**
   * @brief Text rendering of the raw path.
   *
   * Valid UTF-8 is copied unchanged; each maximal invalid subsequence is
   * replaced with U+FFFD.
   */
  std::string display_path() const;
};

/**
 * @brief One-line report of an entry: "<kind> : <path> : <size>B", with the
 * kind left-aligned in 9 columns.
 */
std::string describe(const ArchiveEntry &entry);

/**
 * @struct DecodeOutcome
 * @brief Result of one decode attempt: an entry or the reason there is none.
 */
struct DecodeOutcome {
  std::optional<ArchiveEntry> entry;
  DecodeError error = DecodeError::Exhausted; /**< @brief Valid when !entry. */
  std::uint64_t offset = 0; /**< @brief Where the attempt started. */

  explicit operator bool() const noexcept { return entry.has_value(); }
};

/**
 * @struct ReadSummary
 * @brief What read_archive() saw before it stopped.
 */
struct ReadSummary {
  std::size_t entries = 0;
  DecodeError stop_reason = DecodeError::Exhausted;
  std::uint64_t stop_offset = 0;

  /// @brief true when the archive ended on an entry boundary.
  bool clean() const noexcept { return stop_reason == DecodeError::Exhausted; }
};

/// @brief Receives each decoded entry.
using EntryObserver = std::function<void(const ArchiveEntry &)>;

/**
 * @class ArchiveReader
 * @brief Decodes archive entries one at a time from a seekable stream.
 *
 * File bodies are skipped by seeking, so the stream must support seekg() and
 * tellg(). The stream is owned by the caller; only its position is used as
 * state between entries.
 */
class ArchiveReader {
public:
  /** @enum State Stages of a single decode attempt. */
  enum class State { ReadHeader, ReadPath, SkipBody, ReadFooter, Done };

  explicit ArchiveReader(std::istream &in) : in_(in) {}

  /**
   * @brief Decode the entry at the current stream position.
   *
   * On success the stream is left at the start of the next entry. After a
   * failure the position is unspecified.
   */
  DecodeOutcome read_entry();

private:
  std::istream &in_;
};

/**
 * @brief Decode every entry until the first failure of any kind.
 *
 * Each decoded entry is logged at info level and passed to @p observer.
 *
 * @param in Seekable archive stream.
 * @param observer Optional callback for each entry.
 * @return ReadSummary How many entries were decoded and why decoding
 * stopped.
 */
ReadSummary read_archive(std::istream &in, const EntryObserver &observer = {});
} // namespace bitumen
