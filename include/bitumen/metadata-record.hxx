#pragma once

#include <bitumen/entry-kind.hxx>

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>

namespace bitumen {
/// @brief Constant stored in every well-formed record.
inline constexpr std::uint32_t record_magic = 0x2F968B6A;
/// @brief Size of a serialized record in bytes.
inline constexpr std::size_t record_size = 40;
/// @brief Number of leading bytes covered by the record checksum.
inline constexpr std::size_t checksummed_size = 32;

using RecordBytes = std::array<std::uint8_t, record_size>;

/**
 * @struct MetadataRecord
 * @brief Fixed 40-byte record placed before (header) and after (footer) the
 * path and body of every archive entry.
 *
 * The in-memory struct is never reinterpreted as bytes: serialize() and
 * parse() encode each field at a fixed offset in little-endian order. The
 * checksum is the CRC-32 of the 32 bytes preceding the checksum field, so a
 * header and the matching footer differ in both the header flag and the
 * checksum.
 */
struct MetadataRecord {
  std::uint64_t modified_at = 0; /**< @brief Seconds since the Unix epoch. */
  std::uint64_t file_size = 0;   /**< @brief Body length, 0 unless a file. */
  std::uint16_t path_len = 0;    /**< @brief Byte length of the path. */
  std::uint16_t perms = 0;       /**< @brief Reserved, always 0. */
  std::uint16_t owner = 0;       /**< @brief Reserved, always 0. */
  std::uint16_t group = 0;       /**< @brief Reserved, always 0. */
  std::uint32_t magic = record_magic;
  std::uint32_t flags = 0;
  std::uint32_t checksum = 0;

  /**
   * @brief Build a record and compute its checksum.
   *
   * @param kind Kind of the archived object.
   * @param header true for the record preceding the path, false for the
   * footer.
   * @param modified_at Modification time in seconds since the Unix epoch.
   * @param file_size Body length in bytes.
   * @param path_len Byte length of the raw path.
   * @return MetadataRecord A record ready for serialize().
   */
  static MetadataRecord build(EntryKind kind, bool header,
                              std::uint64_t modified_at,
                              std::uint64_t file_size, std::uint16_t path_len);

  /**
   * @brief Decode a record from its 40-byte representation.
   *
   * No validation happens here; see magic_valid() and checksum_valid().
   */
  static MetadataRecord parse(const RecordBytes &bytes) noexcept;

  /**
   * @brief Encode the record.
   *
   * @throws std::logic_error if the checksum was not computed for the
   * current field values.
   */
  RecordBytes serialize() const;

  /// @brief The bytes the checksum is computed over.
  std::array<std::uint8_t, checksummed_size> checksummed_bytes() const noexcept;

  std::uint32_t compute_checksum() const noexcept;

  /// @brief Store compute_checksum() in the checksum field.
  void seal() noexcept { checksum = compute_checksum(); }

  bool checksum_valid() const noexcept {
    return checksum == compute_checksum();
  }
  bool magic_valid() const noexcept { return magic == record_magic; }
  /// @brief true when no flag bit outside flags::known is set.
  bool reserved_flags_clear() const noexcept {
    return (flags & ~flags::known) == 0;
  }
  bool is_header() const noexcept { return (flags & flags::header) != 0; }
  EntryKind kind() const noexcept { return kind_from_flags(flags); }
  std::string_view kind_label() const noexcept {
    return bitumen::kind_label(kind());
  }

  /**
   * @brief Compare every field a header and its footer must share.
   *
   * Ignores the header flag and the checksum.
   */
  bool same_payload(const MetadataRecord &other) const noexcept;
};

/// @brief Debug rendering of every field.
std::ostream &operator<<(std::ostream &os, const MetadataRecord &record);
} // namespace bitumen
