#pragma once

#include <cstdint>
#include <string_view>

namespace bitumen {
/**
 * @enum EntryKind
 * @brief Kind of an archived object, stored in bits 0-1 of the record flags.
 *
 * Only File and Directory are produced by the encoder. SoftLink and HardLink
 * are representable and reported by the decoder but carry no link target.
 */
enum class EntryKind : std::uint32_t {
  File = 0x0,
  Directory = 0x1,
  SoftLink = 0x2,
  HardLink = 0x3,
};

namespace flags {
/// @brief Mask selecting the kind bits of the flags field.
inline constexpr std::uint32_t kind_mask = 0x3;
/// @brief Set on the record preceding the path, clear on the trailing one.
inline constexpr std::uint32_t header = 0x8;
/// @brief Every bit the current format assigns a meaning to.
inline constexpr std::uint32_t known = kind_mask | header;
} // namespace flags

/**
 * @brief Human-readable name of an entry kind, for reporting only.
 *
 * @param kind The kind to describe.
 * @return std::string_view "File", "Directory", "Soft Link" or "Hard Link".
 */
std::string_view kind_label(EntryKind kind) noexcept;

/// @brief Extract the kind from a raw flags value.
constexpr EntryKind kind_from_flags(std::uint32_t value) noexcept {
  return static_cast<EntryKind>(value & flags::kind_mask);
}
} // namespace bitumen
