#pragma once

#include <cstddef>

/**
 * @brief Byte offsets of the fields of a serialized MetadataRecord.
 *
 * All integers are little-endian. The record is 40 bytes: 36 bytes of
 * fields followed by 4 reserved bytes that are written as zero, which keeps
 * the size of the naturally aligned layout the format was defined with.
 */
namespace bitumen::detail::layout {
inline constexpr std::size_t modified_at = 0; /**< @brief u64 */
inline constexpr std::size_t file_size = 8;   /**< @brief u64 */
inline constexpr std::size_t path_len = 16;   /**< @brief u16 */
inline constexpr std::size_t perms = 18;      /**< @brief u16, reserved */
inline constexpr std::size_t owner = 20;      /**< @brief u16, reserved */
inline constexpr std::size_t group = 22;      /**< @brief u16, reserved */
inline constexpr std::size_t magic = 24;      /**< @brief u32 */
inline constexpr std::size_t flags = 28;      /**< @brief u32 */
inline constexpr std::size_t checksum = 32;   /**< @brief u32 */
inline constexpr std::size_t reserved = 36;   /**< @brief 4 zero bytes */
inline constexpr std::size_t size = 40;

static_assert(reserved + 4 == size, "record must be 40 bytes");
} // namespace bitumen::detail::layout
