#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace bitumen {
/**
 * @brief Compute the CRC-32 of a byte sequence.
 *
 * This is the reflected CRC-32 used by zip, gzip and PNG (polynomial
 * 0x04C11DB7, initial value and final XOR 0xFFFFFFFF). The digest of the
 * ASCII bytes "123456789" is 0xCBF43926.
 *
 * @param bytes Bytes to digest, processed in a single pass.
 * @return std::uint32_t The 32-bit checksum.
 */
std::uint32_t digest(std::span<const std::uint8_t> bytes) noexcept;

/// @brief Convenience overload over the bytes of a string.
std::uint32_t digest(std::string_view bytes) noexcept;
} // namespace bitumen
