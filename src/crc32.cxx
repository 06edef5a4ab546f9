#include <bitumen/crc32.hxx>
#include <boost/crc.hpp>

namespace bitumen {

std::uint32_t digest(std::span<const std::uint8_t> bytes) noexcept {
  boost::crc_32_type crc;
  crc.process_bytes(bytes.data(), bytes.size());
  return crc.checksum();
}

std::uint32_t digest(std::string_view bytes) noexcept {
  boost::crc_32_type crc;
  crc.process_bytes(bytes.data(), bytes.size());
  return crc.checksum();
}
} // namespace bitumen
