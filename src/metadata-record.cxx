#include <bitumen/crc32.hxx>
#include <bitumen/detail/record-layout.hxx>
#include <bitumen/metadata-record.hxx>

#include <boost/endian/conversion.hpp>

#include <ios>
#include <ostream>
#include <stdexcept>

namespace bitumen {
namespace {
namespace endian = boost::endian;
namespace layout = detail::layout;

/**
 * @brief Write every field up to (not including) the checksum.
 *
 * @param record Record to encode.
 * @param out Destination holding at least checksummed_size bytes.
 */
void store_payload(const MetadataRecord &record, std::uint8_t *out) noexcept {
  endian::store_little_u64(out + layout::modified_at, record.modified_at);
  endian::store_little_u64(out + layout::file_size, record.file_size);
  endian::store_little_u16(out + layout::path_len, record.path_len);
  endian::store_little_u16(out + layout::perms, record.perms);
  endian::store_little_u16(out + layout::owner, record.owner);
  endian::store_little_u16(out + layout::group, record.group);
  endian::store_little_u32(out + layout::magic, record.magic);
  endian::store_little_u32(out + layout::flags, record.flags);
}

static_assert(layout::checksum == checksummed_size,
              "checksum must follow every checksummed field");
static_assert(layout::size == record_size);
} // unnamed namespace

MetadataRecord MetadataRecord::build(EntryKind kind, bool header,
                                     std::uint64_t modified_at,
                                     std::uint64_t file_size,
                                     std::uint16_t path_len) {
  MetadataRecord record;
  record.modified_at = modified_at;
  record.file_size = file_size;
  record.path_len = path_len;
  record.magic = record_magic;
  record.flags = static_cast<std::uint32_t>(kind);
  if (header)
    record.flags |= flags::header;
  record.seal();
  return record;
}

MetadataRecord MetadataRecord::parse(const RecordBytes &bytes) noexcept {
  const auto *in = bytes.data();
  MetadataRecord record;
  record.modified_at = endian::load_little_u64(in + layout::modified_at);
  record.file_size = endian::load_little_u64(in + layout::file_size);
  record.path_len = endian::load_little_u16(in + layout::path_len);
  record.perms = endian::load_little_u16(in + layout::perms);
  record.owner = endian::load_little_u16(in + layout::owner);
  record.group = endian::load_little_u16(in + layout::group);
  record.magic = endian::load_little_u32(in + layout::magic);
  record.flags = endian::load_little_u32(in + layout::flags);
  record.checksum = endian::load_little_u32(in + layout::checksum);
  return record;
}

RecordBytes MetadataRecord::serialize() const {
  if (!checksum_valid())
    throw std::logic_error("metadata record serialized without a valid "
                           "checksum; call seal() first");

  RecordBytes bytes{};
  store_payload(*this, bytes.data());
  endian::store_little_u32(bytes.data() + layout::checksum, checksum);
  return bytes;
}

std::array<std::uint8_t, checksummed_size>
MetadataRecord::checksummed_bytes() const noexcept {
  std::array<std::uint8_t, checksummed_size> bytes{};
  store_payload(*this, bytes.data());
  return bytes;
}

std::uint32_t MetadataRecord::compute_checksum() const noexcept {
  const auto bytes = checksummed_bytes();
  return digest(bytes);
}

bool MetadataRecord::same_payload(const MetadataRecord &other) const noexcept {
  return modified_at == other.modified_at && file_size == other.file_size &&
         path_len == other.path_len && perms == other.perms &&
         owner == other.owner && group == other.group &&
         magic == other.magic &&
         (flags & ~flags::header) == (other.flags & ~flags::header);
}

std::ostream &operator<<(std::ostream &os, const MetadataRecord &record) {
  const auto base = os.flags();
  os << "MetadataRecord { modified_at: " << record.modified_at
     << ", file_size: " << record.file_size
     << ", path_len: " << record.path_len << ", perms: " << record.perms
     << ", owner: " << record.owner << ", group: " << record.group
     << std::hex << std::showbase << ", magic: " << record.magic
     << ", flags: " << record.flags << ", checksum: " << record.checksum
     << " }";
  os.flags(base);
  return os;
}
} // namespace bitumen
