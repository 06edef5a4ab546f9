#include <bitumen/crc32.hxx>
#include <bitumen/metadata-record.hxx>

#include <array>
#include <cstdint>
#include <gtest/gtest.h>
#include <span>
#include <sstream>
#include <stdexcept>

using bitumen::EntryKind;
using bitumen::MetadataRecord;

namespace {
std::uint32_t load_u32(const bitumen::RecordBytes &bytes, std::size_t at) {
  return static_cast<std::uint32_t>(bytes[at]) |
         static_cast<std::uint32_t>(bytes[at + 1]) << 8 |
         static_cast<std::uint32_t>(bytes[at + 2]) << 16 |
         static_cast<std::uint32_t>(bytes[at + 3]) << 24;
}

MetadataRecord sample(bool header) {
  return MetadataRecord::build(EntryKind::File, header, 1'600'000'000, 5, 9);
}
} // namespace

TEST(MetadataRecordTest, SerializesToFortyBytes) {
  const auto bytes = sample(true).serialize();
  EXPECT_EQ(bytes.size(), 40u);
  EXPECT_EQ(bitumen::record_size, 40u);
}

TEST(MetadataRecordTest, MatchesGoldenLittleEndianLayout) {
  const std::array<std::uint8_t, 40> expected{
      0x00, 0x10, 0x5e, 0x5f, 0x00, 0x00, 0x00, 0x00, // modified_at
      0x05, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, // file_size
      0x09, 0x00,                                     // path_len
      0x00, 0x00, 0x00, 0x00, 0x00, 0x00,             // perms, owner, group
      0x6a, 0x8b, 0x96, 0x2f,                         // magic
      0x08, 0x00, 0x00, 0x00,                         // flags
      0xb3, 0xab, 0xd6, 0x31,                         // checksum
      0x00, 0x00, 0x00, 0x00};                        // reserved
  EXPECT_EQ(sample(true).serialize(), expected);
}

TEST(MetadataRecordTest, ChecksumCoversEveryPrecedingByte) {
  const auto record = sample(true);
  const auto bytes = record.serialize();
  const auto covered = std::span<const std::uint8_t>(bytes).first(32);
  EXPECT_EQ(record.checksum, bitumen::digest(covered));
  EXPECT_EQ(load_u32(bytes, 32), record.checksum);
}

TEST(MetadataRecordTest, ChecksummedBytesIgnoreTheChecksumField) {
  MetadataRecord record;
  record.file_size = 34343;
  record.flags = 23232;

  const auto before = record.checksummed_bytes();
  record.checksum = 0xAABBAABB;
  const auto after = record.checksummed_bytes();

  EXPECT_EQ(before.size(), 32u);
  EXPECT_EQ(before, after);
}

TEST(MetadataRecordTest, SerializeWithoutChecksumIsRejected) {
  MetadataRecord record;
  record.file_size = 12;
  EXPECT_THROW(record.serialize(), std::logic_error);

  record.seal();
  EXPECT_NO_THROW(record.serialize());

  record.path_len = 3;
  EXPECT_THROW(record.serialize(), std::logic_error);
}

TEST(MetadataRecordTest, HeaderAndFooterDifferOnlyInFlagAndChecksum) {
  const auto header = sample(true);
  const auto footer = sample(false);

  EXPECT_TRUE(header.is_header());
  EXPECT_FALSE(footer.is_header());
  EXPECT_TRUE(header.same_payload(footer));
  EXPECT_NE(header.checksum, footer.checksum);
  EXPECT_EQ(footer.checksum, 0xF462835Cu);

  const auto h = header.serialize();
  const auto f = footer.serialize();
  for (std::size_t i = 0; i < 28; ++i)
    EXPECT_EQ(h[i], f[i]) << "byte " << i;
  EXPECT_NE(h[28], f[28]);
}

TEST(MetadataRecordTest, ParseRecoversEveryField) {
  auto record =
      MetadataRecord::build(EntryKind::Directory, true, 42, 0, 65535);
  const auto parsed = MetadataRecord::parse(record.serialize());

  EXPECT_EQ(parsed.modified_at, 42u);
  EXPECT_EQ(parsed.file_size, 0u);
  EXPECT_EQ(parsed.path_len, 65535u);
  EXPECT_EQ(parsed.kind(), EntryKind::Directory);
  EXPECT_TRUE(parsed.is_header());
  EXPECT_TRUE(parsed.magic_valid());
  EXPECT_TRUE(parsed.checksum_valid());
  EXPECT_EQ(parsed.checksum, record.checksum);
}

TEST(MetadataRecordTest, DetectsBadMagicAndCorruption) {
  auto bytes = sample(true).serialize();
  bytes[24] ^= 0xFF;
  auto parsed = MetadataRecord::parse(bytes);
  EXPECT_FALSE(parsed.magic_valid());

  bytes = sample(true).serialize();
  bytes[3] ^= 0x01;
  parsed = MetadataRecord::parse(bytes);
  EXPECT_TRUE(parsed.magic_valid());
  EXPECT_FALSE(parsed.checksum_valid());
}

TEST(MetadataRecordTest, PayloadMismatchIsDetected) {
  const auto header = sample(true);
  auto footer = MetadataRecord::build(EntryKind::File, false, 1'600'000'000,
                                      6, 9);
  EXPECT_FALSE(header.same_payload(footer));

  footer = MetadataRecord::build(EntryKind::Directory, false, 1'600'000'000,
                                 5, 9);
  EXPECT_FALSE(header.same_payload(footer));
}

TEST(MetadataRecordTest, KindLabels) {
  EXPECT_EQ(bitumen::kind_label(EntryKind::File), "File");
  EXPECT_EQ(bitumen::kind_label(EntryKind::Directory), "Directory");
  EXPECT_EQ(bitumen::kind_label(EntryKind::SoftLink), "Soft Link");
  EXPECT_EQ(bitumen::kind_label(EntryKind::HardLink), "Hard Link");

  MetadataRecord record;
  record.flags = bitumen::flags::header | 0x2;
  EXPECT_EQ(record.kind(), EntryKind::SoftLink);
  EXPECT_EQ(record.kind_label(), "Soft Link");
}

TEST(MetadataRecordTest, DebugRenderingNamesFields) {
  std::ostringstream out;
  out << sample(false);
  EXPECT_NE(out.str().find("file_size: 5"), std::string::npos);
  EXPECT_NE(out.str().find("magic: 0x2f968b6a"), std::string::npos);
}
