#include <bitumen/archive-reader.hxx>
#include <bitumen/metadata-record.hxx>

#include <boost/log/trivial.hpp>

#include <iomanip>
#include <ios>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace bitumen {
namespace {

enum class ReadStatus { Complete, Empty, Short };

/**
 * @brief Read exactly @p size bytes.
 *
 * @return ReadStatus Complete on success, Empty when not a single byte was
 * available, Short when the stream ended part way.
 */
ReadStatus read_exact(std::istream &in, char *dest, std::size_t size) {
  std::streamsize got = 0;
  try {
    in.read(dest, static_cast<std::streamsize>(size));
    got = in.gcount();
  } catch (const std::ios_base::failure &) {
    // Only reachable when the caller enabled stream exceptions.
    got = in.gcount();
  }
  if (static_cast<std::size_t>(got) == size)
    return ReadStatus::Complete;
  return got == 0 ? ReadStatus::Empty : ReadStatus::Short;
}

/// @brief Current read offset, 0 if the stream cannot report one.
std::uint64_t position(std::istream &in) {
  if (!in.good())
    return 0;
  const auto pos = in.tellg();
  return pos < 0 ? 0 : static_cast<std::uint64_t>(pos);
}

/**
 * @brief Number of bytes between the current position and the end of the
 * stream. The position is restored.
 *
 * @return std::optional<std::uint64_t> Empty if the stream cannot seek.
 */
std::optional<std::uint64_t> remaining(std::istream &in) {
  try {
    const auto here = in.tellg();
    if (here < 0)
      return std::nullopt;
    in.seekg(0, std::ios::end);
    const auto end = in.tellg();
    in.seekg(here);
    if (!in || end < here)
      return std::nullopt;
    return static_cast<std::uint64_t>(end - here);
  } catch (const std::ios_base::failure &) {
    return std::nullopt;
  }
}

/**
 * @brief Read and validate one record.
 *
 * @param in Archive stream positioned at the record.
 * @param header true when the record opens an entry.
 * @param record Receives the parsed record.
 * @return std::optional<DecodeError> Empty when the record is valid.
 */
std::optional<DecodeError> read_record(std::istream &in, bool header,
                                       MetadataRecord &record) {
  const char *name = header ? "Header" : "Footer";
  const auto malformed = header ? DecodeError::Header : DecodeError::Footer;

  RecordBytes bytes{};
  switch (read_exact(in, reinterpret_cast<char *>(bytes.data()),
                     bytes.size())) {
  case ReadStatus::Complete:
    break;
  case ReadStatus::Empty:
    if (header)
      return DecodeError::Exhausted;
    [[fallthrough]];
  case ReadStatus::Short:
    BOOST_LOG_TRIVIAL(error) << "Failed to decode " << name
                             << ": stream ends inside the record";
    return DecodeError::Crop;
  }

  record = MetadataRecord::parse(bytes);
  BOOST_LOG_TRIVIAL(trace) << name << ": " << record;

  if (!record.magic_valid()) {
    BOOST_LOG_TRIVIAL(error) << name << " check failed: bad magic "
                             << std::hex << std::showbase << record.magic;
    return malformed;
  }
  if (record.is_header() != header) {
    BOOST_LOG_TRIVIAL(error) << name << " check failed: header flag is "
                             << (record.is_header() ? "set" : "clear");
    return malformed;
  }
  if (!record.reserved_flags_clear()) {
    BOOST_LOG_TRIVIAL(error) << name << " check failed: reserved flag bits "
                             << std::hex << std::showbase
                             << (record.flags & ~flags::known);
    return malformed;
  }
  if (!record.checksum_valid()) {
    BOOST_LOG_TRIVIAL(error) << name << " checksum mismatch: stored "
                             << std::hex << std::showbase << record.checksum
                             << ", computed " << record.compute_checksum();
    return DecodeError::Checksum;
  }
  return std::nullopt;
}

/**
 * @brief Length of the maximal prefix of a UTF-8 sequence starting at @p i.
 *
 * @return std::pair<std::size_t, bool> Prefix length (at least 1) and
 * whether it forms a complete, well-formed code point.
 */
std::pair<std::size_t, bool> utf8_sequence(std::string_view s, std::size_t i) {
  const auto lead = static_cast<unsigned char>(s[i]);
  if (lead < 0x80)
    return {1, true};

  std::size_t length = 0;
  unsigned char low = 0x80, high = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0)
      low = 0xA0;
    else if (lead == 0xED)
      high = 0x9F;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0)
      low = 0x90;
    else if (lead == 0xF4)
      high = 0x8F;
  } else {
    return {1, false};
  }

  std::size_t n = 1;
  for (; n < length && i + n < s.size(); ++n) {
    const auto byte = static_cast<unsigned char>(s[i + n]);
    const bool ok = n == 1 ? byte >= low && byte <= high
                           : (byte & 0xC0) == 0x80;
    if (!ok)
      return {n, false};
  }
  return {n, n == length};
}
} // unnamed namespace

std::string_view to_string(DecodeError error) noexcept {
  switch (error) {
  case DecodeError::Exhausted:
    return "exhausted";
  case DecodeError::Header:
    return "bad header";
  case DecodeError::Footer:
    return "bad footer";
  case DecodeError::Checksum:
    return "checksum mismatch";
  case DecodeError::Crop:
    return "truncated entry";
  }
  return "unknown";
}

std::string ArchiveEntry::display_path() const {
  static constexpr std::string_view replacement = "\xEF\xBF\xBD";
  std::string text;
  text.reserve(path.size());
  for (std::size_t i = 0; i < path.size();) {
    const auto [length, valid] = utf8_sequence(path, i);
    if (valid)
      text.append(path, i, length);
    else
      text.append(replacement);
    i += length;
  }
  return text;
}

std::string describe(const ArchiveEntry &entry) {
  std::ostringstream line;
  line << std::left << std::setw(9) << kind_label(entry.kind) << " : "
       << entry.display_path() << " : " << entry.file_size << "B";
  return line.str();
}

DecodeOutcome ArchiveReader::read_entry() {
  DecodeOutcome outcome;
  outcome.offset = position(in_);

  auto fail = [&outcome](DecodeError error) {
    outcome.error = error;
    return outcome;
  };

  ArchiveEntry entry;
  entry.offset = outcome.offset;
  MetadataRecord header;
  MetadataRecord footer;
  auto state = State::ReadHeader;

  while (state != State::Done) {
    switch (state) {
    case State::ReadHeader: {
      if (const auto error = read_record(in_, true, header))
        return fail(*error);
      entry.kind = header.kind();
      entry.file_size = header.file_size;
      entry.modified_at = header.modified_at;
      state = State::ReadPath;
      break;
    }

    case State::ReadPath: {
      entry.path.resize(header.path_len);
      if (header.path_len > 0 &&
          read_exact(in_, entry.path.data(), entry.path.size()) !=
              ReadStatus::Complete) {
        BOOST_LOG_TRIVIAL(error) << "Failed to read path: expected "
                                 << header.path_len << " bytes";
        return fail(DecodeError::Crop);
      }
      state = State::SkipBody;
      break;
    }

    case State::SkipBody: {
      if (header.file_size > 0) {
        const auto left = remaining(in_);
        if (!left || *left < header.file_size) {
          BOOST_LOG_TRIVIAL(error)
              << "Failed to seek past file contents: " << header.file_size
              << " bytes expected, "
              << (left ? std::to_string(*left) : std::string("unknown"))
              << " available";
          return fail(DecodeError::Crop);
        }
        in_.seekg(static_cast<std::streamoff>(header.file_size),
                  std::ios::cur);
        if (!in_) {
          BOOST_LOG_TRIVIAL(error) << "Failed to seek past file contents";
          return fail(DecodeError::Crop);
        }
      }
      state = State::ReadFooter;
      break;
    }

    case State::ReadFooter: {
      if (const auto error = read_record(in_, false, footer))
        return fail(*error);
      if (!footer.same_payload(header)) {
        BOOST_LOG_TRIVIAL(error) << "Footer check failed: does not match "
                                    "the header at offset "
                                 << entry.offset;
        return fail(DecodeError::Footer);
      }
      state = State::Done;
      break;
    }

    case State::Done:
      break;
    }
  }

  outcome.entry = std::move(entry);
  return outcome;
}

ReadSummary read_archive(std::istream &in, const EntryObserver &observer) {
  ArchiveReader reader(in);
  ReadSummary summary;

  for (;;) {
    auto outcome = reader.read_entry();
    if (!outcome) {
      summary.stop_reason = outcome.error;
      summary.stop_offset = outcome.offset;
      break;
    }
    BOOST_LOG_TRIVIAL(info) << describe(*outcome.entry);
    if (observer)
      observer(*outcome.entry);
    ++summary.entries;
  }

  if (summary.clean())
    BOOST_LOG_TRIVIAL(info) << "decoded " << summary.entries << " entries";
  else
    BOOST_LOG_TRIVIAL(error) << "decoding stopped after " << summary.entries
                             << " entries: " << to_string(summary.stop_reason)
                             << " at offset " << summary.stop_offset;
  return summary;
}
} // namespace bitumen
