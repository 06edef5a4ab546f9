#include <bitumen/archive-writer.hxx>
#include <bitumen/metadata-record.hxx>

#include <boost/iostreams/constants.hpp>
#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/read.hpp>
#include <boost/log/trivial.hpp>

#include <array>
#include <chrono>
#include <ios>
#include <limits>
#include <optional>
#include <string>

namespace bitumen {
namespace {
namespace fs = std::filesystem;
namespace io = boost::iostreams;

/**
 * @brief Byte length of the raw path, checked against the 16-bit field.
 *
 * @throws PathTooLongError if the path does not fit.
 */
std::uint16_t checked_path_len(const fs::path &path) {
  const auto length = path.native().size();
  if (length > std::numeric_limits<std::uint16_t>::max())
    throw PathTooLongError(path, length);
  return static_cast<std::uint16_t>(length);
}

/**
 * @brief Modification time of @p path in whole seconds since the Unix epoch.
 *
 * @throws ArchiveError for times before the epoch, which the unsigned field
 * cannot hold.
 */
std::uint64_t modified_seconds(const fs::path &path) {
  const auto written = fs::last_write_time(path);
  const auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::file_clock::to_sys(written).time_since_epoch());
  if (since_epoch.count() < 0)
    throw ArchiveError("modification time precedes the Unix epoch: " +
                       path.string());
  return static_cast<std::uint64_t>(since_epoch.count());
}

/**
 * @brief Read the next chunk of a file body.
 *
 * @return std::streamsize Bytes read, or -1 at end of file.
 * @throws ArchiveError if the file cannot be read.
 */
std::streamsize read_chunk(io::file_source &body, char *dest,
                           std::size_t size, const fs::path &path) {
  try {
    return io::read(body, dest, static_cast<std::streamsize>(size));
  } catch (const std::ios_base::failure &e) {
    throw ArchiveError("failed to read " + path.string() + ": " + e.what());
  }
}
} // unnamed namespace

void ArchiveWriter::append(const fs::path &path) {
  checked_path_len(path);
  append_node(inspect(path));
}

void ArchiveWriter::append_tree(const fs::path &root) {
  const auto nodes = linearize_tree(root);
  for (const auto &node : nodes)
    append_node(node);
  BOOST_LOG_TRIVIAL(debug) << "archived " << nodes.size() << " entries from "
                           << root << " (" << bytes_ << " bytes)";
}

void ArchiveWriter::append_node(const TreeNode &node) {
  const auto &path = node.path;
  if (node.type == TreeNode::Type::Other)
    throw UnsupportedKindError(path);

  const std::string &raw_path = path.native();
  const auto path_len = checked_path_len(path);

  const auto kind = node.type == TreeNode::Type::File ? EntryKind::File
                                                      : EntryKind::Directory;
  const auto modified_at = modified_seconds(path);
  std::uint64_t file_size = 0;
  std::optional<io::file_source> body;
  if (kind == EntryKind::File) {
    file_size = fs::file_size(path);
    body.emplace(path.string(), std::ios::binary);
    if (!body->is_open())
      throw ArchiveError("cannot open " + path.string());
  }

  const auto header =
      MetadataRecord::build(kind, true, modified_at, file_size, path_len);
  const auto footer =
      MetadataRecord::build(kind, false, modified_at, file_size, path_len);
  BOOST_LOG_TRIVIAL(trace) << "header " << header;

  const auto header_bytes = header.serialize();
  write(header_bytes.data(), header_bytes.size(), "header");
  write(raw_path.data(), raw_path.size(), "path");

  if (body) {
    std::array<char, io::default_device_buffer_size> buffer;
    std::uint64_t copied = 0;
    for (;;) {
      const auto count = read_chunk(*body, buffer.data(), buffer.size(), path);
      if (count <= 0)
        break;
      copied += static_cast<std::uint64_t>(count);
      if (copied > file_size)
        break;
      write(buffer.data(), static_cast<std::size_t>(count), "body");
    }
    if (copied != file_size)
      throw ArchiveError(path.string() + " changed size while being archived");
  }

  const auto footer_bytes = footer.serialize();
  write(footer_bytes.data(), footer_bytes.size(), "footer");

  ++entries_;
  BOOST_LOG_TRIVIAL(debug) << "appended " << kind_label(kind) << " "
                           << raw_path << " (" << file_size << "B)";
}

void ArchiveWriter::write(const void *data, std::size_t size,
                          const char *what) {
  try {
    out_.write(static_cast<const char *>(data),
               static_cast<std::streamsize>(size));
  } catch (const std::ios_base::failure &e) {
    throw ArchiveError(std::string("failed to write entry ") + what + ": " +
                       e.what());
  }
  if (!out_)
    throw ArchiveError(std::string("failed to write entry ") + what);
  bytes_ += size;
}

void append_to_archive(std::ostream &archive, const fs::path &path) {
  ArchiveWriter(archive).append(path);
}

void recursive_archive(std::ostream &archive, const fs::path &root) {
  ArchiveWriter(archive).append_tree(root);
}
} // namespace bitumen
