#pragma once

#include <bitumen/archive-reader.hxx>
#include <bitumen/archive-writer.hxx>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/stream.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace bitumen::test {
namespace fs = std::filesystem;
namespace io = boost::iostreams;

/**
 * @brief Scratch directory removed with everything below it on destruction.
 */
class TempDir {
public:
  TempDir() {
    static int counter = 0;
    path_ = fs::temp_directory_path() /
            ("bitumen-test-" + std::to_string(::getpid()) + "-" +
             std::to_string(counter++));
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ignored;
    fs::remove_all(path_, ignored);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
  fs::path operator/(const fs::path &relative) const { return path_ / relative; }

private:
  fs::path path_;
};

/// @brief Create (or overwrite) a file with the given content.
inline void write_file(const fs::path &path, std::string_view content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

/// @brief Set the modification time of @p path to @p seconds after the epoch.
inline void set_mtime(const fs::path &path, std::int64_t seconds) {
  using namespace std::chrono;
  fs::last_write_time(path,
                      file_clock::from_sys(sys_seconds{seconds * 1s}));
}

/// @brief Encode the subtree at @p root into memory.
inline std::vector<char> archive_tree(const fs::path &root) {
  std::vector<char> bytes;
  io::stream<io::back_insert_device<std::vector<char>>> out(bytes);
  recursive_archive(out, root);
  out.flush();
  return bytes;
}

/// @brief Decode every entry of an in-memory archive.
inline std::vector<ArchiveEntry> decode_all(const std::vector<char> &bytes,
                                            ReadSummary *summary = nullptr) {
  std::vector<ArchiveEntry> entries;
  io::stream<io::array_source> in(bytes.data(), bytes.size());
  const auto result = read_archive(
      in, [&entries](const ArchiveEntry &entry) { entries.push_back(entry); });
  if (summary)
    *summary = result;
  return entries;
}
} // namespace bitumen::test
