#include <bitumen/errors.hxx>

namespace bitumen {

UnsupportedKindError::UnsupportedKindError(const std::filesystem::path &path)
    : ArchiveError("can only archive regular files and directories: " +
                   path.string()),
      path_(path) {}

PathTooLongError::PathTooLongError(const std::filesystem::path &path,
                                   std::size_t length)
    : ArchiveError("path is " + std::to_string(length) +
                   " bytes, the format allows at most 65535: " +
                   path.string()),
      length_(length) {}
} // namespace bitumen
