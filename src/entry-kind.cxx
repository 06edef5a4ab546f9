#include <bitumen/entry-kind.hxx>

namespace bitumen {

std::string_view kind_label(EntryKind kind) noexcept {
  switch (kind) {
  case EntryKind::File:
    return "File";
  case EntryKind::Directory:
    return "Directory";
  case EntryKind::SoftLink:
    return "Soft Link";
  case EntryKind::HardLink:
    return "Hard Link";
  }
  return "Unknown";
}
} // namespace bitumen
