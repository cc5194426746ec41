#include "DirectoryEntry.h"

#include <array>
#include <cstring>
#include <print>
#include <utility>

namespace fatInspect {

// -----------------------------------------------------------------------------
// Short Directory Entry
// -----------------------------------------------------------------------------

struct ShortDirectoryEntry {
  std::array<char, 11> name;
  uint8_t attributes;          // offset 11
  uint8_t ntReserved;
  uint8_t creationTimeTenths;
  uint16_t creationTime;
  uint16_t creationDate;
  uint16_t lastAccessDate;
  uint16_t firstClusterHigh;   // offset 20
  uint16_t writeTime;
  uint16_t writeDate;
  uint16_t firstClusterLow;    // offset 26
  uint32_t fileSize;           // offset 28
} __attribute__((packed));

static_assert(sizeof(ShortDirectoryEntry) == kDirEntrySize,
              "ShortDirectoryEntry must be 32 bytes");
static_assert(offsetof(ShortDirectoryEntry, firstClusterHigh) == 20);
static_assert(offsetof(ShortDirectoryEntry, firstClusterLow) == 26);
static_assert(offsetof(ShortDirectoryEntry, fileSize) == 28);

FatInspectResult decodeEntry(std::span<const std::byte, kDirEntrySize> raw,
                             const Geometry& geometry, DecodedEntry& out) {
  ShortDirectoryEntry dir;
  std::memcpy(&dir, raw.data(), sizeof(dir));

  DecodedEntry decoded;
  decoded.typeTag = dir.attributes;
  decoded.kind = classifyEntryType(dir.attributes);
  if (decoded.kind == EntryKind::Empty) {
    out = std::move(decoded);
    return FatInspectResult::Success;
  }

  decoded.name = decodeDisplayName(raw);
  decoded.deleted = static_cast<uint8_t>(dir.name[0]) == kDeletedMarker;

  if (decoded.kind == EntryKind::Directory ||
      decoded.kind == EntryKind::Other) {
    const uint32_t cluster =
        (static_cast<uint32_t>(dir.firstClusterHigh) << 16) |
        dir.firstClusterLow;
    // cluster > totalSectors / sectorsPerCluster, without truncating.
    if (static_cast<uint64_t>(cluster) * geometry.sectorsPerCluster >
        geometry.totalSectors) {
      std::println(stderr,
                   "[Directory] Entry '{}' names cluster {}, beyond the {} "
                   "sectors of the volume",
                   decoded.name, cluster, geometry.totalSectors);
      return FatInspectResult::RangeError;
    }
    decoded.contentCluster = cluster;

    if (decoded.kind == EntryKind::Other && cluster != 0) {
      decoded.fileSize = uint32_t{dir.fileSize};
    }
  }

  out = std::move(decoded);
  return FatInspectResult::Success;
}

}  // namespace fatInspect
