#ifndef FAT_INSPECT_DIRECTORY_ENTRY_H
#define FAT_INSPECT_DIRECTORY_ENTRY_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "BootSector.h"
#include "EntryClassifier.h"
#include "FatInspectResult.h"

namespace fatInspect {

// Content recovered for a file-like entry.
struct FileContent {
  uint32_t fileSize = 0;
  std::vector<uint64_t> contentSectors;
  std::vector<std::byte> content;  // preview, at most kPreviewLength bytes
  // Bytes just past the declared size in the last cluster. Absent when the
  // content came from an unallocated cluster.
  std::optional<std::vector<std::byte>> slack;
};

// One record decoded from a 32-byte directory slot, before it is placed in
// the tree.
struct DecodedEntry {
  EntryKind kind = EntryKind::Empty;
  uint8_t typeTag = 0;
  std::string name;
  bool deleted = false;
  std::optional<uint32_t> contentCluster;  // Directory and Other only
  std::optional<uint32_t> fileSize;        // Other with a content cluster
};

// A directory entry as reported by the walk.
struct DirectoryEntry {
  std::string parent;
  uint32_t dirCluster = 0;
  uint32_t entryNum = 0;
  std::vector<uint64_t> dirSectors;

  EntryKind kind = EntryKind::Empty;
  uint8_t typeTag = 0;
  std::string name;
  bool deleted = false;

  std::optional<uint32_t> contentCluster;
  std::optional<FileContent> file;  // Other entries with a content cluster
};

// decodeEntry
// -----------
// Decodes one directory slot. A slot whose attribute byte is 0x00 yields
// kind == EntryKind::Empty and nothing else is decoded.
//
// The first cluster is (DIR_firstClusterHigh << 16) | DIR_firstClusterLow.
// A value larger than totalSectors / sectorsPerCluster fails with RangeError.
FatInspectResult decodeEntry(std::span<const std::byte, kDirEntrySize> raw,
                             const Geometry& geometry, DecodedEntry& out);

}  // namespace fatInspect

#endif  // FAT_INSPECT_DIRECTORY_ENTRY_H
