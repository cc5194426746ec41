#ifndef FAT_INSPECT_ENTRY_CLASSIFIER_H
#define FAT_INSPECT_ENTRY_CLASSIFIER_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace fatInspect {

// Classification of a 32-byte directory record by its attribute byte.
enum class EntryKind {
  Volume,
  LongFileName,
  Directory,
  Other,
  Empty  // attribute byte 0x00: end of directory
};

// DIR_attributes bits.
static constexpr uint8_t kAttrVolumeId = 0x08;
static constexpr uint8_t kAttrDirectory = 0x10;
static constexpr uint8_t kAttrLongName = 0x0F;

// Directory record size and DIR_name[0] markers.
static constexpr size_t kDirEntrySize = 32;
static constexpr uint8_t kDeletedMarker = 0xE5;
static constexpr uint8_t kKanjiE5Marker = 0x05;

EntryKind classifyEntryType(uint8_t typeTag);

// Display name of a record: the UTF-8 name fragment for long-name entries,
// the trimmed label for volume entries, and "BASE.EXT" otherwise. A deleted
// record's first character is shown as '_'.
std::string decodeDisplayName(std::span<const std::byte, kDirEntrySize> raw);

// Short tag used in reports: "vol", "lfn", "dir", "other" or "0x0".
std::string_view entryKindName(EntryKind kind);

}  // namespace fatInspect

#endif  // FAT_INSPECT_ENTRY_CLASSIFIER_H
