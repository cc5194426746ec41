#include "BootSector.h"

#include <array>
#include <cstddef>
#include <cstring>
#include <print>
#include <span>

#include "VolumeHandle.h"

namespace fatInspect {

// -----------------------------------------------------------------------------
// On-Disk Layout
// -----------------------------------------------------------------------------
//
// The leading 48 bytes of the VBR: jump, OEM name, the common BPB, and the
// FAT32 extended fields up to BPB_rootCluster. Host byte order is assumed to
// be little-endian, matching the on-disk encoding.

struct BootSectorPrefix {
  std::array<uint8_t, 3> jmpBoot;
  std::array<char, 8> oemName;
  uint16_t bytesPerSector;     // offset 11
  uint8_t sectorsPerCluster;   // offset 13
  uint16_t reservedSectors;    // offset 14
  uint8_t fatCount;            // offset 16
  uint16_t rootEntryCount;
  uint16_t totalSectors16;
  uint8_t media;
  uint16_t fatSize16;
  uint16_t sectorsPerTrack;
  uint16_t headCount;
  uint32_t hiddenSectors;
  uint32_t totalSectors32;     // offset 32
  uint32_t fatSize32;          // offset 36
  uint16_t extFlags;
  uint16_t fsVersion;
  uint32_t rootCluster;        // offset 44
} __attribute__((packed));

static_assert(sizeof(BootSectorPrefix) == 48,
              "BootSectorPrefix must be 48 bytes");
static_assert(offsetof(BootSectorPrefix, bytesPerSector) == 11);
static_assert(offsetof(BootSectorPrefix, totalSectors32) == 32);
static_assert(offsetof(BootSectorPrefix, rootCluster) == 44);

// -----------------------------------------------------------------------------
// Parsing
// -----------------------------------------------------------------------------

FatInspectResult parseBootSector(const VolumeHandle& volume,
                                 Geometry& geometry) {
  std::array<std::byte, sizeof(BootSectorPrefix)> raw;
  if (auto result = volume.read(0, std::span{raw});
      result != FatInspectResult::Success) {
    // An image too short to hold a BPB is not a FAT32 volume.
    std::println(stderr, "[BootSector] Failed to read {} BPB bytes at offset 0",
                 raw.size());
    return result == FatInspectResult::IOError ? FatInspectResult::FormatError
                                               : result;
  }

  BootSectorPrefix bpb;
  std::memcpy(&bpb, raw.data(), sizeof(bpb));

  Geometry g{};
  g.bytesPerSector = bpb.bytesPerSector;
  g.sectorsPerCluster = bpb.sectorsPerCluster;
  g.reservedSectors = bpb.reservedSectors;
  g.numberOfFats = bpb.fatCount;
  g.totalSectors = bpb.totalSectors32;
  g.sectorsPerFat = bpb.fatSize32;
  g.rootDirFirstCluster = bpb.rootCluster;

  struct Field {
    const char* name;
    uint32_t offset;
    uint32_t value;
  };
  const Field required[] = {
      {"bytes_per_sector", 11, g.bytesPerSector},
      {"sectors_per_cluster", 13, g.sectorsPerCluster},
      {"number_of_fats", 16, g.numberOfFats},
      {"total_sectors", 32, g.totalSectors},
      {"sectors_per_fat", 36, g.sectorsPerFat},
  };
  for (const auto& field : required) {
    if (field.value == 0) {
      std::println(stderr, "[BootSector] Degenerate geometry: {} (offset {}) "
                   "is zero", field.name, field.offset);
      return FatInspectResult::FormatError;
    }
  }

  g.bytesPerCluster = g.bytesPerSector * g.sectorsPerCluster;
  g.fat0SectorStart = g.reservedSectors;
  g.fat0SectorEnd = g.fat0SectorStart + g.sectorsPerFat - 1;
  g.dataStart = g.reservedSectors +
                static_cast<uint64_t>(g.sectorsPerFat) * g.numberOfFats;
  g.dataEnd = static_cast<uint64_t>(g.totalSectors) - 1;

  if (g.dataStart > g.totalSectors) {
    std::println(stderr,
                 "[BootSector] Inconsistent geometry: FAT region ends at "
                 "sector {} past total_sectors {} (offset 36)",
                 g.dataStart, g.totalSectors);
    return FatInspectResult::FormatError;
  }

  geometry = g;
  return FatInspectResult::Success;
}

}  // namespace fatInspect
