// =============================================================================
// BootSector.h
// =============================================================================
//
// Volume geometry decoded from the FAT32 boot sector.
//
// The boot sector (Volume Boot Record) is the first sector of the volume. Its
// BIOS Parameter Block describes every quantity needed for address
// arithmetic: sector size, cluster size, where the FAT region starts, how
// large each FAT copy is and where the data region begins.
//
// Only the seven fields needed to walk the filesystem are decoded:
//
//   Offset  Size  Field
//   ------  ----  ------------------------------
//   11      2     BPB_bytesPerSector
//   13      1     BPB_sectorsPerCluster
//   14      2     BPB_reservedSectorCount
//   16      1     BPB_fatCount
//   32      4     BPB_totalSectors32
//   36      4     BPB_fatSize32
//   44      4     BPB_rootCluster
//
// All values are little-endian. The image is assumed to start at the volume's
// first sector; partition tables are not interpreted.
//
// =============================================================================

#ifndef FAT_INSPECT_BOOT_SECTOR_H
#define FAT_INSPECT_BOOT_SECTOR_H

#include <cstdint>

#include "FatInspectResult.h"

namespace fatInspect {

class VolumeHandle;

struct Geometry {
  // Fields read directly from the BIOS Parameter Block.
  uint32_t bytesPerSector;
  uint32_t sectorsPerCluster;
  uint32_t reservedSectors;
  uint32_t numberOfFats;
  uint32_t totalSectors;
  uint32_t sectorsPerFat;
  uint32_t rootDirFirstCluster;

  // Derived once at parse time.
  uint32_t bytesPerCluster;
  uint64_t fat0SectorStart;
  uint64_t fat0SectorEnd;
  uint64_t dataStart;
  uint64_t dataEnd;

  // Sector address arithmetic for data clusters. Cluster numbering starts at
  // 2; callers must not pass 0 or 1.
  uint64_t firstSectorOfCluster(uint32_t cluster) const {
    return (static_cast<uint64_t>(cluster) - 2) * sectorsPerCluster +
           dataStart;
  }
  uint64_t lastSectorOfCluster(uint32_t cluster) const {
    return firstSectorOfCluster(cluster) + sectorsPerCluster - 1;
  }
};

// parseBootSector
// ---------------
// Decodes the BPB at the start of the image and computes the derived layout.
//
// Returns:
//   Success      on a usable geometry
//   IOError      if the image is shorter than the BPB
//   FormatError  if any of bytesPerSector, sectorsPerCluster, numberOfFats,
//                totalSectors or sectorsPerFat is zero
FatInspectResult parseBootSector(const VolumeHandle& volume,
                                 Geometry& geometry);

}  // namespace fatInspect

#endif  // FAT_INSPECT_BOOT_SECTOR_H
