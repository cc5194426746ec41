#ifndef FAT_INSPECT_FILE_ALLOCATION_TABLE_H
#define FAT_INSPECT_FILE_ALLOCATION_TABLE_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "BootSector.h"
#include "FatInspectResult.h"

namespace fatInspect {

class VolumeHandle;

// FileAllocationTable
// -------------------
// In-memory copy of FAT 0. Each 4-byte little-endian entry N describes
// cluster N:
//   0                        unallocated
//   1 .. kEndOfChainMin      next cluster in the chain
//   > kEndOfChainMin         end of chain
//
// The table is read-only once loaded. Backup FAT copies are never consulted.
class FileAllocationTable {
public:
  // Constants
  static constexpr uint32_t kEntrySize = 4;
  static constexpr uint32_t kEndOfChainMin = 0x0FFFFFF8;
  static constexpr uint32_t kBadCluster = 0x0FFFFFF7;
  static constexpr uint32_t kFirstDataCluster = 2;

  // Factory
  static FatInspectResult load(const VolumeHandle& volume,
                               const Geometry& geometry,
                               FileAllocationTable& out);

  FileAllocationTable() = default;

  // Follows the chain starting at `cluster` and appends the sector numbers of
  // every cluster in it, in traversal order. An unallocated start cluster
  // yields an empty list.
  //
  // Returns RangeError if the start cluster (or a link) indexes outside the
  // table, CorruptChain on a loop or an unfollowable link.
  FatInspectResult resolveChain(uint32_t cluster,
                                std::vector<uint64_t>& sectors) const;

  // Raw entry value. Caller must have checked hasEntry().
  uint32_t entry(uint32_t cluster) const;
  bool hasEntry(uint32_t cluster) const;

  // Accessors
  size_t sizeBytes() const { return table_.size(); }

private:
  FileAllocationTable(const Geometry& geometry, std::vector<std::byte> table);

  void appendClusterSectors(uint32_t cluster,
                            std::vector<uint64_t>& sectors) const;

  uint32_t sectorsPerCluster_ = 0;
  uint64_t dataStart_ = 0;
  std::vector<std::byte> table_;
};

}  // namespace fatInspect

#endif  // FAT_INSPECT_FILE_ALLOCATION_TABLE_H
