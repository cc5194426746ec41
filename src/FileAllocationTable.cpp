#include "FileAllocationTable.h"

#include <cstring>
#include <print>
#include <unordered_set>
#include <utility>

#include "VolumeHandle.h"

namespace fatInspect {

// -----------------------------------------------------------------------------
// Factory & Constructor
// -----------------------------------------------------------------------------

FileAllocationTable::FileAllocationTable(const Geometry& geometry,
                                         std::vector<std::byte> table)
    : sectorsPerCluster_(geometry.sectorsPerCluster),
      dataStart_(geometry.dataStart),
      table_(std::move(table)) {}

FatInspectResult FileAllocationTable::load(const VolumeHandle& volume,
                                           const Geometry& geometry,
                                           FileAllocationTable& out) {
  const uint64_t offset = geometry.fat0SectorStart * geometry.bytesPerSector;
  const size_t length =
      static_cast<size_t>(geometry.sectorsPerFat) * geometry.bytesPerSector;

  std::vector<std::byte> table;
  if (auto result = volume.read(offset, length, table);
      result != FatInspectResult::Success) {
    std::println(stderr, "[FAT] Failed to load FAT 0 ({} bytes at offset {})",
                 length, offset);
    return result;
  }

  out = FileAllocationTable(geometry, std::move(table));
  return FatInspectResult::Success;
}

// -----------------------------------------------------------------------------
// Entry Access
// -----------------------------------------------------------------------------

// An entry is addressable when its byte range lies strictly inside the table.
bool FileAllocationTable::hasEntry(uint32_t cluster) const {
  const uint64_t end = static_cast<uint64_t>(cluster) * kEntrySize + kEntrySize;
  return 0 < end && end < table_.size();
}

uint32_t FileAllocationTable::entry(uint32_t cluster) const {
  uint32_t value;
  std::memcpy(&value, table_.data() + static_cast<size_t>(cluster) * kEntrySize,
              sizeof(value));
  return value;
}

// -----------------------------------------------------------------------------
// Chain Resolution
// -----------------------------------------------------------------------------

void FileAllocationTable::appendClusterSectors(
    uint32_t cluster, std::vector<uint64_t>& sectors) const {
  const uint64_t first =
      (static_cast<uint64_t>(cluster) - kFirstDataCluster) *
          sectorsPerCluster_ +
      dataStart_;
  for (uint32_t i = 0; i < sectorsPerCluster_; i++) {
    sectors.push_back(first + i);
  }
}

FatInspectResult FileAllocationTable::resolveChain(
    uint32_t cluster, std::vector<uint64_t>& sectors) const {
  if (!hasEntry(cluster)) {
    std::println(stderr, "[FAT] Cluster {} exceeds FAT size ({} bytes)",
                 cluster, table_.size());
    return FatInspectResult::RangeError;
  }

  uint32_t value = entry(cluster);
  if (value == 0) {
    return FatInspectResult::Success;
  }
  if (cluster < kFirstDataCluster) {
    std::println(stderr, "[FAT] Cluster {} is reserved and has no data sectors",
                 cluster);
    return FatInspectResult::RangeError;
  }

  std::unordered_set<uint32_t> visited{cluster};
  appendClusterSectors(cluster, sectors);

  // Iterative walk; chains can be arbitrarily long.
  uint32_t current = cluster;
  while (value <= kEndOfChainMin) {
    if (value < kFirstDataCluster || value == kBadCluster) {
      std::println(stderr,
                   "[FAT] Cluster {} links to unfollowable value {:#010x}",
                   current, value);
      return FatInspectResult::CorruptChain;
    }
    if (!hasEntry(value)) {
      std::println(stderr, "[FAT] Cluster {} links to {} beyond FAT size",
                   current, value);
      return FatInspectResult::RangeError;
    }
    if (!visited.insert(value).second) {
      std::println(stderr, "[FAT] Chain starting at cluster {} loops back to {}",
                   cluster, value);
      return FatInspectResult::CorruptChain;
    }
    appendClusterSectors(value, sectors);
    current = value;
    value = entry(current);
  }
  return FatInspectResult::Success;
}

}  // namespace fatInspect
