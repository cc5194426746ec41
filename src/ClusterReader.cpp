#include "ClusterReader.h"

#include <print>
#include <span>
#include <utility>

namespace fatInspect {

ClusterReader::ClusterReader(const VolumeHandle& volume,
                             const Geometry& geometry,
                             const FileAllocationTable& fat)
    : volume_(volume), geometry_(geometry), fat_(fat) {}

FatInspectResult ClusterReader::readSector(uint64_t sector,
                                           std::byte* dest) const {
  const uint64_t offset = sector * geometry_.bytesPerSector;
  if (auto result =
          volume_.read(offset, std::span{dest, geometry_.bytesPerSector});
      result != FatInspectResult::Success) {
    std::println(stderr, "[ClusterReader] Failed to read sector {} (offset {})",
                 sector, offset);
    return result;
  }
  return FatInspectResult::Success;
}

FatInspectResult ClusterReader::readChain(uint32_t cluster,
                                          bool ignoreUnallocated,
                                          ChainData& out) const {
  ChainData data;
  if (auto result = fat_.resolveChain(cluster, data.sectors);
      result != FatInspectResult::Success) {
    return result;
  }

  if (data.sectors.empty()) {
    if (ignoreUnallocated) {
      if (auto result = readCluster(cluster, data.bytes);
          result != FatInspectResult::Success) {
        return result;
      }
      data.unallocated = true;
    }
    out = std::move(data);
    return FatInspectResult::Success;
  }

  // Sectors may be non-contiguous, so read them one at a time.
  data.bytes.resize(data.sectors.size() * geometry_.bytesPerSector);
  std::byte* dest = data.bytes.data();
  for (uint64_t sector : data.sectors) {
    if (auto result = readSector(sector, dest);
        result != FatInspectResult::Success) {
      return result;
    }
    dest += geometry_.bytesPerSector;
  }

  out = std::move(data);
  return FatInspectResult::Success;
}

FatInspectResult ClusterReader::readCluster(uint32_t cluster,
                                            std::vector<std::byte>& out) const {
  if (cluster < FileAllocationTable::kFirstDataCluster) {
    std::println(stderr,
                 "[ClusterReader] Cluster {} has no data-region address",
                 cluster);
    return FatInspectResult::RangeError;
  }

  const uint64_t sector = geometry_.firstSectorOfCluster(cluster);
  const uint64_t offset = sector * geometry_.bytesPerSector;
  if (auto result = volume_.read(offset, geometry_.bytesPerCluster, out);
      result != FatInspectResult::Success) {
    std::println(stderr,
                 "[ClusterReader] Failed to read unallocated cluster {} "
                 "(offset {})",
                 cluster, offset);
    return result;
  }
  return FatInspectResult::Success;
}

}  // namespace fatInspect
