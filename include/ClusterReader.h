#ifndef FAT_INSPECT_CLUSTER_READER_H
#define FAT_INSPECT_CLUSTER_READER_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "BootSector.h"
#include "FatInspectResult.h"
#include "FileAllocationTable.h"
#include "VolumeHandle.h"

namespace fatInspect {

// Raw contents of one cluster chain.
struct ChainData {
  std::vector<uint64_t> sectors;  // resolved chain; empty if unallocated
  std::vector<std::byte> bytes;   // every sector in chain order, slack included
  bool unallocated = false;       // bytes came from the direct cluster read
};

// ClusterReader
// -------------
// Reads the data behind a cluster chain. Nothing is truncated to a file size:
// the returned bytes run to the end of the last cluster.
class ClusterReader {
public:
  ClusterReader(const VolumeHandle& volume, const Geometry& geometry,
                const FileAllocationTable& fat);

  // Resolves the chain at `cluster` and concatenates its sectors.
  //
  // When the start cluster is unallocated:
  //   - ignoreUnallocated == false: no bytes are returned
  //   - ignoreUnallocated == true:  one cluster is read directly at the
  //     cluster's data-region address and `unallocated` is set. Those bytes
  //     may belong to an unrelated, previously deleted file.
  FatInspectResult readChain(uint32_t cluster, bool ignoreUnallocated,
                             ChainData& out) const;

  // Reads exactly bytesPerCluster bytes at the cluster's first sector,
  // regardless of its FAT entry.
  FatInspectResult readCluster(uint32_t cluster,
                               std::vector<std::byte>& out) const;

  const Geometry& geometry() const { return geometry_; }
  const FileAllocationTable& fat() const { return fat_; }

private:
  FatInspectResult readSector(uint64_t sector, std::byte* dest) const;

  const VolumeHandle& volume_;
  const Geometry& geometry_;
  const FileAllocationTable& fat_;
};

}  // namespace fatInspect

#endif  // FAT_INSPECT_CLUSTER_READER_H
