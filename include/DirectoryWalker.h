#ifndef FAT_INSPECT_DIRECTORY_WALKER_H
#define FAT_INSPECT_DIRECTORY_WALKER_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "ClusterReader.h"
#include "DirectoryEntry.h"
#include "FatInspectResult.h"

namespace fatInspect {

// DirectoryWalker
// ---------------
// Enumerates a directory tree into a flat, pre-order list: each
// subdirectory's entries follow immediately after the entry naming it.
//
// Directories are scanned slot by slot until a slot with attribute byte 0x00
// is found. Nesting is tracked on an explicit stack, so deep trees do not
// grow the call stack. A directory cluster is entered at most once per walk;
// an entry that leads back to an already-entered cluster is still reported
// but not descended into.
//
// Any failure aborts the walk and leaves `entries` untouched.
class DirectoryWalker {
public:
  explicit DirectoryWalker(const ClusterReader& reader);

  FatInspectResult walk(uint32_t cluster, std::string_view parentPath,
                        std::vector<DirectoryEntry>& entries) const;

private:
  struct Frame {
    uint32_t cluster;
    std::string path;
    ChainData chain;
    uint32_t nextEntry;
  };

  FatInspectResult openFrame(uint32_t cluster, std::string path,
                             Frame& frame) const;

  const ClusterReader& reader_;
};

}  // namespace fatInspect

#endif  // FAT_INSPECT_DIRECTORY_WALKER_H
