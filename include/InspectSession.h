#ifndef FAT_INSPECT_INSPECT_SESSION_H
#define FAT_INSPECT_INSPECT_SESSION_H

#include <memory>
#include <string>
#include <vector>

#include "BootSector.h"
#include "ClusterReader.h"
#include "DirectoryEntry.h"
#include "FatInspectResult.h"
#include "FileAllocationTable.h"
#include "VolumeHandle.h"

namespace fatInspect {

// InspectSession
// --------------
// One open image together with the state decoded from it. The session owns
// the volume handle; geometry and FAT are loaded once in open() and are
// read-only afterwards. Components receive references to them, so the
// session must outlive every reader or walker built from it.
class InspectSession {
  // Restricts construction to open() while keeping the constructor public.
  struct Token {
    explicit Token() = default;
  };

public:
  // Factory: opens the image, parses the boot sector and loads FAT 0.
  static FatInspectResult open(const std::string& path,
                               std::unique_ptr<InspectSession>& out);

  InspectSession(Token, VolumeHandle volume, const Geometry& geometry,
                 FileAllocationTable fat);

  InspectSession(const InspectSession&) = delete;
  InspectSession& operator=(const InspectSession&) = delete;

  // Walks the tree starting at the root directory's first cluster.
  FatInspectResult walkRoot(std::vector<DirectoryEntry>& entries) const;

  // Accessors
  const VolumeHandle& volume() const { return volume_; }
  const Geometry& geometry() const { return geometry_; }
  const FileAllocationTable& fat() const { return fat_; }
  const ClusterReader& reader() const { return reader_; }

private:
  VolumeHandle volume_;
  Geometry geometry_;
  FileAllocationTable fat_;
  ClusterReader reader_;
};

}  // namespace fatInspect

#endif  // FAT_INSPECT_INSPECT_SESSION_H
