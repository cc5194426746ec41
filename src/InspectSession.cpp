#include "InspectSession.h"

#include <memory>
#include <optional>
#include <utility>

#include "DirectoryWalker.h"

namespace fatInspect {

InspectSession::InspectSession(Token, VolumeHandle volume,
                               const Geometry& geometry,
                               FileAllocationTable fat)
    : volume_(std::move(volume)),
      geometry_(geometry),
      fat_(std::move(fat)),
      reader_(volume_, geometry_, fat_) {}

FatInspectResult InspectSession::open(const std::string& path,
                                      std::unique_ptr<InspectSession>& out) {
  std::optional<VolumeHandle> volume;
  if (auto result = VolumeHandle::open(path, volume);
      result != FatInspectResult::Success) {
    return result;
  }

  Geometry geometry;
  if (auto result = parseBootSector(*volume, geometry);
      result != FatInspectResult::Success) {
    return result;
  }

  FileAllocationTable fat;
  if (auto result = FileAllocationTable::load(*volume, geometry, fat);
      result != FatInspectResult::Success) {
    return result;
  }

  out = std::make_unique<InspectSession>(Token{}, std::move(*volume), geometry,
                                         std::move(fat));
  return FatInspectResult::Success;
}

FatInspectResult InspectSession::walkRoot(
    std::vector<DirectoryEntry>& entries) const {
  return DirectoryWalker(reader_).walk(geometry_.rootDirFirstCluster, "",
                                       entries);
}

}  // namespace fatInspect
