#ifndef FAT_INSPECT_VOLUME_HANDLE_H
#define FAT_INSPECT_VOLUME_HANDLE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "FatInspectResult.h"

namespace fatInspect {

// VolumeHandle
// ------------
// Read-only access to a raw volume image, addressed by absolute byte offset.
//
// The handle owns its file descriptor: it is closed exactly once, when the
// owning handle is destroyed. Handles can be moved but not copied.
class VolumeHandle {
public:
  // Factory
  static FatInspectResult open(const std::string& path,
                               std::optional<VolumeHandle>& out);

  VolumeHandle(VolumeHandle&& other) noexcept;
  VolumeHandle& operator=(VolumeHandle&& other) noexcept;
  VolumeHandle(const VolumeHandle&) = delete;
  VolumeHandle& operator=(const VolumeHandle&) = delete;
  ~VolumeHandle();

  // Positioned reads. Any byte outside [0, size()) fails with IOError.
  FatInspectResult read(uint64_t offset, std::span<std::byte> out) const;
  FatInspectResult read(uint64_t offset, size_t length,
                        std::vector<std::byte>& out) const;

  // Accessors
  uint64_t size() const { return size_; }
  const std::string& path() const { return path_; }

private:
  VolumeHandle(int fd, uint64_t size, std::string path);

  // True when [offset, offset + length) lies inside the image; logs otherwise.
  bool contains(uint64_t offset, uint64_t length) const;

  int fd_;
  uint64_t size_;
  std::string path_;
};

}  // namespace fatInspect

#endif  // FAT_INSPECT_VOLUME_HANDLE_H
