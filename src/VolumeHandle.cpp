#include "VolumeHandle.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <print>
#include <utility>

namespace fatInspect {

// -----------------------------------------------------------------------------
// Factory & Lifetime
// -----------------------------------------------------------------------------

VolumeHandle::VolumeHandle(int fd, uint64_t size, std::string path)
    : fd_(fd), size_(size), path_(std::move(path)) {}

FatInspectResult VolumeHandle::open(const std::string& path,
                                    std::optional<VolumeHandle>& out) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    int err = errno;
    std::println(stderr, "[VolumeHandle] Failed to open '{}' (errno {})", path,
                 err);
    if (err == EACCES || err == EPERM) {
      return FatInspectResult::AccessDenied;
    }
    if (err == ENOENT || err == ENOTDIR) {
      return FatInspectResult::InvalidDevice;
    }
    return FatInspectResult::IOError;
  }

  struct stat st;
  if (fstat(fd, &st) != 0) {
    std::println(stderr, "[VolumeHandle] fstat failed for '{}'", path);
    ::close(fd);
    return FatInspectResult::IOError;
  }
  if (!S_ISREG(st.st_mode)) {
    std::println(stderr, "[VolumeHandle] '{}' is not a regular file", path);
    ::close(fd);
    return FatInspectResult::InvalidDevice;
  }

  out.emplace(VolumeHandle(fd, static_cast<uint64_t>(st.st_size), path));
  return FatInspectResult::Success;
}

VolumeHandle::VolumeHandle(VolumeHandle&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      size_(other.size_),
      path_(std::move(other.path_)) {}

VolumeHandle& VolumeHandle::operator=(VolumeHandle&& other) noexcept {
  if (this != &other) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = std::exchange(other.fd_, -1);
    size_ = other.size_;
    path_ = std::move(other.path_);
  }
  return *this;
}

VolumeHandle::~VolumeHandle() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

// -----------------------------------------------------------------------------
// Positioned Reads
// -----------------------------------------------------------------------------

bool VolumeHandle::contains(uint64_t offset, uint64_t length) const {
  if (offset > size_ || length > size_ - offset) {
    std::println(stderr,
                 "[VolumeHandle] Read of {} bytes at offset {} exceeds image "
                 "size {}",
                 length, offset, size_);
    return false;
  }
  return true;
}

FatInspectResult VolumeHandle::read(uint64_t offset,
                                    std::span<std::byte> out) const {
  if (fd_ < 0) {
    return FatInspectResult::InvalidDevice;
  }
  if (!contains(offset, out.size())) {
    return FatInspectResult::IOError;
  }

  std::byte* ptr = out.data();
  size_t remaining = out.size();
  off_t position = static_cast<off_t>(offset);
  while (remaining > 0) {
    ssize_t got = pread(fd_, ptr, remaining, position);
    if (got == -1) {
      if (errno == EINTR) {
        continue;
      }
      std::println(stderr, "[VolumeHandle] pread failed at offset {} (errno {})",
                   static_cast<uint64_t>(position), errno);
      return FatInspectResult::IOError;
    }
    if (got == 0) {
      // Image shrank underneath us.
      std::println(stderr, "[VolumeHandle] Unexpected end of image at offset {}",
                   static_cast<uint64_t>(position));
      return FatInspectResult::IOError;
    }
    ptr += got;
    remaining -= static_cast<size_t>(got);
    position += got;
  }
  return FatInspectResult::Success;
}

FatInspectResult VolumeHandle::read(uint64_t offset, size_t length,
                                    std::vector<std::byte>& out) const {
  // Validate before allocating; a corrupt geometry can ask for terabytes.
  if (fd_ < 0) {
    return FatInspectResult::InvalidDevice;
  }
  if (!contains(offset, length)) {
    return FatInspectResult::IOError;
  }

  std::vector<std::byte> buffer(length);
  if (auto result = read(offset, std::span{buffer});
      result != FatInspectResult::Success) {
    return result;
  }
  out = std::move(buffer);
  return FatInspectResult::Success;
}

}  // namespace fatInspect
