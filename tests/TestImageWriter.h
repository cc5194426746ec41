#ifndef FAT_INSPECT_TEST_IMAGE_WRITER_H
#define FAT_INSPECT_TEST_IMAGE_WRITER_H

#include <sys/types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "FatInspectResult.h"

namespace fatInspect::test {

// Parameters of a synthetic FAT32 volume. The image starts at the volume's
// boot sector; there is no MBR.
struct ImageLayout {
  uint16_t bytesPerSector = 512;
  uint8_t sectorsPerCluster = 1;
  uint16_t reservedSectors = 32;
  uint8_t fatCount = 1;
  uint32_t sectorsPerFat = 8;
  uint32_t totalSectors = 64;
  uint32_t rootCluster = 2;

  uint64_t dataStartSector() const {
    return reservedSectors + static_cast<uint64_t>(sectorsPerFat) * fatCount;
  }
  uint64_t clusterOffset(uint32_t cluster) const {
    return ((static_cast<uint64_t>(cluster) - 2) * sectorsPerCluster +
            dataStartSector()) *
           bytesPerSector;
  }
};

// TestImageWriter
// ---------------
// Builds small FAT32 images on disk for exercising the reader. The image file
// is created (or truncated) to totalSectors sectors of zeros and removed when
// the writer is destroyed.
class TestImageWriter {
public:
  // Constants
  static constexpr uint32_t kEndOfChain = 0x0FFFFFFF;
  static constexpr uint32_t kMediaEntry = 0x0FFFFFF8;

  // Factory. Returns a writer whose isOpen() is false on failure.
  static TestImageWriter make(std::string_view name, const ImageLayout& layout);

  TestImageWriter(TestImageWriter&& other) noexcept;
  TestImageWriter(const TestImageWriter&) = delete;
  TestImageWriter& operator=(const TestImageWriter&) = delete;
  ~TestImageWriter();

  // Boot sector with the layout's geometry, plus FAT[0] and FAT[1].
  FatInspectResult writeBootSector();

  // Sets one entry in every FAT copy.
  FatInspectResult setFatEntry(uint32_t cluster, uint32_t value);

  // Links the clusters in order and terminates the last with kEndOfChain.
  FatInspectResult linkChain(std::span<const uint32_t> clusters);

  // Writes a short directory entry in slot `index` of the directory starting
  // at `dirCluster`. `name` is the raw 11-byte DIR_name (space padded).
  FatInspectResult writeDirEntry(uint32_t dirCluster, uint32_t index,
                                 std::string_view name, uint8_t attributes,
                                 uint32_t firstCluster, uint32_t fileSize);

  // Writes a VFAT long-name fragment (up to 13 characters) in slot `index`.
  FatInspectResult writeLongNameEntry(uint32_t dirCluster, uint32_t index,
                                      uint8_t order, std::u16string_view part);

  // Writes bytes at `offset` within a cluster's data-region address.
  FatInspectResult writeClusterData(uint32_t cluster, uint32_t offset,
                                    std::span<const std::byte> data);

  FatInspectResult writeBytes(off_t offset, std::span<const std::byte> data);

  // Accessors
  bool isOpen() const { return fd_ >= 0; }
  const std::string& path() const { return path_; }
  const ImageLayout& layout() const { return layout_; }

private:
  TestImageWriter(int fd, std::string path, const ImageLayout& layout);

  int fd_;
  std::string path_;
  ImageLayout layout_;
};

// Byte view of a string literal, without the terminating NUL.
std::span<const std::byte> asBytes(std::string_view text);

}  // namespace fatInspect::test

#endif  // FAT_INSPECT_TEST_IMAGE_WRITER_H
