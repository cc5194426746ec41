#include "ContentExtractor.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace fatInspect {

// Bytes [begin, begin + length) of data, clipped to its end.
static std::vector<std::byte> sliceClipped(const std::vector<std::byte>& data,
                                           size_t begin, size_t length) {
  if (begin >= data.size()) {
    return {};
  }
  const size_t end = std::min(data.size(), begin + length);
  return {data.begin() + static_cast<std::ptrdiff_t>(begin),
          data.begin() + static_cast<std::ptrdiff_t>(end)};
}

FatInspectResult extractContent(const ClusterReader& reader, uint32_t cluster,
                                uint32_t fileSize, FileContent& out) {
  const size_t previewLength = std::min<size_t>(kPreviewLength, fileSize);

  ChainData chain;
  if (auto result = reader.readChain(cluster, true, chain);
      result != FatInspectResult::Success) {
    return result;
  }

  FileContent content;
  content.fileSize = fileSize;
  content.content = sliceClipped(chain.bytes, 0, previewLength);
  if (!chain.unallocated) {
    content.slack = sliceClipped(chain.bytes, fileSize, kSlackLength);
  }
  content.contentSectors = std::move(chain.sectors);

  out = std::move(content);
  return FatInspectResult::Success;
}

}  // namespace fatInspect
