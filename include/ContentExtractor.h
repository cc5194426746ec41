#ifndef FAT_INSPECT_CONTENT_EXTRACTOR_H
#define FAT_INSPECT_CONTENT_EXTRACTOR_H

#include <cstddef>
#include <cstdint>

#include "ClusterReader.h"
#include "DirectoryEntry.h"
#include "FatInspectResult.h"

namespace fatInspect {

static constexpr size_t kPreviewLength = 128;
static constexpr size_t kSlackLength = 32;

// extractContent
// --------------
// Recovers the leading bytes of a file and the slack that follows its
// declared size.
//
// With an allocated chain:
//   content = first min(128, fileSize) bytes of the chain
//   slack   = up to 32 bytes starting at offset fileSize in the chain data
//
// With an unallocated start cluster the single cluster at its data-region
// address is read instead. The content may belong to another file, and
// there is no trustworthy end of file, so slack is left absent.
FatInspectResult extractContent(const ClusterReader& reader, uint32_t cluster,
                                uint32_t fileSize, FileContent& out);

}  // namespace fatInspect

#endif  // FAT_INSPECT_CONTENT_EXTRACTOR_H
