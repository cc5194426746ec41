#include "DirectoryWalker.h"

#include <iterator>
#include <print>
#include <span>
#include <unordered_set>
#include <utility>

#include "ContentExtractor.h"

namespace fatInspect {

DirectoryWalker::DirectoryWalker(const ClusterReader& reader)
    : reader_(reader) {}

FatInspectResult DirectoryWalker::openFrame(uint32_t cluster, std::string path,
                                            Frame& frame) const {
  ChainData chain;
  if (auto result = reader_.readChain(cluster, true, chain);
      result != FatInspectResult::Success) {
    std::println(stderr, "[Walker] Failed to read directory cluster {} ('{}')",
                 cluster, path);
    return result;
  }
  frame = Frame{cluster, std::move(path), std::move(chain), 0};
  return FatInspectResult::Success;
}

FatInspectResult DirectoryWalker::walk(
    uint32_t cluster, std::string_view parentPath,
    std::vector<DirectoryEntry>& entries) const {
  std::vector<DirectoryEntry> found;
  std::vector<Frame> stack;
  std::unordered_set<uint32_t> entered{cluster};

  Frame root;
  if (auto result = openFrame(cluster, std::string{parentPath}, root);
      result != FatInspectResult::Success) {
    return result;
  }
  stack.push_back(std::move(root));

  while (!stack.empty()) {
    Frame& frame = stack.back();

    const size_t offset = static_cast<size_t>(frame.nextEntry) * kDirEntrySize;
    if (offset + kDirEntrySize > frame.chain.bytes.size()) {
      std::println(stderr,
                   "[Walker] Directory cluster {} ends after {} entries "
                   "without an end-of-directory marker",
                   frame.cluster, frame.nextEntry);
      return FatInspectResult::FormatError;
    }

    const std::span<const std::byte, kDirEntrySize> raw{
        frame.chain.bytes.data() + offset, kDirEntrySize};

    DecodedEntry decoded;
    if (auto result = decodeEntry(raw, reader_.geometry(), decoded);
        result != FatInspectResult::Success) {
      std::println(stderr,
                   "[Walker] Bad entry {} of directory cluster {} ('{}')",
                   frame.nextEntry, frame.cluster, frame.path);
      return result;
    }
    if (decoded.kind == EntryKind::Empty) {
      stack.pop_back();
      continue;
    }

    DirectoryEntry entry;
    entry.parent = frame.path;
    entry.dirCluster = frame.cluster;
    entry.entryNum = frame.nextEntry++;
    entry.dirSectors = frame.chain.sectors;
    entry.kind = decoded.kind;
    entry.typeTag = decoded.typeTag;
    entry.name = std::move(decoded.name);
    entry.deleted = decoded.deleted;
    entry.contentCluster = decoded.contentCluster;

    if (decoded.fileSize) {
      FileContent content;
      if (auto result = extractContent(reader_, *decoded.contentCluster,
                                       *decoded.fileSize, content);
          result != FatInspectResult::Success) {
        std::println(stderr, "[Walker] Failed to recover content of '{}/{}'",
                     frame.path, entry.name);
        return result;
      }
      entry.file = std::move(content);
    }

    const bool descend = entry.kind == EntryKind::Directory &&
                         entry.name != "." && entry.name != "..";
    const std::string childPath = frame.path + "/" + entry.name;
    found.push_back(std::move(entry));

    if (!descend) {
      continue;
    }

    const uint32_t child = *found.back().contentCluster;
    if (!entered.insert(child).second) {
      std::println(stderr,
                   "[Walker] Skipping '{}': cluster {} was already walked",
                   childPath, child);
      continue;
    }

    // Invalidates `frame`.
    Frame next;
    if (auto result = openFrame(child, childPath, next);
        result != FatInspectResult::Success) {
      return result;
    }
    stack.push_back(std::move(next));
  }

  entries.insert(entries.end(), std::make_move_iterator(found.begin()),
                 std::make_move_iterator(found.end()));
  return FatInspectResult::Success;
}

}  // namespace fatInspect
