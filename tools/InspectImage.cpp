/// @file InspectImage.cpp
/// @brief Command-line inspector for raw FAT32 volume images.
///
/// Usage: inspect_image <path>
///
/// Opens the image read-only, prints the decoded volume geometry as a JSON
/// document and then one JSON record per directory entry, starting at the
/// root directory. Deleted entries, slack bytes and best-effort content of
/// unallocated clusters are included.
///
/// Exits 0 on success, 1 on a usage error or any failure. Failures are
/// reported on stderr; stdout only ever carries a complete report.

#include <cstdio>
#include <memory>
#include <print>
#include <string>
#include <vector>

#include "FatInspectResult.h"
#include "InspectSession.h"
#include "ReportFormat.h"

int main(int argc, char* argv[]) {
  if (argc != 2) {
    std::println(stderr, "Usage: inspect_image <path>");
    return 1;
  }

  const std::string path = argv[1];

  std::unique_ptr<fatInspect::InspectSession> session;
  if (auto result = fatInspect::InspectSession::open(path, session);
      result != FatInspectResult::Success) {
    std::println(stderr, "Error: Opening '{}' failed ({})", path,
                 fatInspect::describeResult(result));
    return 1;
  }

  // Nothing is printed until the walk has succeeded.
  std::vector<fatInspect::DirectoryEntry> entries;
  if (auto result = session->walkRoot(entries);
      result != FatInspectResult::Success) {
    std::println(stderr, "Error: Directory walk failed ({})",
                 fatInspect::describeResult(result));
    return 1;
  }

  std::println("{}", fatInspect::formatGeometry(session->geometry()));
  for (const auto& entry : entries) {
    std::println("{}", fatInspect::formatEntry(entry));
  }
  return 0;
}
