#include <sys/wait.h>

#include <array>
#include <cstdio>
#include <filesystem>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "TestImageWriter.h"

namespace fs = std::filesystem;

using fatInspect::test::ImageLayout;
using fatInspect::test::TestImageWriter;
using fatInspect::test::asBytes;
using std::println;

static std::string inspectBinary;

// Helper to run shell commands and capture stdout
std::pair<int, std::string> runCommand(const std::string& cmd) {
  std::array<char, 128> buffer;
  std::string result;
  FILE* pipe = popen(cmd.c_str(), "r");

  if (!pipe) {
    throw std::runtime_error("popen() failed!");
  }

  while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
    result += buffer.data();
  }

  int status = pclose(pipe);
  int rc = -1;
  if (WIFEXITED(status)) {
    rc = WEXITSTATUS(status);
  }

  return {rc, result};
}

static std::string inspect(const std::string& args, bool mergeStderr) {
  return "\"" + inspectBinary + "\" " + args +
         (mergeStderr ? " 2>&1" : " 2>/dev/null");
}

static std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

// Root holds a volume label, a directory and a file; the directory holds a
// deleted file whose cluster has been released.
static TestImageWriter makeSampleImage(std::string_view name) {
  TestImageWriter image = TestImageWriter::make(name, ImageLayout{});
  const std::array<uint32_t, 1> root{2};
  const std::array<uint32_t, 1> docs{3};
  const std::array<uint32_t, 2> notes{4, 6};

  image.writeBootSector();
  image.linkChain(root);
  image.linkChain(docs);
  image.linkChain(notes);

  image.writeDirEntry(2, 0, "EVIDENCE", 0x08, 0, 0);
  image.writeDirEntry(2, 1, "DOCS", 0x10, 3, 0);
  image.writeDirEntry(2, 2, "NOTES   TXT", 0x20, 4, 520);
  image.writeDirEntry(3, 0, ".", 0x10, 3, 0);
  image.writeDirEntry(3, 1, "..", 0x10, 0, 0);
  image.writeDirEntry(3, 2, "\xE5" "ELETED TXT", 0x20, 9, 7);

  std::vector<std::byte> notesData(520, std::byte{'n'});
  image.writeClusterData(4, 0, notesData);
  image.writeClusterData(6, 8, asBytes("hidden-in-slack"));
  image.writeClusterData(9, 0, asBytes("removed"));
  return image;
}

// -----------------------------------------------------------------------------
// Tests
// -----------------------------------------------------------------------------

static bool testUsage() {
  auto [rc, out] = runCommand(inspect("", true));
  auto [rc2, out2] = runCommand(inspect("a.img b.img", true));
  bool passed = true;
  if (rc != 1 || out.find("Usage: inspect_image <path>") == std::string::npos) {
    println(stderr, "    [!] No-argument run: rc {} output:\n{}", rc, out);
    passed = false;
  }
  if (rc2 != 1 || out2.find("Usage:") == std::string::npos) {
    println(stderr, "    [!] Two-argument run: rc {} output:\n{}", rc2, out2);
    passed = false;
  }
  return passed;
}

static bool testFullReport() {
  TestImageWriter image = makeSampleImage("report");
  auto [rc, out] = runCommand(inspect("\"" + image.path() + "\"", false));
  if (rc != 0) {
    println(stderr, "    [!] Exit code {}", rc);
    return false;
  }

  const auto lines = splitLines(out);
  // 14 lines of geometry document + 6 entries.
  if (lines.size() != 20) {
    println(stderr, "    [!] Expected 20 lines, got {}:\n{}", lines.size(), out);
    return false;
  }

  bool passed = true;
  auto expect = [&passed](bool condition, std::string_view what) {
    if (!condition) {
      println(stderr, "    [!] {}", what);
      passed = false;
    }
  };

  expect(lines[0] == "{", "geometry opens");
  expect(lines[1] == "    \"bytes_per_sector\": 512,", "bytes_per_sector");
  expect(lines[11] == "    \"data_start\": 40,", "data_start");
  expect(lines[13] == "}", "geometry closes");

  expect(lines[14].find("\"entry_type\": \"vol\", \"name\": \"EVIDENCE\"") !=
             std::string::npos,
         "volume label first");
  expect(lines[15].find("\"name\": \"DOCS\"") != std::string::npos &&
             lines[15].find("\"content_cluster\": 3}") != std::string::npos,
         "directory second");
  expect(lines[16].find("\"parent\": \"/DOCS\"") != std::string::npos &&
             lines[16].find("\"name\": \".\"") != std::string::npos,
         "directory contents follow the directory");
  expect(lines[18].find("\"name\": \"_ELETED.TXT\", \"deleted\": true") !=
             std::string::npos,
         "deleted entry");
  expect(lines[18].find("\"content\": \"b'removed'\", \"slack\": null") !=
             std::string::npos,
         "unallocated content without slack");
  expect(lines[19].find("\"name\": \"NOTES.TXT\"") != std::string::npos &&
             lines[19].find("\"content_sectors\": [42, 44]") !=
                 std::string::npos,
         "file after the directory subtree");
  expect(lines[19].find("\"slack\": \"b'hidden-in-slack") != std::string::npos,
         "slack recovered from second cluster");
  return passed;
}

// Runs the tool on an image with the given geometry and expects a clean
// exit 1 naming the sectors_per_fat field.
static bool expectGeometryRejected(std::string_view name,
                                   const ImageLayout& layout) {
  TestImageWriter image = TestImageWriter::make(name, layout);
  image.writeBootSector();

  auto [rc, out] = runCommand(inspect("\"" + image.path() + "\"", false));
  auto [rcMerged, merged] =
      runCommand(inspect("\"" + image.path() + "\"", true));
  bool passed = true;
  if (rc != 1 || !out.empty()) {
    println(stderr, "    [!] Expected exit 1 with no stdout, rc {}:\n{}", rc,
            out);
    passed = false;
  }
  if (merged.find("Error:") == std::string::npos ||
      merged.find("offset 36") == std::string::npos) {
    println(stderr, "    [!] Missing error description:\n{}", merged);
    passed = false;
  }
  return passed;
}

static bool testDegenerateImage() {
  ImageLayout layout;
  layout.sectorsPerFat = 0;
  return expectGeometryRejected("degenerate", layout);
}

static bool testOversizedFat() {
  ImageLayout layout;
  layout.sectorsPerFat = 0xFFFFFFFF;
  return expectGeometryRejected("oversized_fat", layout);
}

static bool testMissingImage() {
  auto [rc, out] = runCommand(inspect("/nonexistent/image.img", true));
  if (rc != 1 || out.find("Error:") == std::string::npos) {
    println(stderr, "    [!] rc {} output:\n{}", rc, out);
    return false;
  }
  return true;
}

static bool testRepeatable() {
  TestImageWriter image = makeSampleImage("repeat");
  const std::string cmd = inspect("\"" + image.path() + "\"", false);
  auto [rc1, first] = runCommand(cmd);
  auto [rc2, second] = runCommand(cmd);
  if (rc1 != 0 || rc2 != 0 || first != second) {
    println(stderr, "    [!] Outputs differ or failed (rc {} / {})", rc1, rc2);
    return false;
  }
  return true;
}

int main(int argc, char* argv[]) {
  if (argc != 2) {
    println(stderr, "Usage: integration_runner <path-to-inspect_image>");
    return 1;
  }
  inspectBinary = argv[1];

  if (!fs::exists(inspectBinary)) {
    println(stderr, "Error: {} not found. Build the project first.",
            inspectBinary);
    return 1;
  }

  struct Test {
    const char* name;
    bool (*run)();
  };
  const Test tests[] = {
      {"Usage message", testUsage},
      {"Full report", testFullReport},
      {"Degenerate image", testDegenerateImage},
      {"Oversized FAT", testOversizedFat},
      {"Missing image", testMissingImage},
      {"Repeatable output", testRepeatable},
  };

  int failed = 0;
  for (const auto& test : tests) {
    println("------------------------------------------------");
    println("Running Test: {}", test.name);
    bool passed = false;
    try {
      passed = test.run();
    } catch (const std::exception& e) {
      println(stderr, "Exception: {}", e.what());
    }
    if (passed) {
      println("RESULT: [PASSED] {}", test.name);
    } else {
      println("RESULT: [FAILED] {}", test.name);
      failed++;
    }
  }

  println("------------------------------------------------");
  if (failed == 0) {
    println("ALL TESTS PASSED");
    return 0;
  }
  println("{} TEST(S) FAILED", failed);
  return 1;
}
