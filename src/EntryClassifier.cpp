#include "EntryClassifier.h"

#include <algorithm>
#include <array>
#include <cstring>

namespace fatInspect {

// -----------------------------------------------------------------------------
// Long File Name Record
// -----------------------------------------------------------------------------
//
// A VFAT long-name fragment occupies a full directory slot. It stores up to
// 13 UTF-16LE code units split across three fields; the attribute byte sits
// at the same offset (11) as in a short entry and is always 0x0F. The name
// fields are kept as raw bytes since they are not 2-byte aligned.

struct LongNameEntry {
  uint8_t order;
  std::array<uint8_t, 10> name1;  // offset 1
  uint8_t attributes;             // offset 11
  uint8_t type;
  uint8_t checksum;
  std::array<uint8_t, 12> name2;  // offset 14
  uint16_t firstClusterLow;
  std::array<uint8_t, 4> name3;   // offset 28
} __attribute__((packed));

static_assert(sizeof(LongNameEntry) == kDirEntrySize,
              "LongNameEntry must be 32 bytes");

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

static void appendUtf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

static std::string decodeLongName(const LongNameEntry& lfn) {
  std::array<uint8_t, 26> bytes;
  auto next = std::copy(lfn.name1.begin(), lfn.name1.end(), bytes.begin());
  next = std::copy(lfn.name2.begin(), lfn.name2.end(), next);
  std::copy(lfn.name3.begin(), lfn.name3.end(), next);

  std::array<uint16_t, 13> units;
  for (size_t i = 0; i < units.size(); i++) {
    units[i] = static_cast<uint16_t>(bytes[2 * i] | (bytes[2 * i + 1] << 8));
  }

  std::string out;
  for (size_t i = 0; i < units.size(); i++) {
    uint32_t unit = units[i];
    if (unit == 0x0000) {
      break;
    }
    if (unit == 0xFFFF) {
      continue;
    }
    // Surrogate pairs can straddle fields but never fragments.
    if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < units.size() &&
        units[i + 1] >= 0xDC00 && units[i + 1] <= 0xDFFF) {
      uint32_t low = units[++i];
      appendUtf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
      continue;
    }
    if (unit >= 0xD800 && unit <= 0xDFFF) {
      appendUtf8(out, 0xFFFD);
      continue;
    }
    appendUtf8(out, unit);
  }
  return out;
}

static std::string_view trimTrailingSpaces(std::string_view s) {
  size_t end = s.find_last_not_of(' ');
  return end == std::string_view::npos ? std::string_view{}
                                       : s.substr(0, end + 1);
}

// -----------------------------------------------------------------------------
// Public Functions
// -----------------------------------------------------------------------------

EntryKind classifyEntryType(uint8_t typeTag) {
  if (typeTag == 0x00) {
    return EntryKind::Empty;
  }
  if ((typeTag & kAttrLongName) == kAttrLongName) {
    return EntryKind::LongFileName;
  }
  if (typeTag & kAttrDirectory) {
    return EntryKind::Directory;
  }
  if (typeTag & kAttrVolumeId) {
    return EntryKind::Volume;
  }
  return EntryKind::Other;
}

std::string decodeDisplayName(std::span<const std::byte, kDirEntrySize> raw) {
  const uint8_t tag = std::to_integer<uint8_t>(raw[11]);
  const EntryKind kind = classifyEntryType(tag);

  if (kind == EntryKind::LongFileName) {
    LongNameEntry lfn;
    std::memcpy(&lfn, raw.data(), sizeof(lfn));
    return decodeLongName(lfn);
  }

  std::array<char, 11> name;
  std::memcpy(name.data(), raw.data(), name.size());

  if (kind == EntryKind::Volume) {
    return std::string{trimTrailingSpaces({name.data(), name.size()})};
  }

  const auto first = static_cast<uint8_t>(name[0]);
  if (first == kDeletedMarker) {
    name[0] = '_';
  } else if (first == kKanjiE5Marker) {
    name[0] = static_cast<char>(kDeletedMarker);
  }

  std::string out{trimTrailingSpaces({name.data(), 8})};
  std::string_view ext = trimTrailingSpaces({name.data() + 8, 3});
  if (!ext.empty()) {
    out.push_back('.');
    out.append(ext);
  }
  return out;
}

std::string_view entryKindName(EntryKind kind) {
  switch (kind) {
    case EntryKind::Volume:
      return "vol";
    case EntryKind::LongFileName:
      return "lfn";
    case EntryKind::Directory:
      return "dir";
    case EntryKind::Other:
      return "other";
    case EntryKind::Empty:
      break;
  }
  return "0x0";
}

}  // namespace fatInspect
