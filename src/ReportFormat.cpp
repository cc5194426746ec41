#include "ReportFormat.h"

#include <algorithm>
#include <cstdint>
#include <format>
#include <iterator>
#include <vector>

namespace fatInspect {

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

// Decodes one UTF-8 sequence at `pos` and advances past it. A malformed or
// truncated sequence yields its lead byte as a Latin-1 code point.
static uint32_t nextCodePoint(std::string_view text, size_t& pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  size_t extra = 0;
  uint32_t cp = lead;
  if (lead >= 0xF0 && lead <= 0xF4) {
    extra = 3;
    cp = lead & 0x07;
  } else if (lead >= 0xE0) {
    extra = 2;
    cp = lead & 0x0F;
  } else if (lead >= 0xC2 && lead < 0xE0) {
    extra = 1;
    cp = lead & 0x1F;
  }
  if (lead < 0xC2 || lead > 0xF4 || pos + extra >= text.size()) {
    pos++;
    return lead;
  }
  for (size_t i = 1; i <= extra; i++) {
    const auto cont = static_cast<unsigned char>(text[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      pos++;
      return lead;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }
  pos += extra + 1;
  return cp;
}

std::string jsonQuote(std::string_view text) {
  std::string out = "\"";
  auto escape = [&out](uint32_t unit) {
    std::format_to(std::back_inserter(out), "\\u{:04x}", unit);
  };

  size_t pos = 0;
  while (pos < text.size()) {
    const uint32_t cp = nextCodePoint(text, pos);
    switch (cp) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      default:
        if (cp >= 0x20 && cp < 0x7F) {
          out.push_back(static_cast<char>(cp));
        } else if (cp > 0xFFFF) {
          const uint32_t v = cp - 0x10000;
          escape(0xD800 | (v >> 10));
          escape(0xDC00 | (v & 0x3FF));
        } else {
          escape(cp);
        }
    }
  }
  out.push_back('"');
  return out;
}

std::string formatBytesLiteral(std::span<const std::byte> bytes) {
  const bool hasSingle = std::ranges::find(bytes, std::byte{'\''}) != bytes.end();
  const bool hasDouble = std::ranges::find(bytes, std::byte{'"'}) != bytes.end();
  const char quote = (hasSingle && !hasDouble) ? '"' : '\'';

  std::string out = "b";
  out.push_back(quote);
  for (std::byte b : bytes) {
    const auto u = std::to_integer<uint8_t>(b);
    if (u == static_cast<uint8_t>(quote) || u == '\\') {
      out.push_back('\\');
      out.push_back(static_cast<char>(u));
    } else if (u == '\t') {
      out += "\\t";
    } else if (u == '\n') {
      out += "\\n";
    } else if (u == '\r') {
      out += "\\r";
    } else if (u < 0x20 || u >= 0x7F) {
      std::format_to(std::back_inserter(out), "\\x{:02x}", u);
    } else {
      out.push_back(static_cast<char>(u));
    }
  }
  out.push_back(quote);
  return out;
}

static std::string formatSectorList(const std::vector<uint64_t>& sectors) {
  std::string out = "[";
  for (size_t i = 0; i < sectors.size(); i++) {
    if (i > 0) {
      out += ", ";
    }
    std::format_to(std::back_inserter(out), "{}", sectors[i]);
  }
  out.push_back(']');
  return out;
}

// -----------------------------------------------------------------------------
// Documents
// -----------------------------------------------------------------------------

std::string formatGeometry(const Geometry& geometry) {
  struct Field {
    const char* key;
    uint64_t value;
  };
  const Field fields[] = {
      {"bytes_per_sector", geometry.bytesPerSector},
      {"sectors_per_cluster", geometry.sectorsPerCluster},
      {"reserved_sectors", geometry.reservedSectors},
      {"number_of_fats", geometry.numberOfFats},
      {"total_sectors", geometry.totalSectors},
      {"sectors_per_fat", geometry.sectorsPerFat},
      {"root_dir_first_cluster", geometry.rootDirFirstCluster},
      {"bytes_per_cluster", geometry.bytesPerCluster},
      {"fat0_sector_start", geometry.fat0SectorStart},
      {"fat0_sector_end", geometry.fat0SectorEnd},
      {"data_start", geometry.dataStart},
      {"data_end", geometry.dataEnd},
  };

  std::string out = "{\n";
  for (size_t i = 0; i < std::size(fields); i++) {
    std::format_to(std::back_inserter(out), "    \"{}\": {}{}\n", fields[i].key,
                   fields[i].value, i + 1 < std::size(fields) ? "," : "");
  }
  out.push_back('}');
  return out;
}

std::string formatEntry(const DirectoryEntry& entry) {
  std::string out = "{";
  auto field = [&out](std::string_view key, std::string_view value) {
    if (out.size() > 1) {
      out += ", ";
    }
    std::format_to(std::back_inserter(out), "\"{}\": {}", key, value);
  };

  field("parent", jsonQuote(entry.parent));
  field("dir_cluster", std::format("{}", entry.dirCluster));
  field("entry_num", std::format("{}", entry.entryNum));
  field("dir_sectors", formatSectorList(entry.dirSectors));
  field("entry_type", jsonQuote(entryKindName(entry.kind)));
  field("name", jsonQuote(entry.name));
  field("deleted", entry.deleted ? "true" : "false");

  if (entry.contentCluster) {
    field("content_cluster", std::format("{}", *entry.contentCluster));
  }
  if (entry.file) {
    const FileContent& file = *entry.file;
    field("filesize", std::format("{}", file.fileSize));
    field("content_sectors", formatSectorList(file.contentSectors));
    field("content", jsonQuote(formatBytesLiteral(file.content)));
    field("slack", file.slack ? jsonQuote(formatBytesLiteral(*file.slack))
                              : std::string{"null"});
  }

  out.push_back('}');
  return out;
}

}  // namespace fatInspect
