#ifndef FAT_INSPECT_REPORT_FORMAT_H
#define FAT_INSPECT_REPORT_FORMAT_H

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "BootSector.h"
#include "DirectoryEntry.h"

namespace fatInspect {

// Geometry as a JSON object, one key per line, four-space indent.
std::string formatGeometry(const Geometry& geometry);

// A directory entry as a single-line JSON object. Content and slack bytes are
// rendered with formatBytesLiteral(); absent slack is written as null.
std::string formatEntry(const DirectoryEntry& entry);

// Raw bytes as a printable literal of the form b'...'. Printable ASCII is kept,
// \t \n \r and the backslash are escaped, anything else becomes \xNN. The
// literal is single-quoted unless the data holds a ' and no ".
std::string formatBytesLiteral(std::span<const std::byte> bytes);

// JSON string literal, including the surrounding quotes. The result is pure
// ASCII: other code points become \uXXXX escapes, with surrogate pairs above
// U+FFFF.
std::string jsonQuote(std::string_view text);

}  // namespace fatInspect

#endif  // FAT_INSPECT_REPORT_FORMAT_H
