#ifndef FAT_INSPECT_RESULT_H
#define FAT_INSPECT_RESULT_H

/**
 * @brief Result codes for FAT32 image inspection operations.
 */
enum class FatInspectResult {
  Success = 0,
  AccessDenied,
  InvalidDevice,
  IOError,
  FormatError,
  RangeError,
  CorruptChain,
  UnknownError
};

namespace fatInspect {

// Fixed description for a result code, suitable for user-facing messages.
const char* describeResult(FatInspectResult result);

}  // namespace fatInspect

#endif  // FAT_INSPECT_RESULT_H
