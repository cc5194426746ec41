#include "FatInspectResult.h"

namespace fatInspect {

const char* describeResult(FatInspectResult result) {
  switch (result) {
    case FatInspectResult::Success:
      return "success";
    case FatInspectResult::AccessDenied:
      return "access denied";
    case FatInspectResult::InvalidDevice:
      return "invalid device or image path";
    case FatInspectResult::IOError:
      return "I/O error or read past end of image";
    case FatInspectResult::FormatError:
      return "inconsistent or degenerate volume structure";
    case FatInspectResult::RangeError:
      return "cluster number or FAT index out of range";
    case FatInspectResult::CorruptChain:
      return "corrupt cluster chain";
    case FatInspectResult::UnknownError:
      break;
  }
  return "unknown error";
}

}  // namespace fatInspect
