/*
 * sql_rc.cc
 *
 * Implements the functions declared in sql_rc.h.
 * The functions are based on this example:
 * https://github.com/abseil/abseil-cpp/blob/master/absl/status/status.cc
 */

#include "sql_rc.h"

// Converts a ResultCode to a string.
std::string ToString(const ResultCode &code) {
  switch (code) {
    // Primary Result Code
    case ResultCode::kOk: return "OK";
    case ResultCode::kError: return "ERROR";
    case ResultCode::kInternal: return "INTERNAL";
    case ResultCode::kIOError: return "IO_ERROR";
    case ResultCode::kCorrupt: return "CORRUPT";
    case ResultCode::kFull: return "FULL";
    case ResultCode::kCantOpen: return "CANT_OPEN";
    case ResultCode::kConstraint: return "CONSTRAINT";
    case ResultCode::kMisuse: return "MISUSE";

      // Extended Result Code: IO Error
    case ResultCode::kIOErrorRead: return "IO_ERROR_READ";
    case ResultCode::kIOErrorShortRead: return "IO_ERROR_SHORT_READ";
    case ResultCode::kIOErrorWrite: return "IO_ERROR_WRITE";
    case ResultCode::kIOErrorFsync: return "IO_ERROR_FSYNC";
    case ResultCode::kIOErrorFStat: return "IO_ERROR_FSTAT";
    case ResultCode::kIOErrorClose: return "IO_ERROR_CLOSE";
    case ResultCode::kIOErrorSeek: return "IO_ERROR_SEEK";

      // Extended Result Code: Constraint
    case ResultCode::kConstraintPrimaryKey: return "CONSTRAINT_PRIMARY_KEY";

    default: return "";
  }
}

// Converts a ResultCode to a string and writes it to the given stream.
std::ostream &operator<<(std::ostream &os, const ResultCode &code) {
  return os << ToString(code);
}

// Strips the extended bits off a ResultCode.
ResultCode GetPrimaryResultCode(const ResultCode &code) {
  // Get the last 8 bits of the extended result code and cast it to a ResultCode
  return static_cast<ResultCode>(u32(code) & 0xFF);
}
