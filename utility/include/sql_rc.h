/*
 * sql_rc.h
 *
 * This file contains result code for PageDB
 */

#pragma once

#include <exception>
#include <ostream>
#include <string>

#include "sql_int.h"

/*
 * ResultCode
 *
 * An enumerated type indicating the result code of
 * function calls in PageDB.
 *
 * The codes follow sqlite's primary result code list:
 * https://www.sqlite.org/rescode.html
 * Only the codes the engine can actually produce are kept.
 *
 * The last 8 bits are the primary result code, and the upper bits hold the
 * extended result code. kIOErrorShortRead is kIOError | (2<<8), so the
 * primary result code can always be recovered with GetPrimaryResultCode().
 *
 * Every runtime operation returns a result code. Exceptions are only thrown
 * from constructors (see DbException below).
 */
enum class ResultCode : u32 {
  // Primary Result Code
  kOk = 0,           // Successful result
  kError = 1,        // Generic error
  kInternal = 2,     // Internal logic error in PageDB
  kIOError = 10,     // Some kind of disk I/O error occurred
  kCorrupt = 11,     // The database disk image is malformed
  kFull = 13,        // The page table is exhausted, the table is full
  kCantOpen = 14,    // Unable to open the database file
  kConstraint = 19,  // Abort due to constraint violation
  kMisuse = 21,      // Library used incorrectly

  // Extended Result Code: IOError
  kIOErrorRead = ResultCode::kIOError | (1 << 8),        // 266
  kIOErrorShortRead = ResultCode::kIOError | (2 << 8),   // 522
  kIOErrorWrite = ResultCode::kIOError | (3 << 8),       // 778
  kIOErrorFsync = ResultCode::kIOError | (4 << 8),       // 1034
  kIOErrorFStat = ResultCode::kIOError | (7 << 8),       // 1802
  kIOErrorClose = ResultCode::kIOError | (16 << 8),      // 4106
  kIOErrorSeek = ResultCode::kIOError | (22 << 8),       // 5642

  // Extended Result Code: Constraint
  kConstraintPrimaryKey = ResultCode::kConstraint | (6 << 8),  // 1555
};

/*
 * ToString(const ResultCode &code)
 * Returns the name for the result code, or "" if it is an unknown value.
 */
std::string ToString(const ResultCode &code);

/*
 * operator<<
 * Streams ToString(code) to `os`.
 */
std::ostream &operator<<(std::ostream &os, const ResultCode &code);

/*
 * GetPrimaryResultCode(const ResultCode &code)
 * Returns the primary result code for the extended result code.
 */
ResultCode GetPrimaryResultCode(const ResultCode &code);

/*
 * DbException
 *
 * Thrown by constructors that acquire resources (Pager, Table) when they
 * cannot produce a usable object. Everything else reports a ResultCode.
 */
class DbException : public std::exception {
 public:
  explicit DbException(ResultCode code)
      : code_(code), message_("PageDB error: " + ToString(code)) {}

  ResultCode code() const { return code_; }

  const char *what() const noexcept override { return message_.c_str(); }

 private:
  ResultCode code_;
  std::string message_;
};
