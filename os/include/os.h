#pragma once

/*
 * os.h
 *
 * This file is the header file containing the OsFile class definition.
 *
 * The OsFile class represents the database file operated on by the Pager.
 * All the operations on the file are represented by member functions of the
 * class, and every one of them reports its outcome as a ResultCode.
 *
 * In UNIX, files are opened using the open() system call, and are closed using
 * the close() system call. The file descriptor (the fd_ private variable) is
 * used to refer to the file.
 *
 * In Windows, files are opened using the CreateFile() function, and are closed
 * using the CloseHandle() function.
 *
 * There is no file locking. A database file is only ever driven by one
 * process and one thread at a time.
 */

#include <array>
#include <cstddef>
#include <string>

#include "sql_int.h"
#include "sql_limit.h"
#include "sql_rc.h"

#ifndef OS_UNIX
#ifndef OS_WIN
#if defined(_WIN32) || defined(WIN32) || defined(__CYGWIN__) || \
    defined(__MINGW32__) || defined(__BORLANDC__)
#define OS_WIN 1
#define OS_UNIX 0
#else
#define OS_WIN 0
#define OS_UNIX 1
#endif
#else
#define OS_UNIX 0
#endif
#endif
#ifndef OS_WIN
#define OS_WIN 0
#endif

#if OS_WIN
#include "windows.h"
#endif

// The byte image of one page, the unit of every read and write
using PageImage = std::array<std::byte, kPageSize>;

class OsFile {
 private:
  bool is_open_;         /* True between a successful open and OsClose() */
  std::string filename_; /* Name of the file */

#if OS_UNIX
  int fd_; /* The file descriptor */
#endif

#if OS_WIN
  HANDLE h_; /* Handle for accessing the file */
#endif

 public:
  OsFile();                                      // Constructor 1
  explicit OsFile(const std::string &filename);  // Constructor 2
  ~OsFile();

  OsFile(const OsFile &) = delete;
  OsFile &operator=(const OsFile &) = delete;

  // File operations
  ResultCode OsDelete();

  ResultCode OsFileExists();

  ResultCode OsOpenReadWrite(const std::string &filename, bool &read_only);

  ResultCode OsRead(PageImage &data);

  ResultCode OsWrite(const PageImage &data);

  ResultCode OsClose();

  ResultCode OsSeek(u64 offset);

  ResultCode OsSync();

  ResultCode OsTruncate(u64 size);

  ResultCode OsFileSize(u64 &size);

  [[nodiscard]] bool IsOpen() const { return is_open_; }
};
