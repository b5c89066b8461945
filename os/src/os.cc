/*
 * os.cc
 */

#include "os.h"

#if OS_UNIX
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#endif

#include "sql_trace.h"

// Default constructor for OsFile (Unix version)
#if OS_UNIX
OsFile::OsFile() {
  fd_ = -1;
  is_open_ = false;
}
#endif

// Default constructor for OsFile (Windows version)
#if OS_WIN
OsFile::OsFile() {
  h_ = INVALID_HANDLE_VALUE;
  is_open_ = false;
}
#endif

// Call OsFile() and set the filename
OsFile::OsFile(const std::string &filename) : OsFile() {
  filename_ = filename;
}

// Releases the descriptor if the owner never called OsClose(). Callers that
// care about close errors must call OsClose() themselves.
OsFile::~OsFile() {
  if (!is_open_) return;
#if OS_UNIX
  close(fd_);
#endif
#if OS_WIN
  CloseHandle(h_);
#endif
}

ResultCode OsFile::OsDelete() {
#if OS_UNIX
  if (unlink(filename_.c_str()) != 0 && errno != ENOENT) {
    return ResultCode::kIOError;
  }
#endif

#if OS_WIN
  if (!DeleteFile(filename_.c_str()) &&
      GetLastError() != ERROR_FILE_NOT_FOUND) {
    return ResultCode::kIOError;
  }
#endif

  return ResultCode::kOk;
}

// Checks if the file associated with this OsFile object exists
ResultCode OsFile::OsFileExists() {
#if OS_UNIX
  return access(filename_.c_str(), 0) == 0 ? ResultCode::kOk
                                           : ResultCode::kError;
#endif

#if OS_WIN
  return GetFileAttributes(filename_.c_str()) != 0xFFFFFFFF
             ? ResultCode::kOk
             : ResultCode::kError;
#endif
}

// Opens a file in read-write mode, setting a flag if it's opened read-only
ResultCode OsFile::OsOpenReadWrite(const std::string &filename,
                                   bool &read_only) {
  if (is_open_) return ResultCode::kMisuse;
#if OS_UNIX
  filename_ = filename;
  // The O_CREAT flag is used to create the file if it does not exist.
  fd_ = open(filename_.c_str(), O_RDWR | O_CREAT, 0644);
  if (fd_ < 0) {
    fd_ = open(filename_.c_str(), O_RDONLY);
    if (fd_ < 0) {
      return ResultCode::kCantOpen;
    }
    read_only = true;
  } else {
    read_only = false;
  }
  is_open_ = true;
  PAGEDB_TRACE3("OPEN %-3d %s\n", fd_, filename_.c_str());
  return ResultCode::kOk;
#endif

#if OS_WIN
  filename_ = filename;
  HANDLE h = CreateFile(filename_.c_str(), GENERIC_READ | GENERIC_WRITE,
                        FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr,
                        OPEN_ALWAYS,
                        FILE_ATTRIBUTE_NORMAL | FILE_FLAG_RANDOM_ACCESS,
                        nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    h = CreateFile(filename_.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr,
                   OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL | FILE_FLAG_RANDOM_ACCESS,
                   nullptr);
    if (h == INVALID_HANDLE_VALUE) {
      return ResultCode::kCantOpen;
    }
    read_only = true;
  } else {
    read_only = false;
  }
  h_ = h;
  is_open_ = true;
  return ResultCode::kOk;
#endif
}

/*
 * Reads exactly one page at the current position.
 *
 * read() may return fewer bytes than asked for, so it is called until the
 * page is full or the end of the file is hit. Hitting the end of the file
 * early is reported as kIOErrorShortRead.
 */
ResultCode OsFile::OsRead(PageImage &data) {
  if (!is_open_) return ResultCode::kMisuse;
#if OS_UNIX
  u32 got = 0;
  while (got < kPageSize) {
    ssize_t n = read(fd_, data.data() + got, kPageSize - got);
    if (n < 0) {
      if (errno == EINTR) continue;
      return ResultCode::kIOErrorRead;
    }
    if (n == 0) break;
    got += static_cast<u32>(n);
  }
  return got == kPageSize ? ResultCode::kOk : ResultCode::kIOErrorShortRead;
#endif

#if OS_WIN
  DWORD got;
  if (!ReadFile(h_, data.data(), kPageSize, &got, nullptr)) {
    return ResultCode::kIOErrorRead;
  }
  return (u32)got == kPageSize ? ResultCode::kOk
                               : ResultCode::kIOErrorShortRead;
#endif
}

/*
 * Writes exactly one page at the current position.
 *
 * Any write that cannot be completed is reported as kIOErrorWrite.
 */
ResultCode OsFile::OsWrite(const PageImage &data) {
  if (!is_open_) return ResultCode::kMisuse;
#if OS_UNIX
  u32 wrote = 0;
  while (wrote < kPageSize) {
    ssize_t n = write(fd_, data.data() + wrote, kPageSize - wrote);
    if (n < 0) {
      if (errno == EINTR) continue;
      return ResultCode::kIOErrorWrite;
    }
    if (n == 0) return ResultCode::kIOErrorWrite;
    wrote += static_cast<u32>(n);
  }
  return ResultCode::kOk;
#endif

#if OS_WIN
  DWORD wrote;
  if (!WriteFile(h_, data.data(), kPageSize, &wrote, nullptr)) {
    return ResultCode::kIOErrorWrite;
  }
  return (u32)wrote == kPageSize ? ResultCode::kOk : ResultCode::kIOErrorWrite;
#endif
}

// Closes the file associated with this OsFile object
ResultCode OsFile::OsClose() {
  if (!is_open_) return ResultCode::kOk;
  is_open_ = false;

#if OS_UNIX
  PAGEDB_TRACE2("CLOSE %-3d\n", fd_);
  int fd = fd_;
  fd_ = -1;
  if (close(fd) != 0) {
    return ResultCode::kIOErrorClose;
  }
#endif

#if OS_WIN
  HANDLE h = h_;
  h_ = INVALID_HANDLE_VALUE;
  if (!CloseHandle(h)) {
    return ResultCode::kIOErrorClose;
  }
#endif
  return ResultCode::kOk;
}

// Seeks to a specific offset in the file
ResultCode OsFile::OsSeek(u64 offset) {
  if (!is_open_) return ResultCode::kMisuse;

#if OS_UNIX
  if (lseek(fd_, static_cast<off_t>(offset), SEEK_SET) < 0) {
    return ResultCode::kIOErrorSeek;
  }
#endif

#if OS_WIN
  LARGE_INTEGER distance;
  distance.QuadPart = static_cast<LONGLONG>(offset);
  if (!SetFilePointerEx(h_, distance, nullptr, FILE_BEGIN)) {
    return ResultCode::kIOErrorSeek;
  }
#endif
  return ResultCode::kOk;
}

// Synchronizes the file's in-memory state with the storage device
ResultCode OsFile::OsSync() {
  if (!is_open_) return ResultCode::kMisuse;
#if OS_UNIX
  return fsync(fd_) == 0 ? ResultCode::kOk : ResultCode::kIOErrorFsync;
#endif

#if OS_WIN
  return FlushFileBuffers(h_) ? ResultCode::kOk : ResultCode::kIOErrorFsync;
#endif
}

// Truncates the file to a specified size
ResultCode OsFile::OsTruncate(u64 size) {
  if (!is_open_) return ResultCode::kMisuse;
#if OS_UNIX
  return ftruncate(fd_, static_cast<off_t>(size)) == 0 ? ResultCode::kOk
                                                       : ResultCode::kIOError;
#endif

#if OS_WIN
  ResultCode rc = OsSeek(size);
  if (rc != ResultCode::kOk) return rc;
  return SetEndOfFile(h_) ? ResultCode::kOk : ResultCode::kIOError;
#endif
}

// Gets the size of the file
ResultCode OsFile::OsFileSize(u64 &size) {
  if (!is_open_) return ResultCode::kMisuse;
#if OS_UNIX
  struct stat buf {};
  if (fstat(fd_, &buf) != 0) {
    return ResultCode::kIOErrorFStat;
  }
  size = static_cast<u64>(buf.st_size);
  return ResultCode::kOk;
#endif

#if OS_WIN
  LARGE_INTEGER file_size;
  if (!GetFileSizeEx(h_, &file_size)) {
    return ResultCode::kIOErrorFStat;
  }
  size = static_cast<u64>(file_size.QuadPart);
  return ResultCode::kOk;
#endif
}
