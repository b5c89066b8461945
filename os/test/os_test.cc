#include "os.h"

#include <cstdio>

#include "gtest/gtest.h"

// Fills a page image with a repeating byte pattern
static PageImage MakePatternPage(u8 seed) {
  PageImage page{};
  for (u32 i = 0; i < kPageSize; i++) {
    page[i] = static_cast<std::byte>((seed + i) & 0xFF);
  }
  return page;
}

// Tests opening a single file for read/write access
TEST(OpenFile, SingleOpen) {
  std::string filename = "test_os_SingleOpen.db";
  std::remove(filename.c_str());
  OsFile file;
  bool read_only = true;
  ResultCode rc = file.OsOpenReadWrite(filename, read_only);
  EXPECT_EQ(ResultCode::kOk, rc);
  EXPECT_FALSE(read_only);
  EXPECT_TRUE(file.IsOpen());
  EXPECT_EQ(ResultCode::kOk, file.OsClose());
}

// Opening a path inside a directory that does not exist must fail
TEST(OpenFile, MissingDirectoryCantOpen) {
  OsFile file;
  bool read_only = false;
  ResultCode rc =
      file.OsOpenReadWrite("no_such_directory/test_os.db", read_only);
  EXPECT_EQ(ResultCode::kCantOpen, rc);
  EXPECT_FALSE(file.IsOpen());
}

// Opening an already open OsFile is a misuse
TEST(OpenFile, DoubleOpenIsMisuse) {
  std::string filename = "test_os_DoubleOpen.db";
  std::remove(filename.c_str());
  OsFile file;
  bool read_only = false;
  EXPECT_EQ(ResultCode::kOk, file.OsOpenReadWrite(filename, read_only));
  EXPECT_EQ(ResultCode::kMisuse, file.OsOpenReadWrite(filename, read_only));
  EXPECT_EQ(ResultCode::kOk, file.OsClose());
}

// Tests successfully closing an open file, twice
TEST(CloseFile, SuccessfulClose) {
  std::string filename = "test_os_SuccessfulClose.db";
  std::remove(filename.c_str());
  OsFile file;
  bool read_only = false;
  ResultCode rc = file.OsOpenReadWrite(filename, read_only);
  EXPECT_EQ(ResultCode::kOk, rc);

  rc = file.OsClose();
  EXPECT_EQ(ResultCode::kOk, rc);

  // A second close does nothing
  rc = file.OsClose();
  EXPECT_EQ(ResultCode::kOk, rc);
  EXPECT_FALSE(file.IsOpen());
}

// Tests deletion of a file and the existence check
TEST(DeleteFile, SuccessfulDelete) {
  std::string filename = "test_os_SuccessfulDelete.db";
  std::remove(filename.c_str());
  OsFile file(filename);
  EXPECT_EQ(ResultCode::kError, file.OsFileExists());

  bool read_only = false;
  EXPECT_EQ(ResultCode::kOk, file.OsOpenReadWrite(filename, read_only));
  EXPECT_EQ(ResultCode::kOk, file.OsFileExists());
  EXPECT_EQ(ResultCode::kOk, file.OsClose());

  EXPECT_EQ(ResultCode::kOk, file.OsDelete());
  EXPECT_EQ(ResultCode::kError, file.OsFileExists());
}

// Tests writing pages at different offsets and reading them back
TEST(ReadWrite, PagesRoundTripAtOffsets) {
  std::string filename = "test_os_PagesRoundTrip.db";
  std::remove(filename.c_str());
  OsFile file;
  bool read_only = false;
  ASSERT_EQ(ResultCode::kOk, file.OsOpenReadWrite(filename, read_only));

  // Step 1: Write page 1 first, then page 0
  PageImage page_0 = MakePatternPage(3);
  PageImage page_1 = MakePatternPage(77);
  EXPECT_EQ(ResultCode::kOk, file.OsSeek(kPageSize));
  EXPECT_EQ(ResultCode::kOk, file.OsWrite(page_1));
  EXPECT_EQ(ResultCode::kOk, file.OsSeek(0));
  EXPECT_EQ(ResultCode::kOk, file.OsWrite(page_0));

  // Step 2: The file now holds exactly two pages
  u64 size = 0;
  EXPECT_EQ(ResultCode::kOk, file.OsFileSize(size));
  EXPECT_EQ(2u * kPageSize, size);

  // Step 3: Read them back
  PageImage read_back{};
  EXPECT_EQ(ResultCode::kOk, file.OsSeek(kPageSize));
  EXPECT_EQ(ResultCode::kOk, file.OsRead(read_back));
  EXPECT_EQ(page_1, read_back);
  EXPECT_EQ(ResultCode::kOk, file.OsSeek(0));
  EXPECT_EQ(ResultCode::kOk, file.OsRead(read_back));
  EXPECT_EQ(page_0, read_back);

  EXPECT_EQ(ResultCode::kOk, file.OsSync());
  EXPECT_EQ(ResultCode::kOk, file.OsClose());
}

// Reading past the last whole page reports a short read
TEST(ReadWrite, ShortReadIsReported) {
  std::string filename = "test_os_ShortRead.db";
  std::remove(filename.c_str());
  OsFile file;
  bool read_only = false;
  ASSERT_EQ(ResultCode::kOk, file.OsOpenReadWrite(filename, read_only));

  PageImage page = MakePatternPage(1);
  EXPECT_EQ(ResultCode::kOk, file.OsWrite(page));
  EXPECT_EQ(ResultCode::kOk, file.OsTruncate(kPageSize / 2));

  PageImage read_back{};
  EXPECT_EQ(ResultCode::kOk, file.OsSeek(0));
  EXPECT_EQ(ResultCode::kIOErrorShortRead, file.OsRead(read_back));
  EXPECT_EQ(ResultCode::kOk, file.OsClose());
}

// Tests truncating a file and reading back its size
TEST(Truncate, SuccessfulTruncate) {
  std::string filename = "test_os_Truncate.db";
  std::remove(filename.c_str());
  OsFile file;
  bool read_only = false;
  ASSERT_EQ(ResultCode::kOk, file.OsOpenReadWrite(filename, read_only));

  EXPECT_EQ(ResultCode::kOk, file.OsTruncate(3 * kPageSize + 17));
  u64 size = 0;
  EXPECT_EQ(ResultCode::kOk, file.OsFileSize(size));
  EXPECT_EQ(3u * kPageSize + 17, size);
  EXPECT_EQ(ResultCode::kOk, file.OsClose());
}

// Operations on a file that was never opened are misuse
TEST(ClosedFile, OperationsAreMisuse) {
  OsFile file;
  PageImage page{};
  u64 size = 0;
  EXPECT_EQ(ResultCode::kMisuse, file.OsSeek(0));
  EXPECT_EQ(ResultCode::kMisuse, file.OsRead(page));
  EXPECT_EQ(ResultCode::kMisuse, file.OsWrite(page));
  EXPECT_EQ(ResultCode::kMisuse, file.OsFileSize(size));
  EXPECT_EQ(ResultCode::kMisuse, file.OsSync());
}
