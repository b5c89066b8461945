#include "pager.h"

#include <cstdio>
#include <cstring>
#include <fstream>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include "gtest/gtest.h"
#include "os.h"

// Returns the size of a file on disk, or -1 if it cannot be opened
static long long PagerTestFileSize(const std::string &filename) {
  std::ifstream file(filename, std::ios::binary | std::ios::ate);
  if (!file.is_open()) return -1;
  return static_cast<long long>(file.tellg());
}

// The byte values of "Page One"
static const std::vector<std::byte> kPageOneBytes = {
    std::byte(0x50), std::byte(0x61), std::byte(0x67), std::byte(0x65),
    std::byte(0x20), std::byte(0x4f), std::byte(0x6e), std::byte(0x65)};

// The byte values of "Page Two"
static const std::vector<std::byte> kPageTwoBytes = {
    std::byte(0x50), std::byte(0x61), std::byte(0x67), std::byte(0x65),
    std::byte(0x20), std::byte(0x54), std::byte(0x77), std::byte(0x6f)};

TEST(PagerOpenTest, NewFileHasNoPages) {
  std::string filename = "test_pager_NewFileHasNoPages.db";
  std::remove(filename.c_str());

  Pager pager(filename);
  EXPECT_TRUE(pager.PagerIsOpen());
  EXPECT_EQ(0u, pager.PagerPageCount());
  EXPECT_EQ(0u, pager.PagerGetUnusedPageNumber());
  EXPECT_EQ(kTableMaxPages, pager.PagerMaxPages());
  EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
  EXPECT_FALSE(pager.PagerIsOpen());
}

TEST(PagerOpenTest, PartialPageFileIsCorrupt) {
  std::string filename = "test_pager_PartialPageFileIsCorrupt.db";
  std::remove(filename.c_str());

  // Step 1: Create a file that is one and a half pages long
  {
    OsFile file;
    bool read_only = false;
    ASSERT_EQ(ResultCode::kOk, file.OsOpenReadWrite(filename, read_only));
    ASSERT_EQ(ResultCode::kOk, file.OsTruncate(kPageSize + kPageSize / 2));
    ASSERT_EQ(ResultCode::kOk, file.OsClose());
  }

  // Step 2: Opening a Pager on it must fail with kCorrupt
  try {
    Pager pager(filename);
    FAIL() << "Expected DbException";
  } catch (const DbException &e) {
    EXPECT_EQ(ResultCode::kCorrupt, e.code());
  }
}

TEST(PagerOpenTest, UnopenableFileThrowsCantOpen) {
  try {
    Pager pager("no_such_directory/test_pager.db");
    FAIL() << "Expected DbException";
  } catch (const DbException &e) {
    EXPECT_EQ(ResultCode::kCantOpen, e.code());
  }
}

TEST(PagerOpenTest, FileLargerThanPageTableIsFull) {
  std::string filename = "test_pager_FileLargerThanPageTable.db";
  std::remove(filename.c_str());
  {
    OsFile file;
    bool read_only = false;
    ASSERT_EQ(ResultCode::kOk, file.OsOpenReadWrite(filename, read_only));
    ASSERT_EQ(ResultCode::kOk, file.OsTruncate(5 * kPageSize));
    ASSERT_EQ(ResultCode::kOk, file.OsClose());
  }
  EXPECT_THROW({ Pager pager(filename, 4); }, DbException);
}

// A directory can be opened, but only for reading
TEST(PagerOpenTest, DirectoryThrowsCantOpen) {
  std::string dirname = "test_pager_Directory.db";
  rmdir(dirname.c_str());
  ASSERT_EQ(0, mkdir(dirname.c_str(), 0755));
  try {
    Pager pager(dirname);
    FAIL() << "Expected DbException";
  } catch (const DbException &e) {
    EXPECT_EQ(ResultCode::kCantOpen, e.code());
  }
  rmdir(dirname.c_str());
}

TEST(PagerOpenTest, ReadOnlyFileThrowsCantOpen) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "root can write to a read-only file";
  }
  std::string filename = "test_pager_ReadOnlyFile.db";
  chmod(filename.c_str(), 0644);
  std::remove(filename.c_str());
  {
    Pager pager(filename, 10);
    BasePage *p_base_page = nullptr;
    ASSERT_EQ(ResultCode::kOk,
              pager.PagerGet(0, &p_base_page, SampleMemPage::create));
    ASSERT_EQ(ResultCode::kOk, pager.PagerClose());
  }
  ASSERT_EQ(0, chmod(filename.c_str(), 0444));

  try {
    Pager pager(filename, 10);
    FAIL() << "Expected DbException";
  } catch (const DbException &e) {
    EXPECT_EQ(ResultCode::kCantOpen, e.code());
  }
  chmod(filename.c_str(), 0644);
  std::remove(filename.c_str());
}

TEST(PagerGetTest, NewPagesAreZeroFilledAndExtendCount) {
  std::string filename = "test_pager_NewPagesAreZeroFilled.db";
  std::remove(filename.c_str());
  Pager pager(filename, 10);

  BasePage *p_base_page = nullptr;
  ResultCode rc = pager.PagerGet(2, &p_base_page, SampleMemPage::create);
  ASSERT_EQ(ResultCode::kOk, rc);
  ASSERT_NE(nullptr, p_base_page);
  EXPECT_EQ(2u, p_base_page->GetPageNumber());
  for (std::byte b : *p_base_page->p_image_) {
    ASSERT_EQ(std::byte{0}, b);
  }

  // Requesting page 2 makes pages 0..2 part of the file
  EXPECT_EQ(3u, pager.PagerPageCount());
  EXPECT_EQ(3u, pager.PagerGetUnusedPageNumber());
  EXPECT_TRUE(pager.PagerIsCached(2));
  EXPECT_FALSE(pager.PagerIsCached(0));
  EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
}

TEST(PagerGetTest, CacheHitReturnsSamePage) {
  std::string filename = "test_pager_CacheHit.db";
  std::remove(filename.c_str());
  Pager pager(filename, 10);

  BasePage *p_first = nullptr;
  BasePage *p_second = nullptr;
  ASSERT_EQ(ResultCode::kOk, pager.PagerGet(0, &p_first, SampleMemPage::create));
  std::memcpy(p_first->p_image_->data(), kPageOneBytes.data(),
              kPageOneBytes.size());
  ASSERT_EQ(ResultCode::kOk,
            pager.PagerGet(0, &p_second, SampleMemPage::create));

  EXPECT_EQ(p_first, p_second);
  EXPECT_EQ(1u, pager.PagerNumMisses());
  EXPECT_EQ(1u, pager.PagerNumHits());
  EXPECT_EQ(0, std::memcmp(p_second->p_image_->data(), kPageOneBytes.data(),
                           kPageOneBytes.size()));
  EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
}

TEST(PagerGetTest, PageBeyondCapacityIsFull) {
  std::string filename = "test_pager_PageBeyondCapacity.db";
  std::remove(filename.c_str());
  Pager pager(filename, 3);

  BasePage *p_base_page = nullptr;
  EXPECT_EQ(ResultCode::kOk,
            pager.PagerGet(2, &p_base_page, SampleMemPage::create));
  EXPECT_EQ(ResultCode::kFull,
            pager.PagerGet(3, &p_base_page, SampleMemPage::create));
  // The failed request must not have extended the page count
  EXPECT_EQ(3u, pager.PagerPageCount());
  EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
}

TEST(PagerGetTest, GetAfterCloseIsMisuse) {
  std::string filename = "test_pager_GetAfterClose.db";
  std::remove(filename.c_str());
  Pager pager(filename, 10);
  ASSERT_EQ(ResultCode::kOk, pager.PagerClose());

  BasePage *p_base_page = nullptr;
  EXPECT_EQ(ResultCode::kMisuse,
            pager.PagerGet(0, &p_base_page, SampleMemPage::create));
  // Closing twice is harmless
  EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
}

/*
 * The file shrinks behind the Pager's back, so the second page is only
 * partly there when it is first read.
 */
TEST(PagerGetTest, ShortReadIsIOError) {
  std::string filename = "test_pager_ShortRead.db";
  std::remove(filename.c_str());
  {
    Pager pager(filename, 10);
    BasePage *p_base_page = nullptr;
    ASSERT_EQ(ResultCode::kOk,
              pager.PagerGet(1, &p_base_page, SampleMemPage::create));
    ASSERT_EQ(ResultCode::kOk, pager.PagerClose());
  }

  // Step 1: Open the two page file
  Pager pager(filename, 10);
  ASSERT_EQ(2u, pager.PagerPageCount());

  // Step 2: Cut it down through a second handle
  {
    OsFile file;
    bool read_only = false;
    ASSERT_EQ(ResultCode::kOk, file.OsOpenReadWrite(filename, read_only));
    ASSERT_EQ(ResultCode::kOk, file.OsTruncate(kPageSize + 10));
    ASSERT_EQ(ResultCode::kOk, file.OsClose());
  }

  // Step 3: The first page still reads, the second does not
  BasePage *p_base_page = nullptr;
  EXPECT_EQ(ResultCode::kOk,
            pager.PagerGet(0, &p_base_page, SampleMemPage::create));
  EXPECT_EQ(ResultCode::kIOErrorShortRead,
            pager.PagerGet(1, &p_base_page, SampleMemPage::create));
  EXPECT_FALSE(pager.PagerIsCached(1));
  EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
}

TEST(PagerFlushTest, FlushOfUncachedPageIsMisuse) {
  std::string filename = "test_pager_FlushUncached.db";
  std::remove(filename.c_str());
  Pager pager(filename, 10);
  EXPECT_EQ(ResultCode::kMisuse, pager.PagerFlush(0));
  EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
}

/*
 * Writes two pages, closes the Pager and checks that a new Pager reads
 * the same bytes back from the file.
 */
TEST(PagerCloseTest, PagesSurviveReopen) {
  std::string filename = "test_pager_PagesSurviveReopen.db";
  std::remove(filename.c_str());

  // Step 1: Write "Page One" to page 0 and "Page Two" to page 1
  {
    Pager pager(filename, 10);
    BasePage *p_base_page = nullptr;
    ASSERT_EQ(ResultCode::kOk,
              pager.PagerGet(0, &p_base_page, SampleMemPage::create));
    std::memcpy(p_base_page->p_image_->data(), kPageOneBytes.data(),
                kPageOneBytes.size());
    ASSERT_EQ(ResultCode::kOk,
              pager.PagerGet(1, &p_base_page, SampleMemPage::create));
    std::memcpy(p_base_page->p_image_->data(), kPageTwoBytes.data(),
                kPageTwoBytes.size());
    EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
  }

  // Step 2: The file holds exactly two pages
  EXPECT_EQ(2 * static_cast<long long>(kPageSize),
            PagerTestFileSize(filename));

  // Step 3: Read the pages back through a fresh Pager
  Pager pager(filename, 10);
  EXPECT_EQ(2u, pager.PagerPageCount());
  BasePage *p_base_page = nullptr;
  ASSERT_EQ(ResultCode::kOk,
            pager.PagerGet(1, &p_base_page, SampleMemPage::create));
  EXPECT_EQ(0, std::memcmp(p_base_page->p_image_->data(),
                           kPageTwoBytes.data(), kPageTwoBytes.size()));
  ASSERT_EQ(ResultCode::kOk,
            pager.PagerGet(0, &p_base_page, SampleMemPage::create));
  EXPECT_EQ(0, std::memcmp(p_base_page->p_image_->data(),
                           kPageOneBytes.data(), kPageOneBytes.size()));
  EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
}

/*
 * Only resident pages are written. A page that was never loaded keeps its
 * on-disk content even though pages after it are rewritten.
 */
TEST(PagerCloseTest, UnloadedPagesAreLeftAlone) {
  std::string filename = "test_pager_UnloadedPagesAreLeftAlone.db";
  std::remove(filename.c_str());
  {
    Pager pager(filename, 10);
    BasePage *p_base_page = nullptr;
    ASSERT_EQ(ResultCode::kOk,
              pager.PagerGet(0, &p_base_page, SampleMemPage::create));
    std::memcpy(p_base_page->p_image_->data(), kPageOneBytes.data(),
                kPageOneBytes.size());
    ASSERT_EQ(ResultCode::kOk,
              pager.PagerGet(1, &p_base_page, SampleMemPage::create));
    EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
  }
  {
    // Touch page 1 only
    Pager pager(filename, 10);
    BasePage *p_base_page = nullptr;
    ASSERT_EQ(ResultCode::kOk,
              pager.PagerGet(1, &p_base_page, SampleMemPage::create));
    std::memcpy(p_base_page->p_image_->data(), kPageTwoBytes.data(),
                kPageTwoBytes.size());
    EXPECT_FALSE(pager.PagerIsCached(0));
    EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
  }
  Pager pager(filename, 10);
  BasePage *p_base_page = nullptr;
  ASSERT_EQ(ResultCode::kOk,
            pager.PagerGet(0, &p_base_page, SampleMemPage::create));
  EXPECT_EQ(0, std::memcmp(p_base_page->p_image_->data(),
                           kPageOneBytes.data(), kPageOneBytes.size()));
  EXPECT_EQ(ResultCode::kOk, pager.PagerClose());
}

// Two Pagers on two files share nothing
TEST(PagerCloseTest, IndependentPagers) {
  std::string filename_a = "test_pager_IndependentA.db";
  std::string filename_b = "test_pager_IndependentB.db";
  std::remove(filename_a.c_str());
  std::remove(filename_b.c_str());

  Pager pager_a(filename_a, 5);
  Pager pager_b(filename_b, 5);
  BasePage *p_a = nullptr;
  BasePage *p_b = nullptr;
  ASSERT_EQ(ResultCode::kOk, pager_a.PagerGet(0, &p_a, SampleMemPage::create));
  ASSERT_EQ(ResultCode::kOk, pager_b.PagerGet(0, &p_b, SampleMemPage::create));
  EXPECT_NE(p_a, p_b);
  std::memcpy(p_a->p_image_->data(), kPageOneBytes.data(),
              kPageOneBytes.size());
  EXPECT_NE(0, std::memcmp(p_b->p_image_->data(), kPageOneBytes.data(),
                           kPageOneBytes.size()));
  EXPECT_EQ(ResultCode::kOk, pager_a.PagerClose());
  EXPECT_EQ(ResultCode::kOk, pager_b.PagerClose());
}

// Writes to /dev/full always fail with ENOSPC
TEST(PagerCloseTest, WriteFailureIsReported) {
  if (access("/dev/full", W_OK) != 0) {
    GTEST_SKIP() << "/dev/full is not available";
  }
  Pager pager("/dev/full", 10);
  BasePage *p_base_page = nullptr;
  ASSERT_EQ(ResultCode::kOk,
            pager.PagerGet(0, &p_base_page, SampleMemPage::create));
  EXPECT_EQ(ResultCode::kIOErrorWrite, pager.PagerClose());
  EXPECT_FALSE(pager.PagerIsOpen());
}
