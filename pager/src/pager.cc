#include "pager.h"

#include <new>

#include "sql_trace.h"

/**
 * The constructor of Pager
 * It opens the database file and computes the page count from the file
 * length.
 *
 * Every page is written back on close, so a file that can only be opened
 * read-only is refused with kCantOpen.
 *
 * A file whose length is not a whole number of pages is treated as corrupt.
 * Pages are only ever written whole, so a partial page means the file was
 * damaged or is not a database file at all.
 */
Pager::Pager(const std::string &file_name, u32 max_pages)
    : file_name_(file_name),
      fd_(std::make_unique<OsFile>(file_name)),
      is_open_(false),
      max_pages_(max_pages),
      num_file_pages_(0),
      num_pages_(0),
      num_pages_hit_(0),
      num_pages_miss_(0),
      page_cached_bit_map_(max_pages) {
  if (max_pages_ == 0) throw DbException(ResultCode::kMisuse);

  bool read_only = false;
  ResultCode rc = fd_->OsOpenReadWrite(file_name_, read_only);
  if (rc != ResultCode::kOk) throw DbException(ResultCode::kCantOpen);
  if (read_only) {
    PAGEDB_TRACE2("CANTOPEN %s is not writable\n", file_name_.c_str());
    throw DbException(ResultCode::kCantOpen);
  }

  u64 file_length = 0;
  rc = fd_->OsFileSize(file_length);
  if (rc != ResultCode::kOk) throw DbException(rc);

  if (file_length % kPageSize != 0) {
    PAGEDB_TRACE2("CORRUPT file length %llu\n", file_length);
    throw DbException(ResultCode::kCorrupt);
  }
  if (file_length / kPageSize > max_pages_) {
    // The file holds more pages than this page table can ever address
    throw DbException(ResultCode::kFull);
  }

  num_file_pages_ = static_cast<u32>(file_length / kPageSize);
  num_pages_ = num_file_pages_;
  is_open_ = true;
}

/**
 * Loads a page into the cache by its page number.
 * If the page is already in the cache, it returns a pointer to the page.
 *
 * If the page is not in the cache, it creates an instance of a derived class
 * from BasePage and fills its page image with the bytes of the page in the
 * file.
 *
 * If the page requested is outside the range of the database file, such as a
 * page that is being allocated for a split, the page image stays zero-filled
 * and the page count is extended to cover it.
 *
 * A page number at or beyond max_pages returns kFull. The page table cannot
 * grow, so the caller cannot proceed.
 */
ResultCode Pager::PagerGet(
    PageNumber page_number, BasePage **pp_page,
    const std::function<std::unique_ptr<BasePage>()> &create_page) {
  if (!is_open_) return ResultCode::kMisuse;
  if (page_number >= max_pages_) {
    PAGEDB_TRACE3("FULL page %u of %u\n", page_number, max_pages_);
    return ResultCode::kFull;
  }

  auto it = page_hash_table_.find(page_number);
  if (it != page_hash_table_.end()) {
    // if the page is in the cache
    num_pages_hit_++;
    *pp_page = it->second.get();
    return ResultCode::kOk;
  }

  // if the page is not in the cache
  num_pages_miss_++;
  std::unique_ptr<BasePage> p_page;
  try {
    p_page = create_page();
  } catch (const std::bad_alloc &) {
    return ResultCode::kInternal;
  }
  p_page->page_number_ = page_number;

  if (page_number < num_file_pages_) {
    // this means that the page is in the database file, and we have to read
    // the page from the database file
    ResultCode rc = PagerPrivateReadPage(page_number, *p_page);
    if (rc != ResultCode::kOk) {
      return rc;
    }
  }

  if (page_number >= num_pages_) {
    num_pages_ = page_number + 1;
  }

  *pp_page = p_page.get();
  page_hash_table_[page_number] = std::move(p_page);
  page_cached_bit_map_.set(page_number);
  return ResultCode::kOk;
}

ResultCode Pager::PagerPrivateReadPage(PageNumber page_number,
                                       BasePage &page) {
  PAGEDB_TRACE2("READ page %u\n", page_number);
  ResultCode rc = fd_->OsSeek(static_cast<u64>(page_number) * kPageSize);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  return fd_->OsRead(*page.p_image_);
}

/**
 * Writes the full image of a resident page at its offset in the file.
 * Writing a page past the end of the file extends the file.
 */
ResultCode Pager::PagerFlush(PageNumber page_number) {
  if (!is_open_) return ResultCode::kMisuse;
  auto it = page_hash_table_.find(page_number);
  if (it == page_hash_table_.end()) {
    // Tried to flush a page that was never loaded
    return ResultCode::kMisuse;
  }

  PAGEDB_TRACE2("WRITE page %u\n", page_number);
  ResultCode rc = fd_->OsSeek(static_cast<u64>(page_number) * kPageSize);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  return fd_->OsWrite(*it->second->p_image_);
}

/**
 * Flushes every resident page in page order, releases the cache and closes
 * the file.
 *
 * The file is closed even if a flush fails. The first error encountered is
 * the one returned. Calling it on a closed Pager is a no-op.
 */
ResultCode Pager::PagerClose() {
  if (!is_open_) return ResultCode::kOk;

  ResultCode first_error = ResultCode::kOk;
  for (auto page_number = page_cached_bit_map_.find_first();
       page_number != boost::dynamic_bitset<>::npos;
       page_number = page_cached_bit_map_.find_next(page_number)) {
    ResultCode rc = PagerFlush(static_cast<PageNumber>(page_number));
    if (rc != ResultCode::kOk && first_error == ResultCode::kOk) {
      first_error = rc;
    }
  }

  if (first_error == ResultCode::kOk && !page_hash_table_.empty()) {
    first_error = fd_->OsSync();
  }

  page_hash_table_.clear();
  page_cached_bit_map_.reset();
  is_open_ = false;

  ResultCode rc = fd_->OsClose();
  if (first_error == ResultCode::kOk) {
    first_error = rc;
  }
  return first_error;
}

bool Pager::PagerIsCached(PageNumber page_number) const {
  return page_number < page_cached_bit_map_.size() &&
         page_cached_bit_map_.test(page_number);
}
