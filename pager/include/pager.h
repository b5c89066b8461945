#pragma once
#include <boost/dynamic_bitset.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "os.h"
#include "sql_int.h"
#include "sql_limit.h"
#include "sql_rc.h"

/*
 * pager.h
 *
 * The page cache between the B-tree and the database file. Pages are read
 * on first use and stay in memory until the Pager is closed.
 */

class Pager;

/**
 * @class BasePage
 * @brief Represents a page content in memory.
 *
 * Every derived Page class should implement a static `CreateDerivedPage`
 * method that constructs an instance of the derived class and returns it as a
 * `std::unique_ptr<BasePage>`.
 *
 * Example usage in a derived class:
 * @code
 *   static std::unique_ptr<BasePage> CreateDerivedPage() {
 *       return std::make_unique<DerivedPage>();
 *   }
 * @endcode
 *
 * This method should be used as the `create_page` function, which is passed
 * to `PagerGet()` to create new page objects of the derived class.
 *
 * See SampleMemPage for an example implementation.
 */
class BasePage {
 public:
  // Image data that holds the content of a page. It is the only copy of the
  // page's content while the page is cached.
  std::unique_ptr<PageImage> p_image_;

  BasePage() : p_image_(std::make_unique<PageImage>()), page_number_(0) {
    p_image_->fill(std::byte{0});
  }

  // Virtual destructor to allow for polymorphism
  virtual ~BasePage() = default;

  BasePage(const BasePage &) = delete;
  BasePage &operator=(const BasePage &) = delete;

  [[nodiscard]] PageNumber GetPageNumber() const { return page_number_; }

 private:
  // Set by the Pager when the page enters the cache
  PageNumber page_number_;

  friend class Pager;
};

/**
 * @class SampleMemPage
 * @brief A plain implementation of the BasePage class.
 *
 * It carries no interpretation of the page image, which makes it useful for
 * exercising the Pager on its own in unit tests.
 *
 * Example usage:
 * @code
 *   std::unique_ptr<BasePage> page = SampleMemPage::create();
 * @endcode
 */
class SampleMemPage : public BasePage {
 public:
  static std::unique_ptr<BasePage> create() {
    return std::make_unique<SampleMemPage>();
  }
};

/**
 * @class Pager
 *
 * @brief It is the class responsible for managing database pages, including
 * reading, writing, and caching database file pages in memory.
 *
 * Pages are addressed by a zero-based page number. Page n lives at byte
 * offset n * kPageSize in the file.
 *
 * The cache is a page table bounded by max_pages. Once a page is loaded it
 * stays resident until PagerClose(), so a pointer returned by PagerGet()
 * remains valid for the lifetime of the open Pager. There is no eviction and
 * no dirty tracking: every resident page is written back on close.
 *
 * @note Each open database file is managed through a separate Pager object,
 * and each Pager object is associated with one and only one open file.
 */
class Pager {
 public:
  // Opens (creating if absent) the database file.
  // Throws DbException(kCantOpen) if the file cannot be opened for reading
  // and writing, and DbException(kCorrupt) if it is not a whole number of
  // pages.
  explicit Pager(const std::string &file_name,
                 u32 max_pages = kTableMaxPages);

  Pager(const Pager &) = delete;
  Pager &operator=(const Pager &) = delete;

  // Loads a page into the cache (if needed) and returns it through pp_page.
  ResultCode PagerGet(
      PageNumber page_number, BasePage **pp_page,
      const std::function<std::unique_ptr<BasePage>()> &create_page);

  // Writes one resident page back to the file.
  ResultCode PagerFlush(PageNumber page_number);

  // Flushes every resident page, drops the cache and closes the file.
  ResultCode PagerClose();

  // Number of pages in use: pages on disk plus pages created since open.
  [[nodiscard]] u32 PagerPageCount() const { return num_pages_; }

  // The page number the next allocation should use. Pages are never
  // recycled, so new pages always go onto the end of the file.
  [[nodiscard]] PageNumber PagerGetUnusedPageNumber() const {
    return num_pages_;
  }

  [[nodiscard]] u32 PagerMaxPages() const { return max_pages_; }
  [[nodiscard]] bool PagerIsCached(PageNumber page_number) const;
  [[nodiscard]] bool PagerIsOpen() const { return is_open_; }
  [[nodiscard]] u32 PagerNumHits() const { return num_pages_hit_; }
  [[nodiscard]] u32 PagerNumMisses() const { return num_pages_miss_; }

 private:
  std::string file_name_;
  std::unique_ptr<OsFile> fd_;
  bool is_open_;

  u32 max_pages_;       // capacity of the page table
  u32 num_file_pages_;  // number of whole pages in the file at open
  u32 num_pages_;       // number of pages in use

  /* Cache hits and misses */
  u32 num_pages_hit_, num_pages_miss_;

  // A quick bitmap to check if a page is resident. It is also walked in page
  // order when flushing on close.
  boost::dynamic_bitset<> page_cached_bit_map_;

  // The page table. The map owns every cached page.
  std::map<PageNumber, std::unique_ptr<BasePage>> page_hash_table_;

  ResultCode PagerPrivateReadPage(PageNumber page_number, BasePage &page);
};
