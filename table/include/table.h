#pragma once

#include <functional>
#include <memory>
#include <string>

#include "btree.h"
#include "pager.h"
#include "row.h"
#include "sql_int.h"
#include "sql_limit.h"
#include "sql_rc.h"

enum class StatementType {
  kInsert,
  kSelect,
};

/*
 * A parsed statement, as handed over by the interpreter. row_to_insert is
 * only used by kInsert.
 */
struct Statement {
  StatementType type;
  Row row_to_insert;

  Statement() : type(StatementType::kSelect) {}
};

/**
 * @class Table
 *
 * @brief The handle for one database file holding one table.
 *
 * It owns the Pager for the file and the Btree over it, and it keeps track
 * of which page is the root. A new file gets an empty root leaf on page 0. An
 * existing file has its root found by following parent pointers up from
 * page 0, which always holds the leftmost leaf.
 *
 * Rows are keyed by their id.
 *
 * @note Everything is written back to the file on TableClose(). A Table that
 * is destroyed while still open closes itself.
 */
class Table {
 public:
  // Throws DbException if the file cannot be opened, is not a whole number of
  // pages, or holds no reachable root.
  explicit Table(const std::string &filename, u32 max_pages = kTableMaxPages,
                 u32 internal_max_keys = kInternalNodeMaxKeys);
  ~Table();

  Table(const Table &) = delete;
  Table &operator=(const Table &) = delete;

  // Runs one statement. For kSelect, row_callback is called once per row in
  // ascending id order.
  ResultCode TableExecute(const Statement &statement,
                          const std::function<void(const Row &)> &row_callback);

  ResultCode TableInsert(const Row &row);
  ResultCode TableSelect(const std::function<void(const Row &)> &row_callback);

  // Writes every cached page back and closes the file. Closing a closed
  // Table does nothing.
  ResultCode TableClose();

  [[nodiscard]] bool TableIsOpen() const { return is_open_; }
  [[nodiscard]] PageNumber RootPageNumber() const {
    return btree_->BtreeRootPageNumber();
  }
  Btree &GetBtree() { return *btree_; }
  Pager &GetPager() { return *pager_; }

 private:
  std::unique_ptr<Pager> pager_;
  std::unique_ptr<Btree> btree_;
  bool is_open_;

  ResultCode FindRootPageNumber(PageNumber &root_page_number);
};
