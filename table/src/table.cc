#include "table.h"

#include <cstdio>

#include "sql_trace.h"

Table::Table(const std::string &filename, u32 max_pages,
             u32 internal_max_keys)
    : pager_(std::make_unique<Pager>(filename, max_pages)), is_open_(false) {
  ResultCode rc = ResultCode::kOk;
  if (pager_->PagerPageCount() == 0) {
    // New database file
    btree_ = std::make_unique<Btree>(*pager_, 0, internal_max_keys);
    rc = btree_->BtreeNewDatabase();
  } else {
    PageNumber root_page_number = 0;
    rc = FindRootPageNumber(root_page_number);
    if (rc == ResultCode::kOk) {
      btree_ = std::make_unique<Btree>(*pager_, root_page_number,
                                       internal_max_keys);
    }
  }
  if (rc != ResultCode::kOk) {
    throw DbException(rc);
  }
  is_open_ = true;
}

Table::~Table() {
  if (!is_open_) return;
  ResultCode rc = TableClose();
  if (rc != ResultCode::kOk) {
    fprintf(stderr, "Error: %s while closing the table.\n",
            ToString(rc).c_str());
  }
}

/**
 * Follows parent pointers from page 0 until a page marked as the root is
 * found.
 *
 * The root moves to a new page every time it splits, so its page number is
 * not fixed. Page 0 is always the leftmost leaf, and its chain of parents
 * always ends at the root. The walk cannot take more steps than there are
 * pages. If it does, the parent pointers form a cycle.
 */
ResultCode Table::FindRootPageNumber(PageNumber &root_page_number) {
  u32 num_pages = pager_->PagerPageCount();
  PageNumber page_number = 0;
  for (u32 steps = 0; steps < num_pages; steps++) {
    BasePage *p_base_page = nullptr;
    ResultCode rc = pager_->PagerGet(page_number, &p_base_page,
                                     NodePage::CreateDerivedPage);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    auto *p_node = dynamic_cast<NodePage *>(p_base_page);
    if (p_node == nullptr) {
      return ResultCode::kInternal;
    }
    if (!p_node->HasValidNodeType()) {
      return ResultCode::kCorrupt;
    }
    if (p_node->IsRoot()) {
      root_page_number = page_number;
      return ResultCode::kOk;
    }
    page_number = p_node->GetParent();
    if (page_number >= num_pages) {
      return ResultCode::kCorrupt;
    }
  }
  PAGEDB_TRACE1("CORRUPT no root reachable from page 0\n");
  return ResultCode::kCorrupt;
}

ResultCode Table::TableExecute(
    const Statement &statement,
    const std::function<void(const Row &)> &row_callback) {
  switch (statement.type) {
    case StatementType::kInsert:
      return TableInsert(statement.row_to_insert);
    case StatementType::kSelect:
      return TableSelect(row_callback);
  }
  return ResultCode::kMisuse;
}

ResultCode Table::TableInsert(const Row &row) {
  if (!is_open_) return ResultCode::kMisuse;
  return btree_->BtreeInsert(row.id, row);
}

ResultCode Table::TableSelect(
    const std::function<void(const Row &)> &row_callback) {
  if (!is_open_) return ResultCode::kMisuse;

  BtCursor cursor;
  bool end_of_table = false;
  ResultCode rc = btree_->BtreeFirst(cursor, end_of_table);
  while (rc == ResultCode::kOk && !end_of_table) {
    Row row;
    rc = btree_->BtreeCursorRow(cursor, row);
    if (rc != ResultCode::kOk) {
      break;
    }
    row_callback(row);
    rc = btree_->BtreeNext(cursor, end_of_table);
  }
  return rc;
}

ResultCode Table::TableClose() {
  if (!is_open_) return ResultCode::kOk;
  is_open_ = false;
  return pager_->PagerClose();
}
