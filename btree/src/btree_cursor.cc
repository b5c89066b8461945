#include "btree.h"

/**
 * Moves the cursor to the first cell of the leftmost leaf, following child 0
 * down from the root. table_is_empty is set if there is no cell at all.
 */
ResultCode Btree::BtreeFirst(BtCursor &cursor, bool &table_is_empty) {
  PageNumber page_number = root_page_number_;
  for (u32 level = 0; level <= pager_.PagerPageCount(); level++) {
    NodePage *p_node = nullptr;
    ResultCode rc = GetNodePage(page_number, p_node);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    if (!p_node->HasValidNodeType()) {
      return ResultCode::kCorrupt;
    }
    if (p_node->GetNodeType() == NodeType::kLeaf) {
      cursor.page_number = page_number;
      cursor.cell_index = 0;
      table_is_empty = p_node->GetLeafNumCells() == 0;
      cursor.end_of_table = table_is_empty;
      return ResultCode::kOk;
    }
    page_number = p_node->GetInternalChild(0);
  }
  return ResultCode::kCorrupt;
}

/**
 * Advances the cursor by one cell. Past the last cell of a leaf it moves on
 * to the first cell of the next leaf in the chain, and past the last leaf it
 * sets end_of_table.
 */
ResultCode Btree::BtreeNext(BtCursor &cursor, bool &end_of_table) {
  if (cursor.end_of_table) {
    end_of_table = true;
    return ResultCode::kOk;
  }

  NodePage *p_leaf = nullptr;
  ResultCode rc = GetNodePage(cursor.page_number, p_leaf);
  if (rc != ResultCode::kOk) {
    return rc;
  }

  cursor.cell_index++;
  // Only an empty root leaf has no cells, so this loop runs at most once in
  // a well formed tree. The bound stops a corrupt chain from looping.
  for (u32 hops = 0; cursor.cell_index >= p_leaf->GetLeafNumCells(); hops++) {
    PageNumber next_page_number = p_leaf->GetLeafNextLeaf();
    if (next_page_number == kNoPage) {
      cursor.end_of_table = true;
      break;
    }
    if (hops > pager_.PagerPageCount()) {
      return ResultCode::kCorrupt;
    }
    rc = GetNodePage(next_page_number, p_leaf);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    cursor.page_number = next_page_number;
    cursor.cell_index = 0;
  }

  end_of_table = cursor.end_of_table;
  return ResultCode::kOk;
}

ResultCode Btree::BtreeCursorRow(const BtCursor &cursor, Row &row) {
  NodePage *p_leaf = nullptr;
  ResultCode rc = GetNodePage(cursor.page_number, p_leaf);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  if (cursor.end_of_table || cursor.cell_index >= p_leaf->GetLeafNumCells()) {
    return ResultCode::kMisuse;
  }
  p_leaf->GetLeafRow(cursor.cell_index, row);
  return ResultCode::kOk;
}

ResultCode Btree::BtreeCursorKey(const BtCursor &cursor, u32 &key) {
  NodePage *p_leaf = nullptr;
  ResultCode rc = GetNodePage(cursor.page_number, p_leaf);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  if (cursor.end_of_table || cursor.cell_index >= p_leaf->GetLeafNumCells()) {
    return ResultCode::kMisuse;
  }
  key = p_leaf->GetLeafKey(cursor.cell_index);
  return ResultCode::kOk;
}
