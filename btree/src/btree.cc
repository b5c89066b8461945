#include "btree.h"

#include "sql_trace.h"

BtCursor::BtCursor() : page_number(0), cell_index(0), end_of_table(false) {}

Btree::Btree(Pager &pager, PageNumber root_page_number, u32 internal_max_keys)
    : pager_(pager),
      root_page_number_(root_page_number),
      internal_max_keys_(internal_max_keys) {
  if (internal_max_keys_ < 2 || internal_max_keys_ > kInternalNodeMaxKeys) {
    throw DbException(ResultCode::kMisuse);
  }
}

// --------------------- Btree Private Functions ---------------------

/**
 * Fetches a page through the Pager and views it as a NodePage.
 */
ResultCode Btree::GetNodePage(PageNumber page_number, NodePage *&p_node_page) {
  BasePage *p_base_page = nullptr;
  ResultCode rc =
      pager_.PagerGet(page_number, &p_base_page, NodePage::CreateDerivedPage);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  p_node_page = dynamic_cast<NodePage *>(p_base_page);
  if (p_node_page == nullptr) {
    // The page was cached by someone else as a different kind of page
    return ResultCode::kInternal;
  }
  return ResultCode::kOk;
}

/**
 * Appends a new, zero-filled page to the end of the file.
 * Pages are never freed, so there is no free list to look at first.
 */
ResultCode Btree::AllocateNodePage(NodePage *&p_node_page,
                                   PageNumber &page_number) {
  page_number = pager_.PagerGetUnusedPageNumber();
  PAGEDB_TRACE2("ALLOCATE page %u\n", page_number);
  return GetNodePage(page_number, p_node_page);
}

/**
 * Finds which child slot of parent points at child_page_number.
 *
 * The search is by page number rather than by key. It is used while the tree
 * is being rearranged, when separator keys may not be up to date yet.
 */
ResultCode Btree::FindChildIndex(const NodePage &parent,
                                 PageNumber child_page_number, u32 &child_idx) {
  u32 num_keys = parent.GetInternalNumKeys();
  for (u32 i = 0; i <= num_keys; i++) {
    if (parent.GetInternalChild(i) == child_page_number) {
      child_idx = i;
      return ResultCode::kOk;
    }
  }
  PAGEDB_TRACE3("CORRUPT page %u is not a child of page %u\n",
                child_page_number, parent.GetPageNumber());
  return ResultCode::kCorrupt;
}

// --------------------- Btree Public Functions ---------------------

ResultCode Btree::BtreeNewDatabase() {
  // Step 1: Only an empty file gets a new root
  if (pager_.PagerPageCount() != 0 || root_page_number_ != 0) {
    return ResultCode::kMisuse;
  }

  // Step 2: Page 0 becomes an empty leaf that is also the root
  NodePage *p_root = nullptr;
  ResultCode rc = GetNodePage(0, p_root);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  p_root->InitializeLeafNode();
  p_root->SetRoot(true);
  p_root->SetParent(kNoPage);
  return ResultCode::kOk;
}

/**
 * Descends from the root to the leaf where key is, or would be.
 *
 * In each internal node the first key greater than or equal to key picks the
 * child, and if there is none the right child is taken. In the leaf, the
 * cursor is placed on the first cell whose key is greater than or equal to
 * key.
 */
ResultCode Btree::BtreeFind(u32 key, BtCursor &cursor, bool &found) {
  PageNumber page_number = root_page_number_;
  // A tree can never be deeper than the number of pages in the file
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
      cursor.cell_index = p_node->LeafFindCell(key, found);
      cursor.end_of_table = cursor.cell_index >= p_node->GetLeafNumCells();
      return ResultCode::kOk;
    }

    page_number = p_node->GetInternalChild(p_node->InternalFindChild(key));
  }
  return ResultCode::kCorrupt;
}

/**
 * Inserts a new (key, row) pair.
 *
 * Step 1: Locate the leaf and reject a duplicate key.
 * Step 2: Work out how many pages the insert will need. If the Pager cannot
 * provide them, return kFull before anything has been touched.
 * Step 3: Insert into the leaf, splitting it (and possibly its ancestors) if
 * it is full.
 * Step 4: Bring every separator key on the way to the root up to date.
 */
ResultCode Btree::BtreeInsert(u32 key, const Row &row) {
  // Step 1
  BtCursor cursor;
  bool found = false;
  ResultCode rc = BtreeFind(key, cursor, found);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  if (found) {
    return ResultCode::kConstraintPrimaryKey;
  }

  // Step 2
  u32 pages_needed = 0;
  rc = CountPagesNeeded(cursor.page_number, pages_needed);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  if (static_cast<u64>(pager_.PagerGetUnusedPageNumber()) + pages_needed >
      pager_.PagerMaxPages()) {
    PAGEDB_TRACE3("FULL insert needs %u pages, %u in use\n", pages_needed,
                  pager_.PagerPageCount());
    return ResultCode::kFull;
  }

  // Step 3
  NodePage *p_leaf = nullptr;
  rc = GetNodePage(cursor.page_number, p_leaf);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  if (p_leaf->GetLeafNumCells() >= kLeafNodeMaxCells) {
    return LeafSplitAndInsert(cursor, key, row);
  }
  rc = LeafInsert(*p_leaf, cursor.cell_index, key, row);
  if (rc != ResultCode::kOk) {
    return rc;
  }

  // Step 4
  return RefreshAncestorKeys(cursor.page_number);
}

/**
 * For a leaf this is the key of its last cell. For an internal node it is
 * the max key of its right child's subtree, so the right spine is followed
 * down to a leaf.
 */
ResultCode Btree::BtreeNodeMaxKey(PageNumber page_number, u32 &max_key) {
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
      max_key = p_node->GetLeafMaxKey();
      return ResultCode::kOk;
    }
    page_number = p_node->GetInternalRightChild();
  }
  return ResultCode::kCorrupt;
}

ResultCode Btree::BtreeDepth(u32 &depth) {
  PageNumber page_number = root_page_number_;
  depth = 0;
  for (u32 level = 0; level <= pager_.PagerPageCount(); level++) {
    NodePage *p_node = nullptr;
    ResultCode rc = GetNodePage(page_number, p_node);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    if (!p_node->HasValidNodeType()) {
      return ResultCode::kCorrupt;
    }
    depth++;
    if (p_node->GetNodeType() == NodeType::kLeaf) {
      return ResultCode::kOk;
    }
    page_number = p_node->GetInternalChild(0);
  }
  return ResultCode::kCorrupt;
}
