#pragma once

#include <ostream>
#include <vector>

#include "node_page.h"
#include "pager.h"
#include "row.h"
#include "sql_int.h"
#include "sql_limit.h"
#include "sql_rc.h"

/**
 * @class BtCursor
 *
 * @brief A position in the Btree: a leaf page and a cell index on it.
 *
 * BtreeFind() returns one to say where a key is, or where it would be
 * inserted. BtreeFirst() and BtreeNext() use one to walk the leaves in key
 * order. A cursor holds no page pointer, only page numbers, so it stays
 * meaningful as long as the tree is not modified.
 */
class BtCursor {
 public:
  PageNumber page_number;
  u32 cell_index;
  // Set once the scan has moved past the last cell of the last leaf
  bool end_of_table;

  BtCursor();
};

/**
 * @class Btree
 *
 * This is the class responsible for all the Btree operations on one table.
 * It stores (key, row) pairs in leaf nodes and keeps them sorted by key, and
 * it builds internal nodes over them so a key can be found by reading one
 * page per level.
 *
 * From an internal perspective, every node is a NodePage that the Pager owns.
 * The Btree only ever holds page numbers between operations. It asks the
 * Pager for a page whenever it needs one, and since the Pager never evicts, a
 * NodePage pointer stays valid for the rest of an operation.
 *
 * Shape of the tree:
 *  - Page 0 is always the leftmost leaf. A split keeps the left half in
 *    place, so it never moves.
 *  - When the root splits, a new root is allocated on a fresh page. The root
 *    page number therefore changes over time, see BtreeRootPageNumber().
 *  - Every internal key equals the largest key of its child's subtree.
 *  - Leaves are chained left to right through their next_leaf pointers.
 *
 * @note The fan-out of internal nodes can be capped below what fits on a
 * page (internal_max_keys). The page layout does not change, only the point
 * at which an internal node is considered full.
 */
class Btree {
 public:
  // Throws DbException(kMisuse) if internal_max_keys is below 2 or above
  // kInternalNodeMaxKeys.
  Btree(Pager &pager, PageNumber root_page_number,
        u32 internal_max_keys = kInternalNodeMaxKeys);

  Btree(const Btree &) = delete;
  Btree &operator=(const Btree &) = delete;

  // Initializes page 0 of an empty file as an empty root leaf
  ResultCode BtreeNewDatabase();

  // Finds the leaf cell for key. found tells whether key is present.
  ResultCode BtreeFind(u32 key, BtCursor &cursor, bool &found);

  // Returns kConstraintPrimaryKey if the key exists and kFull if the pages
  // needed for the insert are not available. Either way nothing changes.
  ResultCode BtreeInsert(u32 key, const Row &row);

  // ########################### Scanning ###########################
  ResultCode BtreeFirst(BtCursor &cursor, bool &table_is_empty);
  ResultCode BtreeNext(BtCursor &cursor, bool &end_of_table);
  ResultCode BtreeCursorRow(const BtCursor &cursor, Row &row);
  ResultCode BtreeCursorKey(const BtCursor &cursor, u32 &key);

  [[nodiscard]] PageNumber BtreeRootPageNumber() const {
    return root_page_number_;
  }
  [[nodiscard]] u32 BtreeInternalMaxKeys() const { return internal_max_keys_; }

  // ######################### Diagnostics ##########################

  // Number of levels, 1 for a tree that is a single leaf
  ResultCode BtreeDepth(u32 &depth);

  // Prints the tree as an indented outline (the .btree meta-command)
  ResultCode BtreeDump(std::ostream &out);

  // Walks the whole file and returns kCorrupt if any structural invariant
  // does not hold.
  ResultCode BtreeVerify();

  // Largest key in the subtree rooted at page_number
  ResultCode BtreeNodeMaxKey(PageNumber page_number, u32 &max_key);

 private:
  Pager &pager_;
  PageNumber root_page_number_;
  u32 internal_max_keys_;

  // ##################### Private page helpers #####################
  ResultCode GetNodePage(PageNumber page_number, NodePage *&p_node_page);
  ResultCode AllocateNodePage(NodePage *&p_node_page, PageNumber &page_number);
  ResultCode FindChildIndex(const NodePage &parent, PageNumber child_page_number,
                            u32 &child_idx);

  // ######################## Balance ###############################
  // Implemented in btree_balance.cc
  ResultCode CountPagesNeeded(PageNumber leaf_page_number, u32 &pages_needed);
  ResultCode LeafInsert(NodePage &leaf, u32 cell_idx, u32 key, const Row &row);
  ResultCode LeafSplitAndInsert(const BtCursor &cursor, u32 key,
                                const Row &row);
  ResultCode CreateNewRoot(PageNumber left_page_number,
                           PageNumber right_page_number);
  ResultCode InternalInsert(PageNumber parent_page_number,
                            PageNumber child_page_number);
  ResultCode InternalSplitAndInsert(PageNumber old_page_number,
                                    PageNumber child_page_number);
  ResultCode UpdateSeparatorKey(PageNumber child_page_number);
  ResultCode RefreshAncestorKeys(PageNumber page_number);

  // ######################## Diagnostics ###########################
  ResultCode DumpNode(PageNumber page_number, u32 indentation_level,
                      std::ostream &out);
  ResultCode VerifyNode(PageNumber page_number, PageNumber parent_page_number,
                        bool has_lower_bound, u32 lower_bound, u32 depth,
                        u32 &leaf_depth, u32 &max_key,
                        std::vector<PageNumber> &leaves, u32 &num_visited);
};
