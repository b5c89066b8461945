/*
 * btree_balance.cc
 *
 * Everything that changes the shape of the tree on insert: splitting a full
 * leaf, splitting a full internal node, and promoting a new root. Nodes only
 * ever split, they never merge, since rows are never deleted.
 */
#include <algorithm>

#include "btree.h"
#include "sql_trace.h"

/**
 * One child slot of an internal node, gathered while the node is being
 * split. key is the max key of the child's subtree.
 */
struct InternalEntry {
  PageNumber child;
  u32 key;
};

/**
 * Rewrites node to hold entries[first, first + count). The last entry becomes
 * the right child and its key is dropped.
 */
static void WriteInternalEntries(NodePage &node,
                                 const std::vector<InternalEntry> &entries,
                                 u32 first, u32 count) {
  node.SetInternalNumKeys(count - 1);
  for (u32 i = 0; i + 1 < count; i++) {
    node.SetInternalChild(i, entries[first + i].child);
    node.SetInternalKey(i, entries[first + i].key);
  }
  node.SetInternalRightChild(entries[first + count - 1].child);
}

/**
 * Counts the pages an insert into leaf_page_number will allocate.
 *
 * A full leaf needs one new page for its right half. The split pushes one
 * more key into the parent, which needs a page of its own if it is full too,
 * and so on up. Whichever node at the top of that chain is the root also
 * needs a page for the new root above it.
 */
ResultCode Btree::CountPagesNeeded(PageNumber leaf_page_number,
                                   u32 &pages_needed) {
  pages_needed = 0;
  NodePage *p_node = nullptr;
  ResultCode rc = GetNodePage(leaf_page_number, p_node);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  if (p_node->GetLeafNumCells() < kLeafNodeMaxCells) {
    return ResultCode::kOk;
  }

  pages_needed = 1;
  for (u32 level = 0; level <= pager_.PagerPageCount(); level++) {
    if (p_node->IsRoot()) {
      pages_needed++;
      return ResultCode::kOk;
    }
    NodePage *p_parent = nullptr;
    rc = GetNodePage(p_node->GetParent(), p_parent);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    if (p_parent->GetInternalNumKeys() < internal_max_keys_) {
      return ResultCode::kOk;
    }
    pages_needed++;
    p_node = p_parent;
  }
  return ResultCode::kCorrupt;
}

/**
 * Inserts a cell into a leaf that has room for it, shifting the cells at and
 * after cell_idx one place to the right.
 */
ResultCode Btree::LeafInsert(NodePage &leaf, u32 cell_idx, u32 key,
                             const Row &row) {
  u32 num_cells = leaf.GetLeafNumCells();
  if (num_cells >= kLeafNodeMaxCells) {
    return ResultCode::kInternal;
  }
  if (cell_idx < num_cells) {
    leaf.MoveLeafCells(cell_idx, cell_idx + 1, num_cells - cell_idx);
  }
  leaf.SetLeafNumCells(num_cells + 1);
  leaf.SetLeafKey(cell_idx, key);
  leaf.SetLeafRow(cell_idx, row);
  return ResultCode::kOk;
}

/**
 * Splits a full leaf and inserts the new cell.
 *
 * The kLeafNodeMaxCells existing cells and the new one are laid out in key
 * order. The first kLeafNodeLeftSplitCount stay on the old page and the rest
 * go to a new page, which is linked into the leaf chain right after the old
 * one. The new page is then added to the parent, or a new root is created
 * above the two if the old leaf was the root.
 */
ResultCode Btree::LeafSplitAndInsert(const BtCursor &cursor, u32 key,
                                     const Row &row) {
  // Step 1: Get the old leaf and a new page for the right half
  PageNumber old_page_number = cursor.page_number;
  NodePage *p_old = nullptr;
  ResultCode rc = GetNodePage(old_page_number, p_old);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  NodePage *p_new = nullptr;
  PageNumber new_page_number = 0;
  rc = AllocateNodePage(p_new, new_page_number);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  PAGEDB_TRACE3("SPLIT leaf %u into %u\n", old_page_number, new_page_number);

  p_new->InitializeLeafNode();
  p_new->SetParent(p_old->GetParent());
  p_new->SetLeafNextLeaf(p_old->GetLeafNextLeaf());
  p_old->SetLeafNextLeaf(new_page_number);

  // Step 2: Divide the cells. Going from the highest position down means a
  // cell on the old page is always read before its slot is overwritten.
  for (u32 n = kLeafNodeMaxCells + 1; n > 0; n--) {
    u32 i = n - 1;
    NodePage *p_dest = i >= kLeafNodeLeftSplitCount ? p_new : p_old;
    u32 dest_idx =
        i >= kLeafNodeLeftSplitCount ? i - kLeafNodeLeftSplitCount : i;

    if (i == cursor.cell_index) {
      p_dest->SetLeafKey(dest_idx, key);
      p_dest->SetLeafRow(dest_idx, row);
    } else if (i > cursor.cell_index) {
      p_dest->CopyLeafCell(*p_old, i - 1, dest_idx);
    } else {
      p_dest->CopyLeafCell(*p_old, i, dest_idx);
    }
  }
  p_old->SetLeafNumCells(kLeafNodeLeftSplitCount);
  p_new->SetLeafNumCells(kLeafNodeRightSplitCount);

  // Step 3: Hook the new leaf into the tree
  if (p_old->IsRoot()) {
    rc = CreateNewRoot(old_page_number, new_page_number);
  } else {
    // The old leaf lost its upper half, so its separator shrinks before the
    // new leaf is placed beside it.
    rc = UpdateSeparatorKey(old_page_number);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    rc = InternalInsert(p_old->GetParent(), new_page_number);
  }
  if (rc != ResultCode::kOk) {
    return rc;
  }

  // Step 4: Bring the separators above both halves up to date
  rc = RefreshAncestorKeys(old_page_number);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  return RefreshAncestorKeys(new_page_number);
}

/**
 * Puts a new internal root above two nodes. left_page_number is the old
 * root, right_page_number is the node split off from it.
 *
 * The old root stays where it is. The new root goes onto a fresh page, so the
 * root page number changes.
 */
ResultCode Btree::CreateNewRoot(PageNumber left_page_number,
                                PageNumber right_page_number) {
  NodePage *p_root = nullptr;
  PageNumber root_page_number = 0;
  ResultCode rc = AllocateNodePage(p_root, root_page_number);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  NodePage *p_left = nullptr;
  rc = GetNodePage(left_page_number, p_left);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  NodePage *p_right = nullptr;
  rc = GetNodePage(right_page_number, p_right);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  u32 left_max_key = 0;
  rc = BtreeNodeMaxKey(left_page_number, left_max_key);
  if (rc != ResultCode::kOk) {
    return rc;
  }

  p_root->InitializeInternalNode();
  p_root->SetRoot(true);
  p_root->SetParent(kNoPage);
  p_root->SetInternalNumKeys(1);
  p_root->SetInternalChild(0, left_page_number);
  p_root->SetInternalKey(0, left_max_key);
  p_root->SetInternalRightChild(right_page_number);

  p_left->SetRoot(false);
  p_left->SetParent(root_page_number);
  p_right->SetRoot(false);
  p_right->SetParent(root_page_number);

  PAGEDB_TRACE3("NEW ROOT %u above %u\n", root_page_number, left_page_number);
  root_page_number_ = root_page_number;
  return ResultCode::kOk;
}

/**
 * Adds child_page_number to an internal node, keyed by the max key of the
 * child's subtree. If the node is already full, it is split instead.
 */
ResultCode Btree::InternalInsert(PageNumber parent_page_number,
                                 PageNumber child_page_number) {
  NodePage *p_parent = nullptr;
  ResultCode rc = GetNodePage(parent_page_number, p_parent);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  u32 num_keys = p_parent->GetInternalNumKeys();
  if (num_keys >= internal_max_keys_) {
    return InternalSplitAndInsert(parent_page_number, child_page_number);
  }

  NodePage *p_child = nullptr;
  rc = GetNodePage(child_page_number, p_child);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  u32 child_max_key = 0;
  rc = BtreeNodeMaxKey(child_page_number, child_max_key);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  PageNumber right_child_page_number = p_parent->GetInternalRightChild();
  u32 right_max_key = 0;
  rc = BtreeNodeMaxKey(right_child_page_number, right_max_key);
  if (rc != ResultCode::kOk) {
    return rc;
  }

  p_child->SetParent(parent_page_number);
  if (child_max_key > right_max_key) {
    // The new child becomes the right child and the old right child gets a
    // key of its own
    p_parent->SetInternalNumKeys(num_keys + 1);
    p_parent->SetInternalChild(num_keys, right_child_page_number);
    p_parent->SetInternalKey(num_keys, right_max_key);
    p_parent->SetInternalRightChild(child_page_number);
  } else {
    u32 index = p_parent->InternalFindChild(child_max_key);
    p_parent->MoveInternalCells(index, index + 1, num_keys - index);
    p_parent->SetInternalNumKeys(num_keys + 1);
    p_parent->SetInternalChild(index, child_page_number);
    p_parent->SetInternalKey(index, child_max_key);
  }
  return ResultCode::kOk;
}

/**
 * Splits a full internal node while adding child_page_number to it.
 *
 * Step 1: Gather every child of the node, plus the new one, in key order.
 * Step 2: The lower half stays on the old page and the upper half moves to a
 * new page. Every child is pointed at the node it ended up in.
 * Step 3: The new node is added to the parent, which may split in turn, or a
 * new root is created if the old node was the root.
 */
ResultCode Btree::InternalSplitAndInsert(PageNumber old_page_number,
                                         PageNumber child_page_number) {
  NodePage *p_old = nullptr;
  ResultCode rc = GetNodePage(old_page_number, p_old);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  u32 child_max_key = 0;
  rc = BtreeNodeMaxKey(child_page_number, child_max_key);
  if (rc != ResultCode::kOk) {
    return rc;
  }

  // Step 1
  u32 num_keys = p_old->GetInternalNumKeys();
  std::vector<InternalEntry> entries;
  entries.reserve(num_keys + 2);
  for (u32 i = 0; i < num_keys; i++) {
    entries.push_back({p_old->GetInternalChild(i), p_old->GetInternalKey(i)});
  }
  PageNumber right_child_page_number = p_old->GetInternalRightChild();
  u32 right_max_key = 0;
  rc = BtreeNodeMaxKey(right_child_page_number, right_max_key);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  entries.push_back({right_child_page_number, right_max_key});

  auto position = std::lower_bound(
      entries.begin(), entries.end(), child_max_key,
      [](const InternalEntry &entry, u32 key) { return entry.key < key; });
  entries.insert(position, {child_page_number, child_max_key});

  // Step 2
  NodePage *p_new = nullptr;
  PageNumber new_page_number = 0;
  rc = AllocateNodePage(p_new, new_page_number);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  PAGEDB_TRACE3("SPLIT internal %u into %u\n", old_page_number,
                new_page_number);

  u32 total = static_cast<u32>(entries.size());
  u32 left_count = (total + 1) / 2;
  p_new->InitializeInternalNode();
  WriteInternalEntries(*p_old, entries, 0, left_count);
  WriteInternalEntries(*p_new, entries, left_count, total - left_count);

  for (u32 i = 0; i < total; i++) {
    NodePage *p_child = nullptr;
    rc = GetNodePage(entries[i].child, p_child);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    p_child->SetParent(i < left_count ? old_page_number : new_page_number);
  }

  // Step 3
  if (p_old->IsRoot()) {
    return CreateNewRoot(old_page_number, new_page_number);
  }
  p_new->SetParent(p_old->GetParent());
  rc = UpdateSeparatorKey(old_page_number);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  return InternalInsert(p_old->GetParent(), new_page_number);
}

/**
 * Sets the key that the parent of child_page_number keeps for it to the max
 * key of the child's subtree. A root, or a right child, has no such key.
 */
ResultCode Btree::UpdateSeparatorKey(PageNumber child_page_number) {
  NodePage *p_child = nullptr;
  ResultCode rc = GetNodePage(child_page_number, p_child);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  if (p_child->IsRoot()) {
    return ResultCode::kOk;
  }

  NodePage *p_parent = nullptr;
  rc = GetNodePage(p_child->GetParent(), p_parent);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  u32 child_idx = 0;
  rc = FindChildIndex(*p_parent, child_page_number, child_idx);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  if (child_idx == p_parent->GetInternalNumKeys()) {
    return ResultCode::kOk;
  }

  u32 max_key = 0;
  rc = BtreeNodeMaxKey(child_page_number, max_key);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  p_parent->SetInternalKey(child_idx, max_key);
  return ResultCode::kOk;
}

/**
 * Walks from page_number up to the root, updating the separator key kept
 * for each node along the way.
 */
ResultCode Btree::RefreshAncestorKeys(PageNumber page_number) {
  for (u32 level = 0; level <= pager_.PagerPageCount(); level++) {
    NodePage *p_node = nullptr;
    ResultCode rc = GetNodePage(page_number, p_node);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    if (p_node->IsRoot()) {
      return ResultCode::kOk;
    }
    rc = UpdateSeparatorKey(page_number);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    page_number = p_node->GetParent();
  }
  return ResultCode::kCorrupt;
}
