/*
 * btree_verify.cc
 *
 * Debugging aids: the indented tree dump behind the .btree meta-command and
 * a full structural check of the tree.
 */
#include <string>

#include "btree.h"
#include "sql_trace.h"

ResultCode Btree::BtreeDump(std::ostream &out) {
  return DumpNode(root_page_number_, 0, out);
}

ResultCode Btree::DumpNode(PageNumber page_number, u32 indentation_level,
                           std::ostream &out) {
  if (indentation_level > pager_.PagerPageCount()) {
    return ResultCode::kCorrupt;
  }
  NodePage *p_node = nullptr;
  ResultCode rc = GetNodePage(page_number, p_node);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  if (!p_node->HasValidNodeType()) {
    return ResultCode::kCorrupt;
  }

  std::string indent(indentation_level * 2, ' ');
  std::string child_indent((indentation_level + 1) * 2, ' ');

  if (p_node->GetNodeType() == NodeType::kLeaf) {
    u32 num_cells = p_node->GetLeafNumCells();
    out << indent << "- leaf (size " << num_cells << ")\n";
    for (u32 i = 0; i < num_cells; i++) {
      out << child_indent << "- " << p_node->GetLeafKey(i) << "\n";
    }
    return ResultCode::kOk;
  }

  u32 num_keys = p_node->GetInternalNumKeys();
  out << indent << "- internal (size " << num_keys << ")\n";
  if (num_keys == 0) {
    return ResultCode::kOk;
  }
  for (u32 i = 0; i < num_keys; i++) {
    rc = DumpNode(p_node->GetInternalChild(i), indentation_level + 1, out);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    out << child_indent << "- key " << p_node->GetInternalKey(i) << "\n";
  }
  return DumpNode(p_node->GetInternalRightChild(), indentation_level + 1, out);
}

/**
 * Checks the whole tree:
 *  - exactly one page is marked as the root, and it is root_page_number_
 *  - every page in the file is reached exactly once from the root
 *  - every node's parent pointer names the node that points at it
 *  - keys are strictly ascending within each node and across the tree
 *  - every internal key equals the max key of its child's subtree
 *  - all leaves are at the same depth
 *  - the leaf chain visits every leaf once, left to right, starting at page 0
 *
 * Returns kCorrupt at the first violation.
 */
ResultCode Btree::BtreeVerify() {
  // Step 1: Exactly one root, and it is the one we know about
  u32 num_pages = pager_.PagerPageCount();
  for (PageNumber page_number = 0; page_number < num_pages; page_number++) {
    NodePage *p_node = nullptr;
    ResultCode rc = GetNodePage(page_number, p_node);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    if (p_node->IsRoot() != (page_number == root_page_number_)) {
      PAGEDB_TRACE2("CORRUPT unexpected root flag on page %u\n", page_number);
      return ResultCode::kCorrupt;
    }
  }

  // Step 2: Walk the tree from the root
  u32 leaf_depth = 0;
  u32 max_key = 0;
  u32 num_visited = 0;
  std::vector<PageNumber> leaves;
  ResultCode rc = VerifyNode(root_page_number_, kNoPage, false, 0, 1,
                             leaf_depth, max_key, leaves, num_visited);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  if (num_visited != num_pages) {
    PAGEDB_TRACE3("CORRUPT reached %u of %u pages\n", num_visited, num_pages);
    return ResultCode::kCorrupt;
  }

  // Step 3: The leaf chain matches the left-to-right order of the leaves
  if (leaves.empty() || leaves.front() != 0) {
    return ResultCode::kCorrupt;
  }
  for (std::size_t i = 0; i < leaves.size(); i++) {
    NodePage *p_leaf = nullptr;
    rc = GetNodePage(leaves[i], p_leaf);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    PageNumber expected_next = i + 1 < leaves.size() ? leaves[i + 1] : kNoPage;
    if (p_leaf->GetLeafNextLeaf() != expected_next) {
      PAGEDB_TRACE2("CORRUPT leaf chain broken at page %u\n", leaves[i]);
      return ResultCode::kCorrupt;
    }
  }
  return ResultCode::kOk;
}

/**
 * Checks the subtree rooted at page_number and reports its max key. Every key
 * in the subtree must be greater than lower_bound when has_lower_bound is set.
 */
ResultCode Btree::VerifyNode(PageNumber page_number,
                             PageNumber parent_page_number,
                             bool has_lower_bound, u32 lower_bound, u32 depth,
                             u32 &leaf_depth, u32 &max_key,
                             std::vector<PageNumber> &leaves,
                             u32 &num_visited) {
  num_visited++;
  if (num_visited > pager_.PagerPageCount()) {
    // Some page was reached twice
    return ResultCode::kCorrupt;
  }

  NodePage *p_node = nullptr;
  ResultCode rc = GetNodePage(page_number, p_node);
  if (rc != ResultCode::kOk) {
    return rc;
  }
  if (!p_node->HasValidNodeType()) {
    return ResultCode::kCorrupt;
  }
  bool is_root = page_number == root_page_number_;
  if (!is_root && p_node->GetParent() != parent_page_number) {
    PAGEDB_TRACE3("CORRUPT page %u has parent %u\n", page_number,
                  p_node->GetParent());
    return ResultCode::kCorrupt;
  }

  if (p_node->GetNodeType() == NodeType::kLeaf) {
    u32 num_cells = p_node->GetLeafNumCells();
    if (num_cells > kLeafNodeMaxCells || (num_cells == 0 && !is_root)) {
      return ResultCode::kCorrupt;
    }
    if (leaf_depth == 0) {
      leaf_depth = depth;
    } else if (leaf_depth != depth) {
      return ResultCode::kCorrupt;
    }
    for (u32 i = 0; i < num_cells; i++) {
      u32 key = p_node->GetLeafKey(i);
      if (i == 0 ? (has_lower_bound && key <= lower_bound)
                 : key <= p_node->GetLeafKey(i - 1)) {
        PAGEDB_TRACE3("CORRUPT key %u out of order on page %u\n", key,
                      page_number);
        return ResultCode::kCorrupt;
      }
    }
    max_key = p_node->GetLeafMaxKey();
    leaves.push_back(page_number);
    return ResultCode::kOk;
  }

  u32 num_keys = p_node->GetInternalNumKeys();
  if (num_keys == 0 || num_keys > kInternalNodeMaxKeys) {
    return ResultCode::kCorrupt;
  }
  for (u32 i = 0; i <= num_keys; i++) {
    u32 child_max_key = 0;
    rc = VerifyNode(p_node->GetInternalChild(i), page_number, has_lower_bound,
                    lower_bound, depth + 1, leaf_depth, child_max_key, leaves,
                    num_visited);
    if (rc != ResultCode::kOk) {
      return rc;
    }
    if (i < num_keys) {
      if (p_node->GetInternalKey(i) != child_max_key) {
        PAGEDB_TRACE3("CORRUPT stale key %u on page %u\n",
                      p_node->GetInternalKey(i), page_number);
        return ResultCode::kCorrupt;
      }
      has_lower_bound = true;
      lower_bound = child_max_key;
    }
    max_key = child_max_key;
  }
  return ResultCode::kOk;
}
