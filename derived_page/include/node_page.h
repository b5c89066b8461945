#pragma once

#include <memory>

#include "pager.h"
#include "row.h"
#include "sql_int.h"
#include "sql_limit.h"

/*
 * The first byte of every node. Any other value on disk is corruption.
 */
enum class NodeType : u8 {
  kLeaf = 0,
  kInternal = 1,
};

/* ------------------------------------
 *  Common node header (6 bytes)
 *
 *  | node_type u8 @0 | is_root u8 @1 | parent u32 @2 |
 *  ------------------------------
 */
constexpr u32 kNodeTypeSize = sizeof(u8);
constexpr u32 kNodeTypeOffset = 0;
constexpr u32 kIsRootSize = sizeof(u8);
constexpr u32 kIsRootOffset = kNodeTypeOffset + kNodeTypeSize;
constexpr u32 kParentPointerSize = sizeof(PageNumber);
constexpr u32 kParentPointerOffset = kIsRootOffset + kIsRootSize;
constexpr u32 kCommonNodeHeaderSize =
    kNodeTypeSize + kIsRootSize + kParentPointerSize;

/* ------------------------------------
 *  Leaf node header (14 bytes)
 *
 *  | common | num_cells u32 @6 | next_leaf u32 @10 |
 *
 *  Followed by num_cells cells of (key u32, row) in ascending key order.
 *  ------------------------------
 */
constexpr u32 kLeafNodeNumCellsSize = sizeof(u32);
constexpr u32 kLeafNodeNumCellsOffset = kCommonNodeHeaderSize;
constexpr u32 kLeafNodeNextLeafSize = sizeof(PageNumber);
constexpr u32 kLeafNodeNextLeafOffset =
    kLeafNodeNumCellsOffset + kLeafNodeNumCellsSize;
constexpr u32 kLeafNodeHeaderSize =
    kCommonNodeHeaderSize + kLeafNodeNumCellsSize + kLeafNodeNextLeafSize;

constexpr u32 kLeafNodeKeySize = sizeof(u32);
constexpr u32 kLeafNodeKeyOffset = 0;
constexpr u32 kLeafNodeValueSize = kRowSize;
constexpr u32 kLeafNodeValueOffset = kLeafNodeKeyOffset + kLeafNodeKeySize;
constexpr u32 kLeafNodeCellSize = kLeafNodeKeySize + kLeafNodeValueSize;
constexpr u32 kLeafNodeSpaceForCells = kPageSize - kLeafNodeHeaderSize;
constexpr u32 kLeafNodeMaxCells = kLeafNodeSpaceForCells / kLeafNodeCellSize;

// When a full leaf splits, the kLeafNodeMaxCells existing cells plus the new
// one are divided between the old node (left) and the new node (right).
constexpr u32 kLeafNodeLeftSplitCount = (kLeafNodeMaxCells + 2) / 2;
constexpr u32 kLeafNodeRightSplitCount =
    (kLeafNodeMaxCells + 1) - kLeafNodeLeftSplitCount;

/* ------------------------------------
 *  Internal node header (14 bytes)
 *
 *  | common | num_keys u32 @6 | right_child u32 @10 |
 *
 *  Followed by num_keys cells of (child u32, key u32).
 *  ------------------------------
 */
constexpr u32 kInternalNodeNumKeysSize = sizeof(u32);
constexpr u32 kInternalNodeNumKeysOffset = kCommonNodeHeaderSize;
constexpr u32 kInternalNodeRightChildSize = sizeof(PageNumber);
constexpr u32 kInternalNodeRightChildOffset =
    kInternalNodeNumKeysOffset + kInternalNodeNumKeysSize;
constexpr u32 kInternalNodeHeaderSize = kCommonNodeHeaderSize +
                                        kInternalNodeNumKeysSize +
                                        kInternalNodeRightChildSize;

constexpr u32 kInternalNodeChildSize = sizeof(PageNumber);
constexpr u32 kInternalNodeKeySize = sizeof(u32);
constexpr u32 kInternalNodeCellSize =
    kInternalNodeChildSize + kInternalNodeKeySize;
constexpr u32 kInternalNodeMaxKeys =
    (kPageSize - kInternalNodeHeaderSize) / kInternalNodeCellSize;

static_assert(kLeafNodeMaxCells == 13, "leaf layout is part of the file format");
static_assert(kInternalNodeMaxKeys == 510,
              "internal layout is part of the file format");

/*
 * Information regarding internal nodes
 *
 * An internal node with num_keys keys has num_keys + 1 children. Child i
 * (i < num_keys) is stored beside key i, and key i is the largest key found
 * anywhere in the subtree of child i. The last child has no key of its own
 * and is stored in the header as right_child:
 *
 * | Child(0) | Key(0) | Child(1) | Key(1) | .... | Child(N-1) | Key(N-1) | RightChild |
 *
 * To find a key, take the first child whose key is greater than or equal to
 * the key you are looking for. If there is none, take the right child.
 */

/**
 * @class NodePage
 *
 * @brief This class represents a page that is used as a node in the Btree.
 *
 * It holds p_image_, a smart pointer to the byte array of the page
 * (inherited from BasePage). Every field of the node lives in the page image,
 * there are no member variables that mirror them. The accessors below read
 * and write the image directly, so the cached page is the only copy of the
 * node and it is what the Pager writes back.
 *
 * All multi-byte integers are stored little-endian regardless of the host.
 *
 * The member functions only handle operations that need no knowledge of
 * other pages. Anything that follows a page number (descending the tree,
 * finding the max key of a subtree, splitting) is done by the Btree class.
 */
class NodePage : public BasePage {
 public:
  NodePage() = default;

  // ####################### Common header #######################

  [[nodiscard]] NodeType GetNodeType() const;
  void SetNodeType(NodeType type);

  // False if the type byte holds neither kLeaf nor kInternal
  [[nodiscard]] bool HasValidNodeType() const;

  [[nodiscard]] bool IsRoot() const;
  void SetRoot(bool is_root);

  [[nodiscard]] PageNumber GetParent() const;
  void SetParent(PageNumber parent);

  // ######################## Leaf node ##########################

  // Count 0, no next leaf, not the root
  void InitializeLeafNode();

  [[nodiscard]] u32 GetLeafNumCells() const;
  void SetLeafNumCells(u32 num_cells);

  [[nodiscard]] PageNumber GetLeafNextLeaf() const;
  void SetLeafNextLeaf(PageNumber next_leaf);

  // Byte offset of cell cell_idx in the page image
  [[nodiscard]] static u32 LeafCellOffset(u32 cell_idx);

  [[nodiscard]] u32 GetLeafKey(u32 cell_idx) const;
  void SetLeafKey(u32 cell_idx, u32 key);

  void GetLeafRow(u32 cell_idx, Row &row) const;
  void SetLeafRow(u32 cell_idx, const Row &row);

  // Binary search. Returns the index of the first cell whose key is greater
  // than or equal to key (num_cells if there is none), and sets found if that
  // cell holds key exactly.
  [[nodiscard]] u32 LeafFindCell(u32 key, bool &found) const;

  // Copies one whole cell from src (which may be this page) into this page.
  void CopyLeafCell(const NodePage &src, u32 src_idx, u32 dest_idx);

  // Moves count cells starting at src_idx so they start at dest_idx. The
  // ranges may overlap.
  void MoveLeafCells(u32 src_idx, u32 dest_idx, u32 count);

  // Largest key on this leaf, 0 if it is empty
  [[nodiscard]] u32 GetLeafMaxKey() const;

  // ###################### Internal node ########################

  // Count 0, no right child, not the root
  void InitializeInternalNode();

  [[nodiscard]] u32 GetInternalNumKeys() const;
  void SetInternalNumKeys(u32 num_keys);

  [[nodiscard]] PageNumber GetInternalRightChild() const;
  void SetInternalRightChild(PageNumber right_child);

  // child_idx == num_keys addresses the right child
  [[nodiscard]] PageNumber GetInternalChild(u32 child_idx) const;
  void SetInternalChild(u32 child_idx, PageNumber child);

  [[nodiscard]] u32 GetInternalKey(u32 key_idx) const;
  void SetInternalKey(u32 key_idx, u32 key);

  // Binary search. Returns the index of the first key greater than or equal
  // to key, or num_keys if every key is smaller.
  [[nodiscard]] u32 InternalFindChild(u32 key) const;

  // Copies one (child, key) cell from src (which may be this page) into this
  // page.
  void CopyInternalCell(const NodePage &src, u32 src_idx, u32 dest_idx);

  // Moves count cells starting at src_idx so they start at dest_idx. The
  // ranges may overlap.
  void MoveInternalCells(u32 src_idx, u32 dest_idx, u32 count);

  // Public function for BasePage inheritance
  static std::unique_ptr<BasePage> CreateDerivedPage();

 private:
  // Private helper functions for reading and writing little-endian integers
  // in the page image. They keep std::memcpy out of the accessors.
  [[nodiscard]] u8 GetU8(u32 offset) const;
  void SetU8(u32 offset, u8 value);
  [[nodiscard]] u32 GetU32(u32 offset) const;
  void SetU32(u32 offset, u32 value);

  [[nodiscard]] static u32 InternalCellOffset(u32 cell_idx);
};
