#include "node_page.h"

#include <boost/endian/conversion.hpp>
#include <cstring>

/**
 * Function called by pager to create the page
 */
std::unique_ptr<BasePage> NodePage::CreateDerivedPage() {
  return std::make_unique<NodePage>();
}

u8 NodePage::GetU8(u32 offset) const {
  return static_cast<u8>((*p_image_)[offset]);
}

void NodePage::SetU8(u32 offset, u8 value) {
  (*p_image_)[offset] = static_cast<std::byte>(value);
}

/**
 * Reads a little-endian u32 stored at the specified index of p_image_
 */
u32 NodePage::GetU32(u32 offset) const {
  u32 value = 0;
  std::memcpy(&value, p_image_->data() + offset, sizeof(u32));
  return boost::endian::little_to_native(value);
}

/**
 * Writes a u32 at the specified index of p_image_ as little-endian
 */
void NodePage::SetU32(u32 offset, u32 value) {
  u32 value_le = boost::endian::native_to_little(value);
  std::memcpy(p_image_->data() + offset, &value_le, sizeof(u32));
}

// ---------------------------------------------------------------------------
// Common header
// ---------------------------------------------------------------------------

NodeType NodePage::GetNodeType() const {
  return static_cast<NodeType>(GetU8(kNodeTypeOffset));
}

void NodePage::SetNodeType(NodeType type) {
  SetU8(kNodeTypeOffset, static_cast<u8>(type));
}

bool NodePage::HasValidNodeType() const {
  u8 type = GetU8(kNodeTypeOffset);
  return type == static_cast<u8>(NodeType::kLeaf) ||
         type == static_cast<u8>(NodeType::kInternal);
}

bool NodePage::IsRoot() const { return GetU8(kIsRootOffset) != 0; }

void NodePage::SetRoot(bool is_root) {
  SetU8(kIsRootOffset, is_root ? 1 : 0);
}

PageNumber NodePage::GetParent() const {
  return GetU32(kParentPointerOffset);
}

void NodePage::SetParent(PageNumber parent) {
  SetU32(kParentPointerOffset, parent);
}

// ---------------------------------------------------------------------------
// Leaf node
// ---------------------------------------------------------------------------

void NodePage::InitializeLeafNode() {
  SetNodeType(NodeType::kLeaf);
  SetRoot(false);
  SetLeafNumCells(0);
  SetLeafNextLeaf(kNoPage);
}

u32 NodePage::GetLeafNumCells() const {
  return GetU32(kLeafNodeNumCellsOffset);
}

void NodePage::SetLeafNumCells(u32 num_cells) {
  SetU32(kLeafNodeNumCellsOffset, num_cells);
}

PageNumber NodePage::GetLeafNextLeaf() const {
  return GetU32(kLeafNodeNextLeafOffset);
}

void NodePage::SetLeafNextLeaf(PageNumber next_leaf) {
  SetU32(kLeafNodeNextLeafOffset, next_leaf);
}

u32 NodePage::LeafCellOffset(u32 cell_idx) {
  return kLeafNodeHeaderSize + cell_idx * kLeafNodeCellSize;
}

u32 NodePage::GetLeafKey(u32 cell_idx) const {
  return GetU32(LeafCellOffset(cell_idx) + kLeafNodeKeyOffset);
}

void NodePage::SetLeafKey(u32 cell_idx, u32 key) {
  SetU32(LeafCellOffset(cell_idx) + kLeafNodeKeyOffset, key);
}

void NodePage::GetLeafRow(u32 cell_idx, Row &row) const {
  DeserializeRow(
      p_image_->data() + LeafCellOffset(cell_idx) + kLeafNodeValueOffset, row);
}

void NodePage::SetLeafRow(u32 cell_idx, const Row &row) {
  SerializeRow(row, p_image_->data() + LeafCellOffset(cell_idx) +
                        kLeafNodeValueOffset);
}

u32 NodePage::LeafFindCell(u32 key, bool &found) const {
  u32 min_idx = 0;
  u32 one_past_max_idx = GetLeafNumCells();
  found = false;
  while (one_past_max_idx != min_idx) {
    u32 idx = min_idx + (one_past_max_idx - min_idx) / 2;
    u32 key_at_idx = GetLeafKey(idx);
    if (key == key_at_idx) {
      found = true;
      return idx;
    }
    if (key < key_at_idx) {
      one_past_max_idx = idx;
    } else {
      min_idx = idx + 1;
    }
  }
  return min_idx;
}

void NodePage::CopyLeafCell(const NodePage &src, u32 src_idx, u32 dest_idx) {
  // src may be this page and the cells may be the same one
  std::memmove(p_image_->data() + LeafCellOffset(dest_idx),
               src.p_image_->data() + LeafCellOffset(src_idx),
               kLeafNodeCellSize);
}

void NodePage::MoveLeafCells(u32 src_idx, u32 dest_idx, u32 count) {
  std::memmove(p_image_->data() + LeafCellOffset(dest_idx),
               p_image_->data() + LeafCellOffset(src_idx),
               count * kLeafNodeCellSize);
}

u32 NodePage::GetLeafMaxKey() const {
  u32 num_cells = GetLeafNumCells();
  return num_cells == 0 ? 0 : GetLeafKey(num_cells - 1);
}

// ---------------------------------------------------------------------------
// Internal node
// ---------------------------------------------------------------------------

void NodePage::InitializeInternalNode() {
  SetNodeType(NodeType::kInternal);
  SetRoot(false);
  SetInternalNumKeys(0);
  SetInternalRightChild(kNoPage);
}

u32 NodePage::GetInternalNumKeys() const {
  return GetU32(kInternalNodeNumKeysOffset);
}

void NodePage::SetInternalNumKeys(u32 num_keys) {
  SetU32(kInternalNodeNumKeysOffset, num_keys);
}

PageNumber NodePage::GetInternalRightChild() const {
  return GetU32(kInternalNodeRightChildOffset);
}

void NodePage::SetInternalRightChild(PageNumber right_child) {
  SetU32(kInternalNodeRightChildOffset, right_child);
}

u32 NodePage::InternalCellOffset(u32 cell_idx) {
  return kInternalNodeHeaderSize + cell_idx * kInternalNodeCellSize;
}

PageNumber NodePage::GetInternalChild(u32 child_idx) const {
  if (child_idx == GetInternalNumKeys()) {
    return GetInternalRightChild();
  }
  return GetU32(InternalCellOffset(child_idx));
}

void NodePage::SetInternalChild(u32 child_idx, PageNumber child) {
  if (child_idx == GetInternalNumKeys()) {
    SetInternalRightChild(child);
    return;
  }
  SetU32(InternalCellOffset(child_idx), child);
}

u32 NodePage::GetInternalKey(u32 key_idx) const {
  return GetU32(InternalCellOffset(key_idx) + kInternalNodeChildSize);
}

void NodePage::SetInternalKey(u32 key_idx, u32 key) {
  SetU32(InternalCellOffset(key_idx) + kInternalNodeChildSize, key);
}

u32 NodePage::InternalFindChild(u32 key) const {
  u32 min_idx = 0;
  u32 max_idx = GetInternalNumKeys();  // there is one more child than key
  while (min_idx != max_idx) {
    u32 idx = min_idx + (max_idx - min_idx) / 2;
    if (GetInternalKey(idx) >= key) {
      max_idx = idx;
    } else {
      min_idx = idx + 1;
    }
  }
  return min_idx;
}

void NodePage::CopyInternalCell(const NodePage &src, u32 src_idx,
                                u32 dest_idx) {
  std::memmove(p_image_->data() + InternalCellOffset(dest_idx),
               src.p_image_->data() + InternalCellOffset(src_idx),
               kInternalNodeCellSize);
}

void NodePage::MoveInternalCells(u32 src_idx, u32 dest_idx, u32 count) {
  std::memmove(p_image_->data() + InternalCellOffset(dest_idx),
               p_image_->data() + InternalCellOffset(src_idx),
               count * kInternalNodeCellSize);
}
