/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "InsnList.h"

#include "Debug.h"

InsnList::~InsnList() { m_list.clear_and_dispose(disposer); }

InsnNode* InsnList::push_back(std::unique_ptr<JvmInstruction> insn) {
  always_assert(insn != nullptr);
  auto* node = new InsnNode(std::move(insn));
  m_list.push_back(*node);
  m_modified = true;
  return node;
}

InsnNode* InsnList::push_back_label() {
  auto* node = new InsnNode();
  m_list.push_back(*node);
  m_modified = true;
  return node;
}

InsnNode* InsnList::push_back_label(std::unique_ptr<InsnNode> label) {
  always_assert(label != nullptr && label->is_label() && !label->is_linked());
  auto* node = label.release();
  m_list.push_back(*node);
  m_modified = true;
  return node;
}

InsnNode* InsnList::insert_before(InsnNode* position,
                                  std::unique_ptr<JvmInstruction> insn) {
  always_assert(position != nullptr && position->is_linked());
  always_assert(insn != nullptr);
  auto* node = new InsnNode(std::move(insn));
  m_list.insert(m_list.iterator_to(*position), *node);
  m_modified = true;
  return node;
}

InsnNode* InsnList::insert_after(InsnNode* position,
                                 std::unique_ptr<JvmInstruction> insn) {
  always_assert(position != nullptr && position->is_linked());
  always_assert(insn != nullptr);
  auto* node = new InsnNode(std::move(insn));
  m_list.insert(std::next(m_list.iterator_to(*position)), *node);
  m_modified = true;
  return node;
}

void InsnList::remove(InsnNode* node) {
  always_assert(node != nullptr);
  if (!node->is_linked()) {
    return;
  }
  m_list.erase(m_list.iterator_to(*node));
  m_removed.emplace_back(node);
  m_modified = true;
}

void InsnList::replace(InsnNode* node, std::unique_ptr<JvmInstruction> insn) {
  insert_before(node, std::move(insn));
  remove(node);
}

void InsnList::clear() {
  while (!m_list.empty()) {
    auto& node = m_list.front();
    m_list.pop_front();
    m_removed.emplace_back(&node);
  }
  m_modified = true;
}

InsnNode* InsnList::get(size_t index) const {
  always_assert_log(index < m_list.size(), "Index %zu out of %zu", index,
                    m_list.size());
  auto it = m_list.begin();
  std::advance(it, index);
  return const_cast<InsnNode*>(&*it);
}

std::vector<InsnNode*> InsnList::to_vector() const {
  std::vector<InsnNode*> nodes;
  nodes.reserve(m_list.size());
  for (const auto& node : m_list) {
    nodes.push_back(const_cast<InsnNode*>(&node));
  }
  return nodes;
}

void InsnList::purge_removed() { m_removed.clear(); }
