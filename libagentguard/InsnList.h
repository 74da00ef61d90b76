/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/intrusive/list.hpp>
#include <memory>
#include <vector>

#include "JvmInstruction.h"

enum InsnNodeType {
  // The target of a branch or switch, or a boundary of a handler range,
  // local variable range or line number. Encodes to no bytes.
  INSN_LABEL,
  INSN_OPCODE,
};

struct InsnNode {
  boost::intrusive::list_member_hook<> list_hook_;
  InsnNodeType type;
  std::unique_ptr<JvmInstruction> insn;

  InsnNode() : type(INSN_LABEL) {}
  explicit InsnNode(std::unique_ptr<JvmInstruction> insn)
      : type(INSN_OPCODE), insn(std::move(insn)) {}

  bool is_label() const { return type == INSN_LABEL; }

  // False once the node has been removed from its list.
  bool is_linked() const { return list_hook_.is_linked(); }
};

using InsnNodeMemberListOption =
    boost::intrusive::member_hook<InsnNode,
                                  boost::intrusive::list_member_hook<>,
                                  &InsnNode::list_hook_>;

/*
 * The ordered, mutable instruction sequence of one method body.
 *
 * Removed nodes are unlinked but stay allocated until purge_removed() (or
 * destruction), so a snapshot taken with to_vector() remains safe to walk
 * while the list is being cleared or rewritten underneath it.
 */
class InsnList {
 private:
  using IntrusiveList =
      boost::intrusive::list<InsnNode, InsnNodeMemberListOption>;

  IntrusiveList m_list;
  std::vector<std::unique_ptr<InsnNode>> m_removed;
  bool m_modified{false};

  static void disposer(InsnNode* node) { delete node; }

 public:
  using iterator = IntrusiveList::iterator;
  using const_iterator = IntrusiveList::const_iterator;

  InsnList() = default;
  InsnList(const InsnList&) = delete;
  InsnList& operator=(const InsnList&) = delete;
  ~InsnList();

  // Number of nodes, labels included.
  size_t size() const { return m_list.size(); }
  bool empty() const { return m_list.empty(); }

  iterator begin() { return m_list.begin(); }
  iterator end() { return m_list.end(); }
  const_iterator begin() const { return m_list.begin(); }
  const_iterator end() const { return m_list.end(); }

  InsnNode* push_back(std::unique_ptr<JvmInstruction> insn);
  InsnNode* push_back(JvmOpcode op) {
    return push_back(std::make_unique<JvmInstruction>(op));
  }
  InsnNode* push_back_label();
  // Links a label made with make_label(), e.g. the target of a forward jump.
  InsnNode* push_back_label(std::unique_ptr<InsnNode> label);

  static std::unique_ptr<InsnNode> make_label() {
    return std::make_unique<InsnNode>();
  }

  InsnNode* insert_before(InsnNode* position,
                          std::unique_ptr<JvmInstruction> insn);
  InsnNode* insert_after(InsnNode* position,
                         std::unique_ptr<JvmInstruction> insn);

  void remove(InsnNode* node);
  void replace(InsnNode* node, std::unique_ptr<JvmInstruction> insn);

  // Removes every node.
  void clear();

  // Positional access; linear in `index`.
  InsnNode* get(size_t index) const;

  std::vector<InsnNode*> to_vector() const;

  // Frees the nodes removed since the last purge. No snapshot may be in use.
  void purge_removed();

  // True if the list was mutated since it was built or last marked clean.
  bool is_modified() const { return m_modified; }
  void mark_clean() { m_modified = false; }
};
