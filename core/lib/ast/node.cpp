// hecate/ast/node.cpp - Node kernel derived operations
#include "hecate/ast/node.hpp"

#include <algorithm>
#include <vector>

namespace hecate
{

bool Node::is_leaf() const { return children().empty(); }

size_t Node::depth() const
{
  const NodeList kids = children();
  if (kids.empty()) {
    return 0;
  }
  size_t deepest = 0;
  for (const Node * child : kids) {
    deepest = std::max(deepest, child->depth());
  }
  return deepest + 1;
}

size_t Node::node_count() const
{
  size_t count = 1;
  for (const Node * child : children()) {
    count += child->node_count();
  }
  return count;
}

NodeList Node::find_all(NodeKind kind) const
{
  NodeList out;
  if (kind_ == kind) {
    out.push_back(this);
  }
  for (const Node * child : children()) {
    const NodeList found = child->find_all(kind);
    out.insert(out.end(), found.begin(), found.end());
  }
  return out;
}

const Node * Node::find_first(NodeKind kind) const
{
  if (kind_ == kind) {
    return this;
  }
  for (const Node * child : children()) {
    if (const Node * found = child->find_first(kind)) {
      return found;
    }
  }
  return nullptr;
}

bool Node::contains(NodeKind kind) const { return find_first(kind) != nullptr; }

// ============================================================================
// Parent link
// ============================================================================

NodeList Node::ancestors() const
{
  NodeList out;
  for (const Node * p = parent_; p != nullptr; p = p->parent_) {
    out.push_back(p);
  }
  return out;
}

NodeList Node::siblings() const
{
  if (parent_ == nullptr) {
    return {};
  }
  NodeList out = parent_->children();
  out.erase(std::remove(out.begin(), out.end(), this), out.end());
  return out;
}

bool Node::is_ancestor_of(const Node & other) const noexcept
{
  for (const Node * p = other.parent_; p != nullptr; p = p->parent_) {
    if (p == this) {
      return true;
    }
  }
  return false;
}

bool Node::is_descendant_of(const Node & other) const noexcept
{
  return other.is_ancestor_of(*this);
}

void link_parents(const Node & root)
{
  std::vector<const Node *> stack{&root};
  while (!stack.empty()) {
    const Node * node = stack.back();
    stack.pop_back();
    for (const Node * child : node->children()) {
      if (child->is_shared()) {
        continue;
      }
      child->set_parent(node);
      stack.push_back(child);
    }
  }
}

// ============================================================================
// Capabilities
// ============================================================================

std::optional<DisplayField> display_field_of(const Node & node)
{
  if (const auto * d = dynamic_cast<const HasDisplayField *>(&node)) {
    return d->display_field();
  }
  return std::nullopt;
}

void run_validation_hook(const Node & node, DiagnosticBag & diags)
{
  if (const auto * v = dynamic_cast<const Validatable *>(&node)) {
    v->validate(diags);
  }
}

}  // namespace hecate
