// hecate/ast/traversal.hpp - Generic tree walks
//
// Stateless algorithms written against the node kernel only, so they work on
// trees mixing every representation strategy. None of them guard against
// cycles; validate untrusted trees with StructuralValidator first.
//
#pragma once

#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

#include "hecate/ast/node.hpp"
#include "hecate/basic/casting.hpp"

namespace hecate::traversal
{

/// Visit each node before its children (left to right)
template <typename Fn>
void preorder(const Node & node, Fn && fn)
{
  fn(node);
  for (const Node * child : node.children()) {
    preorder(*child, fn);
  }
}

/// Visit each node after all of its children
template <typename Fn>
void postorder(const Node & node, Fn && fn)
{
  for (const Node * child : node.children()) {
    postorder(*child, fn);
  }
  fn(node);
}

/// Breadth-first, left to right within a level
template <typename Fn>
void level_order(const Node & root, Fn && fn)
{
  std::deque<const Node *> queue{&root};
  while (!queue.empty()) {
    const Node * node = queue.front();
    queue.pop_front();
    fn(*node);
    for (const Node * child : node->children()) {
      queue.push_back(child);
    }
  }
}

/// Preorder with each node's distance from `node` (which is 0)
template <typename Fn>
void with_depth(const Node & node, Fn && fn, size_t depth = 0)
{
  fn(node, depth);
  for (const Node * child : node.children()) {
    with_depth(*child, fn, depth + 1);
  }
}

/// Every node of `kind`, in preorder
[[nodiscard]] inline NodeList find_all(const Node & root, NodeKind kind)
{
  NodeList out;
  preorder(root, [&out, kind](const Node & n) {
    if (n.kind() == kind) {
      out.push_back(&n);
    }
  });
  return out;
}

/// Every node that is a T (concrete kind or category), in preorder
template <typename T>
[[nodiscard]] std::vector<const T *> find_all(const Node & root)
{
  std::vector<const T *> out;
  preorder(root, [&out](const Node & n) {
    if (const auto * match = dyn_cast<T>(&n)) {
      out.push_back(match);
    }
  });
  return out;
}

/// First T in preorder, or nullptr; stops at the first match
template <typename T>
[[nodiscard]] const T * find_first(const Node & root)
{
  if (const auto * match = dyn_cast<T>(&root)) {
    return match;
  }
  for (const Node * child : root.children()) {
    if (const T * found = find_first<T>(*child)) {
      return found;
    }
  }
  return nullptr;
}

/// Preorder snapshot of the whole tree
[[nodiscard]] inline NodeList collect_preorder(const Node & root)
{
  NodeList out;
  preorder(root, [&out](const Node & n) { out.push_back(&n); });
  return out;
}

[[nodiscard]] inline NodeList collect_postorder(const Node & root)
{
  NodeList out;
  postorder(root, [&out](const Node & n) { out.push_back(&n); });
  return out;
}

[[nodiscard]] inline NodeList collect_level_order(const Node & root)
{
  NodeList out;
  level_order(root, [&out](const Node & n) { out.push_back(&n); });
  return out;
}

}  // namespace hecate::traversal
