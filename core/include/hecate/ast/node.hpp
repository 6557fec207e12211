// hecate/ast/node.hpp - Node kernel
//
// Every node kind, whatever its representation strategy, implements the five
// kernel primitives declared here. The remaining operations (depth, counts,
// searches, parent navigation) are written once against those primitives.
//
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hecate/ast/ast_enums.hpp"
#include "hecate/ast/ast_fwd.hpp"
#include "hecate/basic/casting.hpp"
#include "hecate/basic/span.hpp"

namespace hecate
{

class DiagnosticBag;
class NodeVisitor;

using NodeList = std::vector<const Node *>;

// ============================================================================
// Node - Kernel contract
// ============================================================================

/**
 * Abstract base of every AST node.
 *
 * Nodes live in an AstContext (or, for pooled leaves, in a NodePool) and are
 * handled through `const Node *`. They are never destroyed individually, so
 * the destructor is protected, non-virtual and trivial.
 *
 * Equality, cloning and the recursive queries assume a tree. Presenting a
 * cyclic graph to them is a contract violation; run StructuralValidator
 * first when the input is untrusted.
 */
class Node
{
public:
  Node(const Node &) = delete;
  Node & operator=(const Node &) = delete;
  Node(Node &&) = delete;
  Node & operator=(Node &&) = delete;

  [[nodiscard]] NodeKind kind() const noexcept { return kind_; }
  [[nodiscard]] std::string_view kind_name() const noexcept { return to_string(kind_); }

  static bool classof(const Node * /*node*/) noexcept { return true; }

  // ===========================================================================
  // Kernel primitives
  // ===========================================================================

  [[nodiscard]] virtual Span span() const noexcept = 0;

  /**
   * Node-typed fields in declaration order.
   * Absent optional children are skipped; sequence fields contribute every
   * element in order; primitive fields never appear.
   */
  [[nodiscard]] virtual NodeList children() const = 0;

  virtual void accept(NodeVisitor & visitor) const = 0;

  /// Structural equality: same kind, span, primitive fields and deep children
  [[nodiscard]] virtual bool equals(const Node & other) const = 0;

  /**
   * Copy this subtree into `ctx`.
   * Pooled leaves return themselves; everything else is a fresh object.
   */
  [[nodiscard]] virtual const Node * clone(AstContext & ctx) const = 0;

  // ===========================================================================
  // Derived operations
  // ===========================================================================

  [[nodiscard]] virtual bool is_leaf() const;

  /// 0 for a leaf, otherwise 1 + deepest child
  [[nodiscard]] virtual size_t depth() const;

  /// Number of nodes in the subtree, this one included
  [[nodiscard]] virtual size_t node_count() const;

  /// Preorder search by kind
  [[nodiscard]] virtual NodeList find_all(NodeKind kind) const;
  [[nodiscard]] virtual const Node * find_first(NodeKind kind) const;
  [[nodiscard]] virtual bool contains(NodeKind kind) const;

  /// Preorder search for a class or category (anything with classof)
  template <typename T>
  [[nodiscard]] std::vector<const T *> find_all() const
  {
    std::vector<const T *> out;
    collect_matching<T>(*this, out);
    return out;
  }

  template <typename T>
  [[nodiscard]] const T * find_first() const
  {
    if (const auto * self = dyn_cast<T>(this)) {
      return self;
    }
    for (const Node * child : children()) {
      if (const T * found = child->find_first<T>()) {
        return found;
      }
    }
    return nullptr;
  }

  template <typename T>
  [[nodiscard]] bool contains() const
  {
    return find_first<T>() != nullptr;
  }

  // ===========================================================================
  // Parent link
  // ===========================================================================
  //
  // Informational only. Set by whoever assembles the tree (see
  // link_parents); never used for ownership. Pooled kinds may be shared by
  // many trees and threads, so they never record a parent: parent() stays
  // null and set_parent() ignores them.

  /// True for kinds whose instances may be shared through a NodePool
  [[nodiscard]] bool is_shared() const noexcept
  {
    return representation_of(kind_) == Representation::Pooled;
  }

  [[nodiscard]] const Node * parent() const noexcept { return parent_; }

  void set_parent(const Node * parent) const noexcept
  {
    if (!is_shared()) {
      parent_ = parent;
    }
  }

  /// Parent chain, nearest first
  [[nodiscard]] NodeList ancestors() const;

  /// Parent's children except this node (identity comparison)
  [[nodiscard]] NodeList siblings() const;

  [[nodiscard]] bool is_ancestor_of(const Node & other) const noexcept;
  [[nodiscard]] bool is_descendant_of(const Node & other) const noexcept;

protected:
  explicit Node(NodeKind kind) noexcept : kind_(kind) {}
  ~Node() = default;

private:
  template <typename T>
  static void collect_matching(const Node & node, std::vector<const T *> & out)
  {
    if (const auto * match = dyn_cast<T>(&node)) {
      out.push_back(match);
    }
    for (const Node * child : node.children()) {
      collect_matching<T>(*child, out);
    }
  }

  NodeKind kind_;
  mutable const Node * parent_ = nullptr;
};

/**
 * Set the parent link of every node under `root`.
 * Root's own link is untouched; shared (pooled) leaves are skipped, so
 * trees that share leaves can be linked concurrently.
 */
void link_parents(const Node & root);

// ============================================================================
// Category bases
// ============================================================================

class Expr : public Node
{
public:
  static bool classof(const Node * node) noexcept { return is_expr_kind(node->kind()); }

protected:
  using Node::Node;
  ~Expr() = default;
};

class Stmt : public Node
{
public:
  static bool classof(const Node * node) noexcept { return is_stmt_kind(node->kind()); }

protected:
  using Node::Node;
  ~Stmt() = default;
};

class Decl : public Node
{
public:
  static bool classof(const Node * node) noexcept { return is_decl_kind(node->kind()); }

protected:
  using Node::Node;
  ~Decl() = default;
};

// ============================================================================
// Optional capabilities
// ============================================================================

/**
 * Per-node custom checks run by the validators.
 * Findings are reported into the bag; a hook never throws for bad input.
 */
class Validatable
{
public:
  virtual void validate(DiagnosticBag & diags) const = 0;

protected:
  Validatable() = default;
  ~Validatable() = default;
  Validatable(const Validatable &) = default;
  Validatable & operator=(const Validatable &) = default;
};

/// A simple scalar field surfaced to generic renderers
struct DisplayField
{
  std::string_view name;  ///< "value", "name", "operator"
  std::string text;
};

class HasDisplayField
{
public:
  [[nodiscard]] virtual DisplayField display_field() const = 0;

protected:
  HasDisplayField() = default;
  ~HasDisplayField() = default;
  HasDisplayField(const HasDisplayField &) = default;
  HasDisplayField & operator=(const HasDisplayField &) = default;
};

/**
 * Best-effort field lookup for printers and serializers.
 * Returns nullopt for kinds that do not opt in.
 */
[[nodiscard]] std::optional<DisplayField> display_field_of(const Node & node);

/// Run the node's own validation hook, if it has one
void run_validation_hook(const Node & node, DiagnosticBag & diags);

}  // namespace hecate
