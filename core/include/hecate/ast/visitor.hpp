// hecate/ast/visitor.hpp - Result-typed visitors and transformers
//
// Double dispatch: Visitor<T>::visit(node) calls node.accept(*this), the
// node's strategy calls back dispatch(const Class *), and dispatch forwards
// to the kind's visit_<snake>() and stores its result.
//
#pragma once

#include <gsl/gsl>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "hecate/ast/ast.hpp"
#include "hecate/ast/ast_context.hpp"
#include "hecate/ast/node.hpp"
#include "hecate/ast/node_visitor.hpp"
#include "hecate/basic/casting.hpp"

namespace hecate
{

// ============================================================================
// Visitor<T>
// ============================================================================

/**
 * Visitor computing a value of type T per node.
 *
 * Derived classes implement one visit_<snake>() per concrete kind and
 * recurse by calling visit() on whichever children they care about.
 * visit() is reentrant and lets exceptions from visit methods propagate.
 *
 * Usage:
 * @code
 *   class Evaluator : public Visitor<int64_t> {
 *     int64_t visit_int_lit(const IntLit * n) override { return n->value; }
 *     int64_t visit_add(const Add * n) override { return visit(n->lhs) + visit(n->rhs); }
 *     ...
 *   };
 * @endcode
 */
template <typename T>
class Visitor : public NodeVisitor
{
public:
  using result_type = T;

  Visitor() = default;
  virtual ~Visitor() = default;

  Visitor(const Visitor &) = delete;
  Visitor & operator=(const Visitor &) = delete;

  T visit(const Node & node)
  {
    std::optional<T> result;
    std::optional<T> * const outer = result_;
    result_ = &result;
    auto restore = gsl::finally([this, outer] { result_ = outer; });

    node.accept(*this);
    return std::move(*result);
  }

  /// Null children visit to a value-initialized T
  T visit(const Node * node)
  {
    if (node == nullptr) {
      return T();
    }
    return visit(*node);
  }

#define AST_NODE(Class, Kind, Snake, Repr) virtual T visit_##Snake(const Class * node) = 0;
#include "hecate/ast/ast_nodes.def"

private:
#define AST_NODE(Class, Kind, Snake, Repr)       \
  void dispatch(const Class * node) final        \
  {                                              \
    T value = visit_##Snake(node);               \
    if (result_ != nullptr) {                    \
      result_->emplace(std::move(value));        \
    }                                            \
  }
#include "hecate/ast/ast_nodes.def"

  /// Slot of the innermost visit() in progress
  std::optional<T> * result_ = nullptr;
};

template <>
class Visitor<void> : public NodeVisitor
{
public:
  using result_type = void;

  Visitor() = default;
  virtual ~Visitor() = default;

  Visitor(const Visitor &) = delete;
  Visitor & operator=(const Visitor &) = delete;

  void visit(const Node & node) { node.accept(*this); }

  void visit(const Node * node)
  {
    if (node != nullptr) {
      node->accept(*this);
    }
  }

#define AST_NODE(Class, Kind, Snake, Repr) virtual void visit_##Snake(const Class * node) = 0;
#include "hecate/ast/ast_nodes.def"

private:
#define AST_NODE(Class, Kind, Snake, Repr) \
  void dispatch(const Class * node) final { visit_##Snake(node); }
#include "hecate/ast/ast_nodes.def"
};

// ============================================================================
// RecursiveVisitor
// ============================================================================

/**
 * Visitor<void> whose default for every kind is to visit the children.
 * Override the kinds of interest and call visit_children() to keep walking.
 */
class RecursiveVisitor : public Visitor<void>
{
public:
  void visit_children(const Node & node)
  {
    for (const Node * child : node.children()) {
      visit(*child);
    }
  }

#define AST_NODE(Class, Kind, Snake, Repr) \
  void visit_##Snake(const Class * node) override { visit_children(*node); }
#include "hecate/ast/ast_nodes.def"
};

// ============================================================================
// Transformer
// ============================================================================

/**
 * Visitor that produces a node per node.
 *
 * Every visit method defaults to returning the node unchanged. A concrete
 * transformer overrides the kinds it rewrites, transforms the children it
 * needs, and builds replacement nodes in context(). Input trees are never
 * modified.
 */
class Transformer : public Visitor<const Node *>
{
public:
  explicit Transformer(AstContext & ctx) noexcept : ctx_(ctx) {}

#define AST_NODE(Class, Kind, Snake, Repr) \
  const Node * visit_##Snake(const Class * node) override { return node; }
#include "hecate/ast/ast_nodes.def"

  /**
   * Transform a child slot of static type T (Expr, Stmt, a concrete kind).
   *
   * @throws std::logic_error if the result is not a T
   */
  template <typename T>
  const T * transform(const T * node)
  {
    if (node == nullptr) {
      return nullptr;
    }
    const Node * result = visit(*node);
    const auto * typed = dyn_cast<T>(result);
    if (typed == nullptr) {
      throw std::logic_error(
        "transformer replaced a " + std::string(node->kind_name()) + " with " +
        (result == nullptr ? std::string("null") : std::string(result->kind_name())));
    }
    return typed;
  }

  /// Transform every element into a new arena array
  template <typename T>
  gsl::span<const T *> transform_all(gsl::span<const T *> nodes)
  {
    auto out = ctx_.allocate_array<const T *>(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
      out[i] = transform(nodes[i]);
    }
    return out;
  }

protected:
  [[nodiscard]] AstContext & context() noexcept { return ctx_; }

private:
  AstContext & ctx_;
};

}  // namespace hecate
