// hecate/ast/node_strategies.hpp - Representation strategies
//
// Concrete node classes derive from one of these CRTP templates and supply a
// `fields()` tuple; the template implements the kernel primitives from it.
//
//   StandardNode   fields stored directly, generic algorithms
//   OptimizedNode  same semantics, allocation-free leaf fast paths
//   PooledNode     single-value leaf shared through NodePool
//   ValueNode      wrapper around a plain value-type leaf
//
// All four may be mixed freely in one tree.
//
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

#include "hecate/ast/ast_context.hpp"
#include "hecate/ast/node.hpp"
#include "hecate/ast/node_fields.hpp"
#include "hecate/ast/node_pool.hpp"
#include "hecate/ast/node_visitor.hpp"

namespace hecate
{

// ============================================================================
// FieldNode - kernel primitives derived from fields()
// ============================================================================

/**
 * Shared implementation of the field-table strategies.
 *
 * @tparam Derived Concrete class; must provide `fields()` and a constructor
 *                 taking (fields..., Span)
 * @tparam Base    Category base (Expr, Stmt, Decl or Node)
 * @tparam K       NodeKind of Derived
 */
template <typename Derived, typename Base, NodeKind K>
class FieldNode : public Base
{
public:
  static constexpr NodeKind k_kind = K;

  static bool classof(const Node * node) noexcept { return node->kind() == K; }

  [[nodiscard]] Span span() const noexcept override { return span_; }

  [[nodiscard]] NodeList children() const override
  {
    return detail::collect_children(derived().fields());
  }

  void accept(NodeVisitor & visitor) const override { visitor.dispatch(&derived()); }

  [[nodiscard]] bool equals(const Node & other) const override
  {
    if (&other == this) {
      return true;
    }
    if (other.kind() != K || other.span() != span_) {
      return false;
    }
    return detail::fields_equal(derived().fields(), static_cast<const Derived &>(other).fields());
  }

  [[nodiscard]] const Node * clone(AstContext & ctx) const override
  {
    return std::apply(
      [&ctx, this](const auto &... f) {
        return ctx.create<Derived>(detail::clone_field(f, ctx)..., span_);
      },
      derived().fields());
  }

protected:
  explicit FieldNode(Span span) noexcept : Base(K), span_(span) {}
  ~FieldNode() = default;

  [[nodiscard]] const Derived & derived() const noexcept
  {
    return static_cast<const Derived &>(*this);
  }

private:
  Span span_;
};

// ============================================================================
// StandardNode
// ============================================================================

template <typename Derived, typename Base, NodeKind K>
class StandardNode : public FieldNode<Derived, Base, K>
{
public:
  static constexpr Representation k_representation = Representation::Standard;

protected:
  using FieldNode<Derived, Base, K>::FieldNode;
  ~StandardNode() = default;
};

// ============================================================================
// OptimizedNode
// ============================================================================

/**
 * Standard semantics with fast paths for all-primitive kinds.
 *
 * Whether a kind is a leaf is decided at compile time from its field table.
 * Leaves answer children/depth/node_count/search without walking or
 * allocating; non-leaf kinds use the generic algorithms.
 */
template <typename Derived, typename Base, NodeKind K>
class OptimizedNode : public FieldNode<Derived, Base, K>
{
  using Super = FieldNode<Derived, Base, K>;

public:
  static constexpr Representation k_representation = Representation::Optimized;

  using Node::contains;
  using Node::find_all;
  using Node::find_first;

  [[nodiscard]] NodeList children() const override
  {
    if constexpr (is_leaf_kind()) {
      return {};
    } else {
      return Super::children();
    }
  }

  [[nodiscard]] bool is_leaf() const override
  {
    if constexpr (is_leaf_kind()) {
      return true;
    } else {
      return Node::is_leaf();
    }
  }

  [[nodiscard]] size_t depth() const override
  {
    if constexpr (is_leaf_kind()) {
      return 0;
    } else {
      return Node::depth();
    }
  }

  [[nodiscard]] size_t node_count() const override
  {
    if constexpr (is_leaf_kind()) {
      return 1;
    } else {
      return Node::node_count();
    }
  }

  [[nodiscard]] NodeList find_all(NodeKind kind) const override
  {
    if constexpr (is_leaf_kind()) {
      return kind == K ? NodeList{this} : NodeList{};
    } else {
      return Node::find_all(kind);
    }
  }

  [[nodiscard]] const Node * find_first(NodeKind kind) const override
  {
    if constexpr (is_leaf_kind()) {
      return kind == K ? this : nullptr;
    } else {
      return Node::find_first(kind);
    }
  }

  [[nodiscard]] bool contains(NodeKind kind) const override
  {
    if constexpr (is_leaf_kind()) {
      return kind == K;
    } else {
      return Node::contains(kind);
    }
  }

protected:
  using Super::Super;
  ~OptimizedNode() = default;

  static constexpr bool is_leaf_kind()
  {
    return detail::all_primitive_v<detail::fields_of_t<Derived>>;
  }
};

// ============================================================================
// PooledNode
// ============================================================================

/**
 * Single-value leaf shared through a NodePool.
 *
 * Instances are obtained only through `make()`. The node a pool hands out
 * may be shared by many trees, so clone() returns it unchanged.
 */
template <typename Derived, typename Base, NodeKind K, PoolCategory C>
class PooledNode : public OptimizedNode<Derived, Base, K>
{
public:
  static constexpr Representation k_representation = Representation::Pooled;
  static constexpr PoolCategory k_pool_category = C;

  /**
   * Shared node for `value`, or a fresh one if the value is not poolable.
   *
   * @throws std::logic_error if the category already holds a different kind
   */
  template <typename V>
  static const Derived * make(NodePool & pool, AstContext & ctx, V value, Span span = {})
  {
    static_assert(
      std::tuple_size_v<detail::fields_of_t<Derived>> == 1,
      "pooled node kinds have exactly one field");
    static_assert(
      detail::all_primitive_v<detail::fields_of_t<Derived>>,
      "pooled node kinds hold a primitive value");

    const NodeFactory factory = [value, span](AstContext & arena) -> const Node * {
      if constexpr (std::is_convertible_v<V, std::string_view>) {
        return arena.create<Derived>(arena.intern(value), span);
      } else {
        return arena.create<Derived>(value, span);
      }
    };

    const Node * node = nullptr;
    if constexpr (C == PoolCategory::Integer) {
      node = pool.get_int(static_cast<int64_t>(value), ctx, factory);
    } else if constexpr (C == PoolCategory::Boolean) {
      node = pool.get_bool(static_cast<bool>(value), ctx, factory);
    } else if constexpr (C == PoolCategory::Text) {
      node = pool.get_text(std::string_view(value), ctx, factory);
    } else {
      node = pool.get_identifier(std::string_view(value), ctx, factory);
    }

    const auto * result = dyn_cast<Derived>(node);
    if (result == nullptr) {
      throw std::logic_error(
        "pool category '" + std::string(to_string(C)) + "' returned a " +
        std::string(node->kind_name()) + " where a " + std::string(to_string(K)) +
        " was expected");
    }
    return result;
  }

  [[nodiscard]] const Node * clone(AstContext & /*ctx*/) const override { return this; }

protected:
  using OptimizedNode<Derived, Base, K>::OptimizedNode;
  ~PooledNode() = default;
};

// ============================================================================
// Value-type leaves
// ============================================================================

/**
 * Mixin for plain value-type leaves.
 *
 * A value type stores its span and fields by value, needs no arena, and
 * offers the leaf subset of the kernel by itself. Requirements on V:
 * `span()`, `fields()`, trivially copyable.
 */
template <typename V>
struct ValueLeaf
{
  [[nodiscard]] NodeList children() const { return {}; }
  [[nodiscard]] bool is_leaf() const noexcept { return true; }
  [[nodiscard]] size_t depth() const noexcept { return 0; }
  [[nodiscard]] size_t node_count() const noexcept { return 1; }

  [[nodiscard]] bool equals(const V & other) const
  {
    const auto & self = static_cast<const V &>(*this);
    return self.span() == other.span() && detail::fields_equal(self.fields(), other.fields());
  }

  [[nodiscard]] V clone() const { return static_cast<const V &>(*this); }
};

/**
 * Polymorphic wrapper placing a value-type leaf in a node tree.
 * Every kernel operation forwards to the wrapped value.
 */
template <typename Derived, typename V, typename Base, NodeKind K>
class ValueNode : public Base
{
public:
  using value_type = V;
  static constexpr NodeKind k_kind = K;
  static constexpr Representation k_representation = Representation::Value;

  using Node::contains;
  using Node::find_all;
  using Node::find_first;

  static bool classof(const Node * node) noexcept { return node->kind() == K; }

  [[nodiscard]] const V & value() const noexcept { return value_; }

  [[nodiscard]] Span span() const noexcept override { return value_.span(); }
  [[nodiscard]] NodeList children() const override { return value_.children(); }

  void accept(NodeVisitor & visitor) const override
  {
    visitor.dispatch(static_cast<const Derived *>(this));
  }

  [[nodiscard]] bool equals(const Node & other) const override
  {
    if (&other == this) {
      return true;
    }
    if (other.kind() != K) {
      return false;
    }
    return value_.equals(static_cast<const Derived &>(other).value_);
  }

  [[nodiscard]] const Node * clone(AstContext & ctx) const override
  {
    return ctx.create<Derived>(value_.clone());
  }

  [[nodiscard]] bool is_leaf() const override { return value_.is_leaf(); }
  [[nodiscard]] size_t depth() const override { return value_.depth(); }
  [[nodiscard]] size_t node_count() const override { return value_.node_count(); }

  [[nodiscard]] NodeList find_all(NodeKind kind) const override
  {
    return kind == K ? NodeList{this} : NodeList{};
  }
  [[nodiscard]] const Node * find_first(NodeKind kind) const override
  {
    return kind == K ? this : nullptr;
  }
  [[nodiscard]] bool contains(NodeKind kind) const override { return kind == K; }

protected:
  explicit ValueNode(const V & value) noexcept : Base(K), value_(value)
  {
    static_assert(std::is_trivially_copyable_v<V>, "value-type leaves must be trivially copyable");
  }
  ~ValueNode() = default;

private:
  V value_;
};

}  // namespace hecate
