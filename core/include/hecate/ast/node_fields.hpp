// hecate/ast/node_fields.hpp - Field-table algorithms
//
// Concrete node classes declare their fields once:
//
//   auto fields() const { return std::tie(lhs, rhs); }
//
// and the strategy templates derive children(), equals() and clone() from
// that tuple. A field is one of:
//   - node pointer      `const T *` with T derived from Node (null = absent)
//   - node sequence     `gsl::span<const T *>`
//   - primitive         anything else (numbers, enums, text, optionals,
//                       gsl::span of primitives)
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include "hecate/ast/ast_context.hpp"
#include "hecate/ast/node.hpp"

namespace hecate::detail
{

// ============================================================================
// Field classification
// ============================================================================

template <typename F>
using field_t = std::remove_cv_t<std::remove_reference_t<F>>;

template <typename F>
struct IsNodePtr : std::false_type
{
};

template <typename T>
struct IsNodePtr<const T *> : std::is_base_of<Node, T>
{
};

template <typename F>
inline constexpr bool is_node_ptr_v = IsNodePtr<field_t<F>>::value;

template <typename F>
struct IsSpan : std::false_type
{
};

template <typename E, std::size_t N>
struct IsSpan<gsl::span<E, N>> : std::true_type
{
  using element_type = E;
};

template <typename F>
inline constexpr bool is_span_v = IsSpan<field_t<F>>::value;

template <typename F>
struct IsOptional : std::false_type
{
};

template <typename T>
struct IsOptional<std::optional<T>> : std::true_type
{
};

template <typename F>
constexpr bool is_node_seq()
{
  if constexpr (is_span_v<F>) {
    return is_node_ptr_v<typename IsSpan<field_t<F>>::element_type>;
  } else {
    return false;
  }
}

template <typename F>
inline constexpr bool is_node_seq_v = is_node_seq<F>();

template <typename F>
inline constexpr bool is_node_field_v = is_node_ptr_v<F> || is_node_seq_v<F>;

/// True when a field tuple holds no node pointer or node sequence
template <typename Tuple>
struct AllPrimitive;

template <typename... Fs>
struct AllPrimitive<std::tuple<Fs...>> : std::bool_constant<(!is_node_field_v<Fs> && ...)>
{
};

template <typename Tuple>
inline constexpr bool all_primitive_v = AllPrimitive<Tuple>::value;

template <typename Derived>
using fields_of_t = decltype(std::declval<const Derived &>().fields());

// ============================================================================
// children()
// ============================================================================

template <typename F>
void append_children(const F & field, NodeList & out)
{
  if constexpr (is_node_ptr_v<F>) {
    if (field != nullptr) {
      out.push_back(field);
    }
  } else if constexpr (is_node_seq_v<F>) {
    for (const Node * child : field) {
      if (child != nullptr) {
        out.push_back(child);
      }
    }
  }
}

template <typename Tuple>
NodeList collect_children(const Tuple & fields)
{
  NodeList out;
  std::apply([&out](const auto &... f) { (append_children(f, out), ...); }, fields);
  return out;
}

// ============================================================================
// equals()
// ============================================================================

template <typename F>
bool field_equal(const F & a, const F & b)
{
  if constexpr (is_node_ptr_v<F>) {
    if (a == nullptr || b == nullptr) {
      return a == b;
    }
    return a == b || a->equals(*b);
  } else if constexpr (is_span_v<F>) {
    if (a.size() != b.size()) {
      return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
      if (!field_equal(a[i], b[i])) {
        return false;
      }
    }
    return true;
  } else {
    return a == b;
  }
}

template <typename Tuple, std::size_t... I>
bool fields_equal_impl(const Tuple & a, const Tuple & b, std::index_sequence<I...> /*seq*/)
{
  return (field_equal(std::get<I>(a), std::get<I>(b)) && ...);
}

template <typename Tuple>
bool fields_equal(const Tuple & a, const Tuple & b)
{
  return fields_equal_impl(a, b, std::make_index_sequence<std::tuple_size_v<Tuple>>{});
}

// ============================================================================
// clone()
// ============================================================================

template <typename F>
field_t<F> clone_field(const F & field, AstContext & ctx)
{
  using Field = field_t<F>;
  if constexpr (is_node_ptr_v<F>) {
    using Target = std::remove_const_t<std::remove_pointer_t<Field>>;
    return field == nullptr ? nullptr : cast<Target>(field->clone(ctx));
  } else if constexpr (is_span_v<F>) {
    using Element = std::remove_const_t<typename IsSpan<Field>::element_type>;
    auto copy = ctx.allocate_array<Element>(field.size());
    for (std::size_t i = 0; i < field.size(); ++i) {
      copy[i] = clone_field(field[i], ctx);
    }
    return Field(copy.data(), copy.size());
  } else if constexpr (std::is_same_v<Field, std::string_view>) {
    return ctx.intern(field);
  } else if constexpr (std::is_same_v<Field, std::optional<std::string_view>>) {
    return field ? std::optional<std::string_view>(ctx.intern(*field)) : std::nullopt;
  } else {
    return field;
  }
}

}  // namespace hecate::detail
