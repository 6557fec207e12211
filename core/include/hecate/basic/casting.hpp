// hecate/basic/casting.hpp - LLVM-style RTTI casting for AST nodes
//
// Works with any hierarchy whose classes provide a static `classof` taking
// the base pointer. Concrete node kinds and category bases (Expr, Stmt, Decl)
// all provide one, so `isa<Expr>(node)` checks a kind range.
//
// Usage:
//   if (isa<Add>(node)) { ... }
//   const auto * add = cast<Add>(node);           // asserts on failure
//   if (const auto * lit = dyn_cast<IntLit>(node)) { ... }  // nullptr on failure
//
#pragma once

#include <cassert>
#include <type_traits>
#include <utility>

namespace hecate
{

namespace detail
{

/// Check if T has a classof static method accepting `const From *`
template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

// ============================================================================
// isa<T>
// ============================================================================

/**
 * Check if a node is of type T.
 *
 * @return true if node is non-null and T::classof accepts it
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(const From & node) noexcept
{
  return isa<T>(&node);
}

// ============================================================================
// cast<T> - checked in debug builds only
// ============================================================================

/**
 * Cast a node to type T.
 *
 * Passing nullptr or a node of another kind is a programmer error and
 * asserts; use dyn_cast when the kind is not known.
 */
template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T & cast(const From & node) noexcept
{
  return *cast<T>(&node);
}

// ============================================================================
// dyn_cast<T> - nullptr on mismatch
// ============================================================================

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From & node) noexcept
{
  return dyn_cast<T>(&node);
}

/// cast that tolerates nullptr input (non-null input must still be a T)
template <typename T, typename From>
[[nodiscard]] inline const T * cast_or_null(const From * node) noexcept
{
  return node != nullptr ? cast<T>(node) : nullptr;
}

}  // namespace hecate
