// hecate/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds (generated from ast_nodes.def), operators, and the
// representation-strategy tag every concrete kind declares.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace hecate
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Kinds are grouped by category so category classof() is a range check.
 */
enum class NodeKind : uint8_t {
#define AST_NODE(Class, Kind, Snake, Repr) Kind,
#include "hecate/ast/ast_nodes.def"
};

/// Number of concrete node kinds
inline constexpr size_t k_node_kind_count = 0
#define AST_NODE(Class, Kind, Snake, Repr) +1
#include "hecate/ast/ast_nodes.def"
  ;

/// Class name of a node kind ("IntLit", "Add", ...)
[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE(Class, Kind, Snake, Repr) \
  case NodeKind::Kind:                     \
    return #Class;
#include "hecate/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// Representation - storage strategy of a concrete kind
// ============================================================================

enum class Representation : uint8_t {
  Standard,   ///< Fields stored directly, generic kernel algorithms
  Optimized,  ///< Same semantics, leaf fast paths when every field is primitive
  Pooled,     ///< Single-value leaf shared through NodePool
  Value,      ///< Value-type leaf behind a polymorphic wrapper
};

[[nodiscard]] constexpr std::string_view to_string(Representation repr) noexcept
{
  switch (repr) {
    case Representation::Standard:
      return "standard";
    case Representation::Optimized:
      return "optimized";
    case Representation::Pooled:
      return "pooled";
    case Representation::Value:
      return "value";
  }
  return "";
}

/// Representation a kind declares in ast_nodes.def
[[nodiscard]] constexpr Representation representation_of(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE(Class, Kind, Snake, Repr) \
  case NodeKind::Kind:                     \
    return Representation::Repr;
#include "hecate/ast/ast_nodes.def"
  }
  return Representation::Standard;
}

// ============================================================================
// Operators
// ============================================================================

enum class UnaryOp : uint8_t {
  Neg,  ///< -
  Not,  ///< !
};

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Not:
      return "!";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::IntLit;
inline constexpr NodeKind k_last_expr_kind = NodeKind::IfExpr;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::ExprStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::Block;

inline constexpr NodeKind k_first_decl_kind = NodeKind::FuncDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::FuncDecl;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace hecate
