// hecate/ast/ast.hpp - Concrete node classes
//
// One class per line of ast_nodes.def. Each class picks a representation
// strategy and declares its fields once in fields(); the strategy supplies
// the kernel primitives. Node fields are public and set at construction.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

#include "hecate/ast/ast_context.hpp"
#include "hecate/ast/ast_enums.hpp"
#include "hecate/ast/node.hpp"
#include "hecate/ast/node_pool.hpp"
#include "hecate/ast/node_strategies.hpp"
#include "hecate/basic/span.hpp"

namespace hecate
{

// ============================================================================
// Pooled literals
// ============================================================================

/// Integer literal, shared for values inside PoolLimits::int_min..int_max
class IntLit : public PooledNode<IntLit, Expr, NodeKind::IntLit, PoolCategory::Integer>,
               public HasDisplayField
{
public:
  const int64_t value;

  [[nodiscard]] auto fields() const { return std::tie(value); }
  [[nodiscard]] DisplayField display_field() const override;

private:
  friend class AstContext;
  IntLit(int64_t v, Span span) noexcept : PooledNode(span), value(v) {}
};

class BoolLit : public PooledNode<BoolLit, Expr, NodeKind::BoolLit, PoolCategory::Boolean>,
                public HasDisplayField
{
public:
  const bool value;

  [[nodiscard]] auto fields() const { return std::tie(value); }
  [[nodiscard]] DisplayField display_field() const override;

private:
  friend class AstContext;
  BoolLit(bool v, Span span) noexcept : PooledNode(span), value(v) {}
};

/// String literal; `value` is unescaped text
class StringLit : public PooledNode<StringLit, Expr, NodeKind::StringLit, PoolCategory::Text>,
                  public HasDisplayField
{
public:
  const std::string_view value;

  [[nodiscard]] auto fields() const { return std::tie(value); }
  [[nodiscard]] DisplayField display_field() const override;

private:
  friend class AstContext;
  StringLit(std::string_view v, Span span) noexcept : PooledNode(span), value(v) {}
};

class Identifier
: public PooledNode<Identifier, Expr, NodeKind::Identifier, PoolCategory::Identifier>,
  public HasDisplayField
{
public:
  const std::string_view name;

  [[nodiscard]] auto fields() const { return std::tie(name); }
  [[nodiscard]] DisplayField display_field() const override;

private:
  friend class AstContext;
  Identifier(std::string_view n, Span span) noexcept : PooledNode(span), name(n) {}
};

// ============================================================================
// Optimized literals
// ============================================================================

class FloatLit : public OptimizedNode<FloatLit, Expr, NodeKind::FloatLit>, public HasDisplayField
{
public:
  explicit FloatLit(double v, Span span = {}) noexcept : OptimizedNode(span), value(v) {}

  double value;

  [[nodiscard]] auto fields() const { return std::tie(value); }
  [[nodiscard]] DisplayField display_field() const override;
};

class NullLit : public OptimizedNode<NullLit, Expr, NodeKind::NullLit>
{
public:
  explicit NullLit(Span span = {}) noexcept : OptimizedNode(span) {}

  [[nodiscard]] auto fields() const { return std::tie(); }
};

// ============================================================================
// Character literal (value type + wrapper)
// ============================================================================

/**
 * Character literal as a plain value.
 * Usable on its own (no arena needed); CharLit puts it into a tree.
 */
class CharLitValue : public ValueLeaf<CharLitValue>
{
public:
  constexpr explicit CharLitValue(uint32_t codepoint, Span span = {}) noexcept
  : span_(span), codepoint_(codepoint)
  {
  }

  [[nodiscard]] constexpr Span span() const noexcept { return span_; }
  [[nodiscard]] constexpr uint32_t codepoint() const noexcept { return codepoint_; }

  [[nodiscard]] auto fields() const { return std::tie(codepoint_); }

  /// UTF-8 encoding of the code point (U+FFFD for invalid code points)
  [[nodiscard]] std::string to_utf8() const;

private:
  Span span_;
  uint32_t codepoint_;
};

class CharLit : public ValueNode<CharLit, CharLitValue, Expr, NodeKind::CharLit>,
                public HasDisplayField
{
public:
  explicit CharLit(const CharLitValue & v) noexcept : ValueNode(v) {}

  [[nodiscard]] uint32_t codepoint() const noexcept { return value().codepoint(); }
  [[nodiscard]] DisplayField display_field() const override;
};

// ============================================================================
// Arithmetic
// ============================================================================

template <typename Derived, NodeKind K>
class BinaryNode : public StandardNode<Derived, Expr, K>
{
public:
  const Expr * lhs;
  const Expr * rhs;

  [[nodiscard]] auto fields() const { return std::tie(lhs, rhs); }

protected:
  BinaryNode(const Expr * l, const Expr * r, Span span) noexcept
  : StandardNode<Derived, Expr, K>(span), lhs(l), rhs(r)
  {
  }
  ~BinaryNode() = default;
};

class Add : public BinaryNode<Add, NodeKind::Add>
{
public:
  Add(const Expr * lhs, const Expr * rhs, Span span = {}) noexcept : BinaryNode(lhs, rhs, span) {}
};

class Sub : public BinaryNode<Sub, NodeKind::Sub>
{
public:
  Sub(const Expr * lhs, const Expr * rhs, Span span = {}) noexcept : BinaryNode(lhs, rhs, span) {}
};

class Mul : public BinaryNode<Mul, NodeKind::Mul>
{
public:
  Mul(const Expr * lhs, const Expr * rhs, Span span = {}) noexcept : BinaryNode(lhs, rhs, span) {}
};

/// Division; warns when the divisor is a literal zero
class Div : public BinaryNode<Div, NodeKind::Div>, public Validatable
{
public:
  Div(const Expr * lhs, const Expr * rhs, Span span = {}) noexcept : BinaryNode(lhs, rhs, span) {}

  void validate(DiagnosticBag & diags) const override;
};

// ============================================================================
// Other expressions
// ============================================================================

class UnaryExpr : public OptimizedNode<UnaryExpr, Expr, NodeKind::UnaryExpr>,
                  public HasDisplayField
{
public:
  UnaryExpr(UnaryOp o, const Expr * e, Span span = {}) noexcept
  : OptimizedNode(span), op(o), operand(e)
  {
  }

  UnaryOp op;
  const Expr * operand;

  [[nodiscard]] auto fields() const { return std::tie(op, operand); }
  [[nodiscard]] DisplayField display_field() const override;
};

class CallExpr : public StandardNode<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  CallExpr(const Identifier * c, gsl::span<const Expr *> a, Span span = {}) noexcept
  : StandardNode(span), callee(c), args(a)
  {
  }

  const Identifier * callee;
  gsl::span<const Expr *> args;

  [[nodiscard]] auto fields() const { return std::tie(callee, args); }
};

/// if/else as an expression; else_branch may be null
class IfExpr : public StandardNode<IfExpr, Expr, NodeKind::IfExpr>
{
public:
  IfExpr(const Expr * c, const Expr * t, const Expr * e, Span span = {}) noexcept
  : StandardNode(span), condition(c), then_branch(t), else_branch(e)
  {
  }

  const Expr * condition;
  const Expr * then_branch;
  const Expr * else_branch;

  [[nodiscard]] auto fields() const { return std::tie(condition, then_branch, else_branch); }
};

// ============================================================================
// Statements
// ============================================================================

class ExprStmt : public StandardNode<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  explicit ExprStmt(const Expr * e, Span span = {}) noexcept : StandardNode(span), expr(e) {}

  const Expr * expr;

  [[nodiscard]] auto fields() const { return std::tie(expr); }
};

/// `let name[: type] [= value]`
class LetStmt : public StandardNode<LetStmt, Stmt, NodeKind::LetStmt>,
                public Validatable,
                public HasDisplayField
{
public:
  LetStmt(
    std::string_view n, std::optional<std::string_view> t, const Expr * v, Span span = {}) noexcept
  : StandardNode(span), name(n), type_name(t), value(v)
  {
  }

  std::string_view name;
  std::optional<std::string_view> type_name;
  const Expr * value;  ///< null when uninitialized

  [[nodiscard]] auto fields() const { return std::tie(name, type_name, value); }

  void validate(DiagnosticBag & diags) const override;
  [[nodiscard]] DisplayField display_field() const override;
};

class Block : public StandardNode<Block, Stmt, NodeKind::Block>
{
public:
  explicit Block(gsl::span<const Stmt *> s, Span span = {}) noexcept : StandardNode(span), stmts(s)
  {
  }

  gsl::span<const Stmt *> stmts;

  [[nodiscard]] auto fields() const { return std::tie(stmts); }
};

// ============================================================================
// Declarations
// ============================================================================

class FuncDecl : public StandardNode<FuncDecl, Decl, NodeKind::FuncDecl>,
                 public Validatable,
                 public HasDisplayField
{
public:
  FuncDecl(
    std::string_view n, gsl::span<std::string_view> p, const Block * b, Span span = {}) noexcept
  : StandardNode(span), name(n), params(p), body(b)
  {
  }

  std::string_view name;
  gsl::span<std::string_view> params;
  const Block * body;

  [[nodiscard]] auto fields() const { return std::tie(name, params, body); }

  void validate(DiagnosticBag & diags) const override;
  [[nodiscard]] DisplayField display_field() const override;
};

// ============================================================================
// Top-level
// ============================================================================

class Module : public StandardNode<Module, Node, NodeKind::Module>, public HasDisplayField
{
public:
  Module(std::string_view n, gsl::span<const Decl *> d, Span span = {}) noexcept
  : StandardNode(span), name(n), decls(d)
  {
  }

  std::string_view name;
  gsl::span<const Decl *> decls;

  [[nodiscard]] auto fields() const { return std::tie(name, decls); }
  [[nodiscard]] DisplayField display_field() const override;
};

}  // namespace hecate
