// tests/unit/ast/test_visitor.cpp - Double dispatch, visitors and transformers

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "hecate/ast/ast.hpp"
#include "hecate/ast/visitor.hpp"
#include "hecate/basic/casting.hpp"
#include "hecate/test_support/tree_helpers.hpp"

using namespace hecate;
using test_support::TestTree;

namespace
{

/// Evaluates integer arithmetic; everything else is unsupported
class Evaluator : public Visitor<int64_t>
{
public:
  int64_t visit_int_lit(const IntLit * n) override { return n->value; }
  int64_t visit_bool_lit(const BoolLit * n) override { return n->value ? 1 : 0; }
  int64_t visit_add(const Add * n) override { return visit(n->lhs) + visit(n->rhs); }
  int64_t visit_sub(const Sub * n) override { return visit(n->lhs) - visit(n->rhs); }
  int64_t visit_mul(const Mul * n) override { return visit(n->lhs) * visit(n->rhs); }
  int64_t visit_div(const Div * n) override
  {
    const int64_t divisor = visit(n->rhs);
    if (divisor == 0) {
      throw std::domain_error("division by zero");
    }
    return visit(n->lhs) / divisor;
  }
  int64_t visit_unary_expr(const UnaryExpr * n) override
  {
    const int64_t v = visit(n->operand);
    return n->op == UnaryOp::Neg ? -v : static_cast<int64_t>(v == 0);
  }
  int64_t visit_if_expr(const IfExpr * n) override
  {
    return visit(n->condition) != 0 ? visit(n->then_branch) : visit(n->else_branch);
  }

  int64_t visit_string_lit(const StringLit * n) override { return unsupported(n); }
  int64_t visit_identifier(const Identifier * n) override { return unsupported(n); }
  int64_t visit_float_lit(const FloatLit * n) override { return unsupported(n); }
  int64_t visit_null_lit(const NullLit * n) override { return unsupported(n); }
  int64_t visit_char_lit(const CharLit * n) override { return n->codepoint(); }
  int64_t visit_call_expr(const CallExpr * n) override { return unsupported(n); }
  int64_t visit_expr_stmt(const ExprStmt * n) override { return visit(n->expr); }
  int64_t visit_let_stmt(const LetStmt * n) override { return unsupported(n); }
  int64_t visit_block(const Block * n) override { return unsupported(n); }
  int64_t visit_func_decl(const FuncDecl * n) override { return unsupported(n); }
  int64_t visit_module(const Module * n) override { return unsupported(n); }

private:
  static int64_t unsupported(const Node * n)
  {
    throw std::runtime_error("cannot evaluate " + std::string(n->kind_name()));
  }
};

/// Records kind names in visiting order
class KindRecorder : public RecursiveVisitor
{
public:
  std::vector<std::string> kinds;

  void visit_int_lit(const IntLit * n) override
  {
    kinds.push_back("IntLit(" + std::to_string(n->value) + ")");
  }
  void visit_add(const Add * n) override
  {
    kinds.emplace_back("Add");
    visit_children(*n);
  }
  void visit_mul(const Mul * n) override
  {
    kinds.emplace_back("Mul");
    visit_children(*n);
  }
};

/// Folds Add/Mul of two integer literals into one literal
class ConstantFolder : public Transformer
{
public:
  ConstantFolder(AstContext & ctx, NodePool & pool) : Transformer(ctx), pool_(pool) {}

  const Node * visit_add(const Add * n) override
  {
    return fold(n, [](int64_t a, int64_t b) { return a + b; });
  }
  const Node * visit_mul(const Mul * n) override
  {
    return fold(n, [](int64_t a, int64_t b) { return a * b; });
  }
  const Node * visit_expr_stmt(const ExprStmt * n) override
  {
    const Expr * expr = transform(n->expr);
    return expr == n->expr ? n : context().create<ExprStmt>(expr, n->span());
  }
  const Node * visit_block(const Block * n) override
  {
    return context().create<Block>(transform_all(n->stmts), n->span());
  }

private:
  template <typename NodeT, typename Op>
  const Node * fold(const NodeT * n, Op op)
  {
    const Expr * lhs = transform(n->lhs);
    const Expr * rhs = transform(n->rhs);
    const auto * l = dyn_cast<IntLit>(lhs);
    const auto * r = dyn_cast<IntLit>(rhs);
    if (l != nullptr && r != nullptr) {
      return IntLit::make(pool_, context(), op(l->value, r->value), n->span());
    }
    if (lhs == n->lhs && rhs == n->rhs) {
      return n;
    }
    return context().create<NodeT>(lhs, rhs, n->span());
  }

  NodePool & pool_;
};

/// Replaces every ExprStmt with its expression (a category error)
class BrokenTransformer : public Transformer
{
public:
  using Transformer::Transformer;

  const Node * visit_expr_stmt(const ExprStmt * n) override { return n->expr; }
};

}  // namespace

// ============================================================================
// Visitor<T>
// ============================================================================

TEST(AstVisitor, EvaluatesArithmetic)
{
  TestTree t;
  Evaluator eval;
  EXPECT_EQ(eval.visit(*t.arithmetic()), 9);
}

TEST(AstVisitor, NestedVisitsKeepTheirOwnResults)
{
  TestTree t;
  // (10 - 4) * -(2 + 1), evaluated with nested visit() calls at every level
  const auto * expr = t.make<Mul>(
    t.make<Sub>(t.int_lit(10), t.int_lit(4)),
    t.make<UnaryExpr>(UnaryOp::Neg, t.make<Add>(t.int_lit(2), t.int_lit(1))));
  Evaluator eval;
  EXPECT_EQ(eval.visit(*expr), -18);

  const auto * cond = t.make<IfExpr>(t.bool_lit(false), t.int_lit(1), t.int_lit(2));
  EXPECT_EQ(eval.visit(*cond), 2);
}

TEST(AstVisitor, ExceptionsPropagateAndVisitorStaysUsable)
{
  TestTree t;
  Evaluator eval;

  const auto * bad = t.make<Add>(t.int_lit(1), t.make<NullLit>());
  EXPECT_THROW(eval.visit(*bad), std::runtime_error);

  const auto * div = t.make<Div>(t.int_lit(1), t.int_lit(0));
  EXPECT_THROW(eval.visit(*div), std::domain_error);

  EXPECT_EQ(eval.visit(*t.arithmetic()), 9);
}

TEST(AstVisitor, DispatchReachesValueWrapper)
{
  TestTree t;
  Evaluator eval;
  EXPECT_EQ(eval.visit(*t.make<CharLit>(CharLitValue(0x41))), 0x41);
}

TEST(AstVisitor, RecursiveVisitorWalksChildren)
{
  TestTree t;
  KindRecorder rec;
  rec.visit(*t.arithmetic());

  const std::vector<std::string> expected{"Mul", "Add", "IntLit(1)", "IntLit(2)", "IntLit(3)"};
  EXPECT_EQ(rec.kinds, expected);
}

TEST(AstVisitor, RecursiveVisitorDefaultsDescend)
{
  TestTree t;
  // Block and ExprStmt are not overridden; their children are still reached
  const auto * block = t.make<Block>(t.list<Stmt>({t.make<ExprStmt>(t.arithmetic())}));
  KindRecorder rec;
  rec.visit(*block);
  EXPECT_EQ(rec.kinds.size(), 5U);
}

// ============================================================================
// Transformer
// ============================================================================

TEST(AstTransformer, DefaultReturnsNodeUnchanged)
{
  TestTree t;
  const auto * tree = t.arithmetic();
  Transformer identity(*t.ast);
  EXPECT_EQ(identity.visit(*tree), tree);
}

TEST(AstTransformer, FoldsConstantsWithoutTouchingInput)
{
  TestTree t;
  const auto * tree = t.arithmetic();
  ConstantFolder folder(*t.ast, *t.pool);

  const Node * folded = folder.visit(*tree);
  const auto * lit = dyn_cast<IntLit>(folded);
  ASSERT_NE(lit, nullptr);
  EXPECT_EQ(lit->value, 9);
  EXPECT_EQ(lit->span(), tree->span());

  EXPECT_EQ(tree->node_count(), 5U);
  EXPECT_EQ(tree->kind(), NodeKind::Mul);
}

TEST(AstTransformer, RebuildsOnlyChangedParents)
{
  TestTree t;
  const auto * keep = t.make<ExprStmt>(t.ident("x"));
  const auto * fold = t.make<ExprStmt>(t.make<Add>(t.int_lit(2), t.int_lit(3)));
  const auto * block = t.make<Block>(t.list<Stmt>({keep, fold}));

  ConstantFolder folder(*t.ast, *t.pool);
  const auto * out = cast<Block>(folder.visit(*block));

  ASSERT_EQ(out->stmts.size(), 2U);
  EXPECT_EQ(out->stmts[0], keep);
  EXPECT_NE(out->stmts[1], fold);
  const auto * stmt = cast<ExprStmt>(out->stmts[1]);
  ASSERT_TRUE(isa<IntLit>(stmt->expr));
  EXPECT_EQ(cast<IntLit>(stmt->expr)->value, 5);

  // Input block still holds the Add
  EXPECT_TRUE(isa<Add>(cast<ExprStmt>(block->stmts[1])->expr));
}

TEST(AstTransformer, WrongCategoryThrows)
{
  TestTree t;
  const auto * stmt = t.make<ExprStmt>(t.int_lit(1));
  const auto * block = t.make<Block>(t.list<Stmt>({stmt}));

  BrokenTransformer broken(*t.ast);
  EXPECT_THROW(broken.transform_all(block->stmts), std::logic_error);

  const Stmt * as_stmt = stmt;
  EXPECT_THROW(broken.transform(as_stmt), std::logic_error);
}

TEST(AstTransformer, TransformOfNullIsNull)
{
  TestTree t;
  Transformer identity(*t.ast);
  const Expr * none = nullptr;
  EXPECT_EQ(identity.transform(none), nullptr);
}
