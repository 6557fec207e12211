// tests/unit/sema/test_node_validator.cpp - Per-node validation hooks

#include <gtest/gtest.h>

#include <optional>

#include "hecate/ast/ast.hpp"
#include "hecate/sema/validation/node_validator.hpp"
#include "hecate/test_support/tree_helpers.hpp"

using namespace hecate;
using test_support::at;
using test_support::TestTree;

TEST(SemaNodeValidator, CleanTreePasses)
{
  TestTree t;
  NodeValidator v;
  v.visit(*t.arithmetic());

  EXPECT_TRUE(v.valid());
  EXPECT_TRUE(v.diagnostics().empty());
  EXPECT_EQ(v.summary(), "Validation passed: no errors found");
}

TEST(SemaNodeValidator, DivisionByLiteralZeroWarns)
{
  TestTree t;
  const auto * div = t.make<Div>(t.int_lit(1), t.int_lit(0, at(4, 5)), at(0, 5));
  NodeValidator v;
  v.visit(*div);

  ASSERT_EQ(v.warning_count(), 1U);
  const Diagnostic d = v.by_severity(Severity::Warning)[0];
  EXPECT_EQ(d.code, "W0200");
  EXPECT_EQ(d.primary_span(), at(4, 5));
  EXPECT_EQ(d.secondary_label_count(), 1U);
  EXPECT_TRUE(v.valid());
}

TEST(SemaNodeValidator, FloatZeroDivisorWarnsToo)
{
  TestTree t;
  NodeValidator v;
  v.visit(*t.make<Div>(t.int_lit(1), t.make<FloatLit>(0.0)));
  EXPECT_EQ(v.warning_count(), 1U);

  v.clear();
  v.visit(*t.make<Div>(t.int_lit(1), t.int_lit(2)));
  EXPECT_EQ(v.warning_count(), 0U);
}

TEST(SemaNodeValidator, LetStmtHooks)
{
  TestTree t;
  NodeValidator v;
  v.visit(*t.make<LetStmt>(t.ast->intern(""), std::nullopt, t.int_lit(1)));
  EXPECT_EQ(v.error_count(), 1U);
  EXPECT_EQ(v.hint_count(), 0U);

  v.clear();
  v.visit(*t.make<LetStmt>(t.ast->intern("y"), std::nullopt, nullptr));
  EXPECT_EQ(v.error_count(), 0U);
  ASSERT_EQ(v.hint_count(), 1U);
  EXPECT_EQ(v.by_severity(Severity::Hint)[0].message, "'y' is declared without an initializer");
}

TEST(SemaNodeValidator, DuplicateParametersAreErrors)
{
  TestTree t;
  const auto * body = t.make<Block>(t.list<Stmt>({}));
  const auto * fn = t.make<FuncDecl>(t.ast->intern("f"), t.names({"a", "b", "a"}), body);

  NodeValidator v;
  v.visit(*fn);
  ASSERT_EQ(v.error_count(), 1U);
  EXPECT_EQ(v.by_severity(Severity::Error)[0].message, "duplicate parameter 'a' in function 'f'");
  EXPECT_FALSE(v.valid());
}

TEST(SemaNodeValidator, HooksRunOnNestedNodes)
{
  TestTree t;
  const auto * body = t.make<Block>(t.list<Stmt>({
    t.make<LetStmt>(t.ast->intern(""), std::nullopt, nullptr),
    t.make<ExprStmt>(t.make<Div>(t.int_lit(3), t.int_lit(0))),
  }));
  const auto * fn = t.make<FuncDecl>(t.ast->intern("main"), t.names({}), body);
  const auto * mod = t.make<Module>(t.ast->intern("app"), t.list<Decl>({fn}));

  NodeValidator v;
  v.visit(*mod);

  EXPECT_EQ(v.error_count(), 1U);
  EXPECT_EQ(v.warning_count(), 1U);
  EXPECT_EQ(v.hint_count(), 1U);
  EXPECT_EQ(v.info_count(), 0U);
  EXPECT_EQ(v.summary(), "Validation failed: 1 errors, 1 warnings, 1 hints, 0 info");
}

TEST(SemaNodeValidator, DiagnosticsAccumulateUntilCleared)
{
  TestTree t;
  const auto * let = t.make<LetStmt>(t.ast->intern(""), std::nullopt, t.int_lit(1));

  NodeValidator v;
  v.visit(*let);
  v.visit(*let);
  EXPECT_EQ(v.error_count(), 2U);

  v.clear();
  EXPECT_TRUE(v.diagnostics().empty());
  EXPECT_TRUE(v.valid());
}
