// tests/unit/ast/test_ast_enums.cpp - Node kind and representation tables

// Included first so the header is compiled on its own
#include "hecate/ast/ast_enums.hpp"

#include <gtest/gtest.h>

#include "hecate/ast/ast.hpp"

using namespace hecate;

#define AST_NODE(Class, Kind, Snake, Repr)                                  \
  static_assert(                                                            \
    representation_of(NodeKind::Kind) == Class::k_representation,           \
    #Class " declares a different representation than its strategy base");
#include "hecate/ast/ast_nodes.def"

TEST(AstEnums, KindCountMatchesTable)
{
  size_t count = 0;
#define AST_NODE(Class, Kind, Snake, Repr) ++count;
#include "hecate/ast/ast_nodes.def"
  EXPECT_EQ(count, k_node_kind_count);
}

TEST(AstEnums, KindNames)
{
  EXPECT_EQ(to_string(NodeKind::IntLit), "IntLit");
  EXPECT_EQ(to_string(NodeKind::Add), "Add");
  EXPECT_EQ(to_string(Representation::Pooled), "pooled");
}

TEST(AstEnums, RepresentationOfKind)
{
  EXPECT_EQ(representation_of(NodeKind::IntLit), Representation::Pooled);
  EXPECT_EQ(representation_of(NodeKind::FloatLit), Representation::Optimized);
  EXPECT_EQ(representation_of(NodeKind::CharLit), Representation::Value);
  EXPECT_EQ(representation_of(NodeKind::Add), Representation::Standard);
}
