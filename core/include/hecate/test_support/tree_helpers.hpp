// hecate/test_support/tree_helpers.hpp - helpers for unit tests
//
// A TestTree owns the arena and pool a test builds into, plus shorthand
// builders for the small demo grammar.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "hecate/ast/ast.hpp"
#include "hecate/ast/ast_context.hpp"
#include "hecate/ast/node.hpp"
#include "hecate/ast/node_pool.hpp"
#include "hecate/basic/span.hpp"

namespace hecate::test_support
{

/// Span in source 0 at [start, end)
[[nodiscard]] constexpr Span at(uint32_t start, uint32_t end) noexcept
{
  return Span(uint32_t{0}, start, end);
}

struct TestTree
{
  std::unique_ptr<NodePool> pool = std::make_unique<NodePool>();
  std::unique_ptr<AstContext> ast = std::make_unique<AstContext>();

  const IntLit * int_lit(int64_t v, Span span = {}) { return IntLit::make(*pool, *ast, v, span); }
  const BoolLit * bool_lit(bool v, Span span = {}) { return BoolLit::make(*pool, *ast, v, span); }
  const StringLit * string_lit(std::string_view v, Span span = {})
  {
    return StringLit::make(*pool, *ast, v, span);
  }
  const Identifier * ident(std::string_view name, Span span = {})
  {
    return Identifier::make(*pool, *ast, name, span);
  }

  template <typename T, typename... Args>
  T * make(Args &&... args)
  {
    return ast->create<T>(std::forward<Args>(args)...);
  }

  template <typename T>
  gsl::span<const T *> list(std::initializer_list<const T *> items)
  {
    return ast->copy_to_arena<const T *>(items);
  }

  gsl::span<std::string_view> names(std::initializer_list<std::string_view> items)
  {
    std::vector<std::string_view> interned;
    for (std::string_view s : items) {
      interned.push_back(ast->intern(s));
    }
    return ast->copy_to_arena(interned);
  }

  /// Mul(Add(IntLit(1), IntLit(2)), IntLit(3))
  const Mul * arithmetic()
  {
    const auto * add = make<Add>(int_lit(1, at(1, 2)), int_lit(2, at(5, 6)), at(0, 7));
    return make<Mul>(add, int_lit(3, at(11, 12)), at(0, 12));
  }
};

}  // namespace hecate::test_support
