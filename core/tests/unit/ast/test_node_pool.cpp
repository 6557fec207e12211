// tests/unit/ast/test_node_pool.cpp - Shared leaf cache

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "hecate/ast/ast.hpp"
#include "hecate/ast/ast_context.hpp"
#include "hecate/ast/node_pool.hpp"
#include "hecate/test_support/tree_helpers.hpp"

using namespace hecate;
using test_support::at;

// ============================================================================
// Identity
// ============================================================================

TEST(AstNodePool, SmallIntegersAreShared)
{
  NodePool pool;
  AstContext ctx;

  const auto * a = IntLit::make(pool, ctx, 5);
  const auto * b = IntLit::make(pool, ctx, 5);
  EXPECT_EQ(a, b);
}

TEST(AstNodePool, LargeIntegersAreEqualButDistinct)
{
  NodePool pool;
  AstContext ctx;

  const auto * a = IntLit::make(pool, ctx, 200);
  const auto * b = IntLit::make(pool, ctx, 200);
  EXPECT_NE(a, b);
  EXPECT_TRUE(a->equals(*b));
  EXPECT_EQ(pool.stats().int_pool_size, 0U);
}

TEST(AstNodePool, IntegerRangeIsInclusive)
{
  NodePool pool;
  AstContext ctx;

  EXPECT_EQ(IntLit::make(pool, ctx, -128), IntLit::make(pool, ctx, -128));
  EXPECT_EQ(IntLit::make(pool, ctx, 127), IntLit::make(pool, ctx, 127));
  EXPECT_NE(IntLit::make(pool, ctx, -129), IntLit::make(pool, ctx, -129));
  EXPECT_NE(IntLit::make(pool, ctx, 128), IntLit::make(pool, ctx, 128));
}

TEST(AstNodePool, BooleansAreShared)
{
  NodePool pool;
  AstContext ctx;

  EXPECT_EQ(BoolLit::make(pool, ctx, true), BoolLit::make(pool, ctx, true));
  EXPECT_NE(BoolLit::make(pool, ctx, true), BoolLit::make(pool, ctx, false));
  EXPECT_EQ(pool.stats().bool_pool_size, 2U);
}

TEST(AstNodePool, TextLengthLimit)
{
  NodePool pool;
  AstContext ctx;

  const std::string fifty(50, 'a');
  const std::string fifty_one(51, 'a');

  EXPECT_EQ(StringLit::make(pool, ctx, fifty), StringLit::make(pool, ctx, fifty));
  EXPECT_NE(StringLit::make(pool, ctx, fifty_one), StringLit::make(pool, ctx, fifty_one));

  const std::string thirty(30, 'x');
  const std::string thirty_one(31, 'x');
  EXPECT_EQ(Identifier::make(pool, ctx, thirty), Identifier::make(pool, ctx, thirty));
  EXPECT_NE(Identifier::make(pool, ctx, thirty_one), Identifier::make(pool, ctx, thirty_one));
}

TEST(AstNodePool, TextAndIdentifierCachesAreSeparate)
{
  NodePool pool;
  AstContext ctx;

  const Node * s = StringLit::make(pool, ctx, "name");
  const Node * id = Identifier::make(pool, ctx, "name");
  EXPECT_NE(s, id);
  EXPECT_EQ(s->kind(), NodeKind::StringLit);
  EXPECT_EQ(id->kind(), NodeKind::Identifier);
}

TEST(AstNodePool, CapacityStopsGrowthButKeepsExistingEntries)
{
  PoolLimits limits;
  limits.text_max_entries = 2;
  NodePool pool(limits);
  AstContext ctx;

  const auto * a = StringLit::make(pool, ctx, "a");
  StringLit::make(pool, ctx, "b");

  const auto * c1 = StringLit::make(pool, ctx, "c");
  const auto * c2 = StringLit::make(pool, ctx, "c");
  EXPECT_NE(c1, c2);
  EXPECT_EQ(pool.stats().text_pool_size, 2U);

  EXPECT_EQ(StringLit::make(pool, ctx, "a"), a);
}

TEST(AstNodePool, FirstSpanSticks)
{
  NodePool pool;
  AstContext ctx;

  const auto * first = IntLit::make(pool, ctx, 1, at(0, 1));
  const auto * second = IntLit::make(pool, ctx, 1, at(10, 11));
  EXPECT_EQ(first, second);
  EXPECT_EQ(second->span(), at(0, 1));
}

TEST(AstNodePool, PooledNodesOutliveCallerContext)
{
  NodePool pool;
  const IntLit * kept = nullptr;
  {
    AstContext ctx;
    kept = IntLit::make(pool, ctx, 7);
  }
  AstContext ctx;
  EXPECT_EQ(IntLit::make(pool, ctx, 7), kept);
  EXPECT_EQ(kept->value, 7);
}

// ============================================================================
// Statistics
// ============================================================================

TEST(AstNodePool, StatsCountHitsAndMisses)
{
  NodePool pool;
  AstContext ctx;

  IntLit::make(pool, ctx, 1);  // miss
  IntLit::make(pool, ctx, 1);  // hit
  IntLit::make(pool, ctx, 1);  // hit
  IntLit::make(pool, ctx, 1);  // hit
  Identifier::make(pool, ctx, "x");  // miss
  Identifier::make(pool, ctx, "y");  // miss

  const PoolStats s = pool.stats();
  EXPECT_EQ(s.hits, 3U);
  EXPECT_EQ(s.misses, 3U);
  EXPECT_DOUBLE_EQ(s.hit_rate, 50.0);
  EXPECT_EQ(s.int_pool_size, 1U);
  EXPECT_EQ(s.identifier_pool_size, 2U);
  EXPECT_EQ(s.text_pool_size, 0U);
}

TEST(AstNodePool, HitRateIsRoundedToTwoDecimals)
{
  NodePool pool;
  AstContext ctx;

  IntLit::make(pool, ctx, 1);
  IntLit::make(pool, ctx, 2);
  IntLit::make(pool, ctx, 2);

  EXPECT_DOUBLE_EQ(pool.stats().hit_rate, 33.33);
}

TEST(AstNodePool, EmptyPoolHasZeroHitRate)
{
  const NodePool pool;
  EXPECT_DOUBLE_EQ(pool.stats().hit_rate, 0.0);
  EXPECT_EQ(pool.memory_estimate().total_bytes, 0U);
}

TEST(AstNodePool, MemoryEstimateGrowsWithEntries)
{
  NodePool pool;
  AstContext ctx;

  IntLit::make(pool, ctx, 1);
  StringLit::make(pool, ctx, "a fairly long string literal");

  const PoolMemoryEstimate m = pool.memory_estimate();
  EXPECT_GT(m.int_pool_bytes, 0U);
  EXPECT_GT(m.text_pool_bytes, m.int_pool_bytes);
  EXPECT_EQ(m.bool_pool_bytes, 0U);
  EXPECT_EQ(
    m.total_bytes,
    m.int_pool_bytes + m.bool_pool_bytes + m.text_pool_bytes + m.identifier_pool_bytes);
}

TEST(AstNodePool, ClearForgetsEntriesAndCounters)
{
  NodePool pool;
  AstContext ctx;

  IntLit::make(pool, ctx, 3);
  IntLit::make(pool, ctx, 3);
  pool.clear();

  const PoolStats s = pool.stats();
  EXPECT_EQ(s.hits, 0U);
  EXPECT_EQ(s.misses, 0U);
  EXPECT_EQ(s.int_pool_size, 0U);

  // A new request builds and caches a fresh node
  const auto * after = IntLit::make(pool, ctx, 3);
  EXPECT_EQ(after->value, 3);
  EXPECT_EQ(IntLit::make(pool, ctx, 3), after);
  EXPECT_EQ(pool.stats().int_pool_size, 1U);
}

TEST(AstNodePool, ClearReleasesArenaMemory)
{
  NodePool pool;
  AstContext ctx;
  EXPECT_EQ(pool.arena_bytes(), 0U);

  const auto fill = [&] {
    for (int64_t v = -128; v <= 127; ++v) {
      IntLit::make(pool, ctx, v);
    }
    for (int i = 0; i < 100; ++i) {
      StringLit::make(pool, ctx, "text_" + std::to_string(i));
      Identifier::make(pool, ctx, "name_" + std::to_string(i));
    }
    BoolLit::make(pool, ctx, true);
    BoolLit::make(pool, ctx, false);
  };

  fill();
  const size_t filled = pool.arena_bytes();
  EXPECT_GT(filled, 0U);

  // Usage stays flat across many fill/clear cycles
  for (int cycle = 0; cycle < 5; ++cycle) {
    pool.clear();
    EXPECT_EQ(pool.arena_bytes(), 0U);
    fill();
    EXPECT_EQ(pool.arena_bytes(), filled);
  }
}

// ============================================================================
// Misuse
// ============================================================================

TEST(AstNodePool, WrongValueTypeThrows)
{
  NodePool pool;
  AstContext ctx;
  const NodeFactory factory = [](AstContext & arena) -> const Node * {
    return arena.create<NullLit>();
  };

  EXPECT_THROW(
    pool.get_or_create(PoolCategory::Integer, PoolValue(true), ctx, factory),
    std::invalid_argument);
  EXPECT_THROW(
    pool.get_or_create(PoolCategory::Text, PoolValue(int64_t{1}), ctx, factory),
    std::invalid_argument);
}

TEST(AstNodePool, NullFactoryResultThrows)
{
  NodePool pool;
  AstContext ctx;
  const NodeFactory factory = [](AstContext &) -> const Node * { return nullptr; };

  EXPECT_THROW(pool.get_int(1, ctx, factory), std::logic_error);
  EXPECT_THROW(pool.get_int(1000, ctx, factory), std::logic_error);
  EXPECT_EQ(pool.stats().int_pool_size, 0U);
}

TEST(AstNodePool, GetOrCreateRunsFactoryOnce)
{
  NodePool pool;
  AstContext ctx;
  int calls = 0;
  const NodeFactory factory = [&calls](AstContext & arena) -> const Node * {
    ++calls;
    return arena.create<FloatLit>(1.0);
  };

  const Node * a = pool.get_or_create(PoolCategory::Boolean, PoolValue(false), ctx, factory);
  const Node * b = pool.get_or_create(PoolCategory::Boolean, PoolValue(false), ctx, factory);
  EXPECT_EQ(a, b);
  EXPECT_EQ(calls, 1);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(AstNodePool, ConcurrentRequestsShareOneInstance)
{
  NodePool pool;
  constexpr int k_threads = 8;
  constexpr int k_per_thread = 100;

  std::vector<std::vector<const Node *>> seen(k_threads);
  std::vector<std::thread> workers;
  workers.reserve(k_threads);

  for (int i = 0; i < k_threads; ++i) {
    workers.emplace_back([&pool, &seen, i] {
      AstContext ctx;
      for (int n = 0; n < k_per_thread; ++n) {
        seen[i].push_back(IntLit::make(pool, ctx, 42));
        seen[i].push_back(Identifier::make(pool, ctx, "shared"));
      }
    });
  }
  for (auto & w : workers) {
    w.join();
  }

  const Node * int_node = seen[0][0];
  const Node * id_node = seen[0][1];
  for (const auto & per_thread : seen) {
    for (size_t n = 0; n < per_thread.size(); n += 2) {
      EXPECT_EQ(per_thread[n], int_node);
      EXPECT_EQ(per_thread[n + 1], id_node);
    }
  }

  const PoolStats s = pool.stats();
  EXPECT_EQ(s.int_pool_size, 1U);
  EXPECT_EQ(s.identifier_pool_size, 1U);
  EXPECT_EQ(s.misses, 2U);
  EXPECT_EQ(s.hits, static_cast<uint64_t>(2 * k_threads * k_per_thread - 2));
}

TEST(AstNodePool, TreesSharingLeavesLinkConcurrently)
{
  NodePool pool;
  constexpr int k_threads = 4;
  constexpr int k_rounds = 200;

  std::vector<std::unique_ptr<AstContext>> contexts;
  std::vector<const Mul *> roots;
  for (int i = 0; i < k_threads; ++i) {
    contexts.push_back(std::make_unique<AstContext>());
    AstContext & ctx = *contexts.back();
    const auto * add = ctx.create<Add>(IntLit::make(pool, ctx, 1), IntLit::make(pool, ctx, 2));
    roots.push_back(ctx.create<Mul>(add, Identifier::make(pool, ctx, "x")));
  }

  std::vector<std::thread> workers;
  workers.reserve(k_threads);
  for (int i = 0; i < k_threads; ++i) {
    workers.emplace_back([root = roots[i]] {
      for (int n = 0; n < k_rounds; ++n) {
        link_parents(*root);
      }
    });
  }
  for (auto & w : workers) {
    w.join();
  }

  const Node * shared_one = roots[0]->lhs->children()[0];
  EXPECT_EQ(shared_one, roots[1]->lhs->children()[0]);
  EXPECT_EQ(shared_one->parent(), nullptr);
  for (const Mul * root : roots) {
    EXPECT_EQ(root->lhs->parent(), root);
    EXPECT_EQ(root->rhs->parent(), nullptr);
  }
}
