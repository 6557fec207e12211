// hecate/ast/node_pool.hpp - Shared cache of small immutable leaf nodes
//
// The pool is an ordinary object: construct one, pass it to whatever builds
// trees, destroy it after the last tree that references pooled leaves.
//
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <variant>

#include "hecate/ast/ast_context.hpp"

namespace hecate
{

class Node;

enum class PoolCategory : uint8_t {
  Integer,
  Boolean,
  Text,
  Identifier,
};

[[nodiscard]] std::string_view to_string(PoolCategory category) noexcept;

/// Which values are worth sharing, and how many of them
struct PoolLimits
{
  int64_t int_min = -128;
  int64_t int_max = 127;
  size_t text_max_length = 50;
  size_t text_max_entries = 1000;
  size_t identifier_max_length = 30;
  size_t identifier_max_entries = 500;
};

struct PoolStats
{
  uint64_t hits = 0;
  uint64_t misses = 0;
  double hit_rate = 0.0;  ///< percent, rounded to 2 decimals
  size_t int_pool_size = 0;
  size_t bool_pool_size = 0;
  size_t text_pool_size = 0;
  size_t identifier_pool_size = 0;
};

/// Rough byte counts; entries times a fixed per-entry cost plus text bytes
struct PoolMemoryEstimate
{
  size_t int_pool_bytes = 0;
  size_t bool_pool_bytes = 0;
  size_t text_pool_bytes = 0;
  size_t identifier_pool_bytes = 0;
  size_t total_bytes = 0;
};

using PoolValue = std::variant<int64_t, bool, std::string_view>;

/**
 * Builds the leaf for a missed value.
 * The argument is the arena the node must be created in: the pool's own
 * arena when the node will be cached, the caller's context otherwise.
 */
using NodeFactory = std::function<const Node *(AstContext & arena)>;

/**
 * Deduplicates leaves by value, per category.
 *
 * Each category has its own mutex, map and arena. A lock is held only for
 * one lookup-and-insert, and never while another category's lock is held,
 * so concurrent builders cannot deadlock. The factory runs under the lock
 * of its category and must not call back into the pool.
 *
 * The first requester's span is the one a shared node keeps.
 */
class NodePool
{
public:
  explicit NodePool(PoolLimits limits = {});
  ~NodePool();

  NodePool(const NodePool &) = delete;
  NodePool & operator=(const NodePool &) = delete;
  NodePool(NodePool &&) = delete;
  NodePool & operator=(NodePool &&) = delete;

  /**
   * Return the shared node for `value`, creating it on first request.
   *
   * @throws std::invalid_argument if the value type does not match the category
   * @throws std::logic_error if the factory returns null
   */
  const Node * get_or_create(
    PoolCategory category, const PoolValue & value, AstContext & ctx, const NodeFactory & factory);

  const Node * get_int(int64_t value, AstContext & ctx, const NodeFactory & factory);
  const Node * get_bool(bool value, AstContext & ctx, const NodeFactory & factory);
  const Node * get_text(std::string_view value, AstContext & ctx, const NodeFactory & factory);
  const Node * get_identifier(
    std::string_view value, AstContext & ctx, const NodeFactory & factory);

  [[nodiscard]] PoolStats stats() const;
  [[nodiscard]] PoolMemoryEstimate memory_estimate() const;

  /**
   * Forget every entry, reset the counters and free the category arenas.
   *
   * Cached nodes handed out earlier are destroyed with their arena and must
   * not be used afterwards. Fresh nodes built in a caller's context are
   * unaffected.
   */
  void clear();

  /// Bytes currently held by the four category arenas
  [[nodiscard]] size_t arena_bytes() const;

  [[nodiscard]] const PoolLimits & limits() const noexcept { return limits_; }

private:
  template <typename Key>
  struct Category
  {
    mutable std::mutex mutex;
    std::unordered_map<Key, const Node *> entries;
    std::unique_ptr<AstContext> arena = std::make_unique<AstContext>();
  };

  template <typename Key>
  const Node * lookup(
    Category<Key> & category, Key key, size_t max_entries, AstContext & ctx,
    const NodeFactory & factory);

  const Node * create_fresh(AstContext & ctx, const NodeFactory & factory);

  template <typename Key>
  static size_t size_of(const Category<Key> & category);

  template <typename Key>
  static void reset(Category<Key> & category);

  PoolLimits limits_;

  Category<int64_t> ints_;
  Category<bool> bools_;
  Category<std::string_view> texts_;
  Category<std::string_view> identifiers_;

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
};

}  // namespace hecate
