// hecate/ast/node_pool.cpp - NodePool implementation
#include "hecate/ast/node_pool.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace hecate
{

namespace
{

// Per-entry cost: the leaf itself plus one hash-map node
constexpr size_t k_leaf_bytes = 48;
constexpr size_t k_map_entry_bytes = 4 * sizeof(void *);
constexpr size_t k_entry_bytes = k_leaf_bytes + k_map_entry_bytes;

}  // namespace

std::string_view to_string(PoolCategory category) noexcept
{
  switch (category) {
    case PoolCategory::Integer:
      return "integer";
    case PoolCategory::Boolean:
      return "boolean";
    case PoolCategory::Text:
      return "text";
    case PoolCategory::Identifier:
      return "identifier";
  }
  return "";
}

NodePool::NodePool(PoolLimits limits) : limits_(limits) {}

NodePool::~NodePool() = default;

const Node * NodePool::get_or_create(
  PoolCategory category, const PoolValue & value, AstContext & ctx, const NodeFactory & factory)
{
  switch (category) {
    case PoolCategory::Integer:
      if (const auto * v = std::get_if<int64_t>(&value)) {
        return get_int(*v, ctx, factory);
      }
      break;
    case PoolCategory::Boolean:
      if (const auto * v = std::get_if<bool>(&value)) {
        return get_bool(*v, ctx, factory);
      }
      break;
    case PoolCategory::Text:
      if (const auto * v = std::get_if<std::string_view>(&value)) {
        return get_text(*v, ctx, factory);
      }
      break;
    case PoolCategory::Identifier:
      if (const auto * v = std::get_if<std::string_view>(&value)) {
        return get_identifier(*v, ctx, factory);
      }
      break;
  }
  throw std::invalid_argument(
    "value type does not match pool category '" + std::string(to_string(category)) + "'");
}

const Node * NodePool::get_int(int64_t value, AstContext & ctx, const NodeFactory & factory)
{
  if (value < limits_.int_min || value > limits_.int_max) {
    return create_fresh(ctx, factory);
  }
  return lookup(ints_, value, std::numeric_limits<size_t>::max(), ctx, factory);
}

const Node * NodePool::get_bool(bool value, AstContext & ctx, const NodeFactory & factory)
{
  return lookup(bools_, value, std::numeric_limits<size_t>::max(), ctx, factory);
}

const Node * NodePool::get_text(
  std::string_view value, AstContext & ctx, const NodeFactory & factory)
{
  if (value.size() > limits_.text_max_length) {
    return create_fresh(ctx, factory);
  }
  return lookup(texts_, value, limits_.text_max_entries, ctx, factory);
}

const Node * NodePool::get_identifier(
  std::string_view value, AstContext & ctx, const NodeFactory & factory)
{
  if (value.size() > limits_.identifier_max_length) {
    return create_fresh(ctx, factory);
  }
  return lookup(identifiers_, value, limits_.identifier_max_entries, ctx, factory);
}

template <typename Key>
const Node * NodePool::lookup(
  Category<Key> & category, Key key, size_t max_entries, AstContext & ctx,
  const NodeFactory & factory)
{
  const std::lock_guard<std::mutex> lock(category.mutex);

  if (auto it = category.entries.find(key); it != category.entries.end()) {
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second;
  }

  if (category.entries.size() >= max_entries) {
    return create_fresh(ctx, factory);
  }

  const Node * node = factory(*category.arena);
  if (node == nullptr) {
    throw std::logic_error("node pool factory returned null");
  }

  Key stored = key;
  if constexpr (std::is_same_v<Key, std::string_view>) {
    stored = category.arena->intern(key);
  }
  category.entries.emplace(stored, node);
  misses_.fetch_add(1, std::memory_order_relaxed);
  return node;
}

const Node * NodePool::create_fresh(AstContext & ctx, const NodeFactory & factory)
{
  const Node * node = factory(ctx);
  if (node == nullptr) {
    throw std::logic_error("node pool factory returned null");
  }
  misses_.fetch_add(1, std::memory_order_relaxed);
  return node;
}

template <typename Key>
size_t NodePool::size_of(const Category<Key> & category)
{
  const std::lock_guard<std::mutex> lock(category.mutex);
  return category.entries.size();
}

PoolStats NodePool::stats() const
{
  PoolStats s;
  s.hits = hits_.load(std::memory_order_relaxed);
  s.misses = misses_.load(std::memory_order_relaxed);
  const uint64_t total = s.hits + s.misses;
  if (total > 0) {
    const double percent = static_cast<double>(s.hits) * 100.0 / static_cast<double>(total);
    s.hit_rate = std::round(percent * 100.0) / 100.0;
  }
  s.int_pool_size = size_of(ints_);
  s.bool_pool_size = size_of(bools_);
  s.text_pool_size = size_of(texts_);
  s.identifier_pool_size = size_of(identifiers_);
  return s;
}

PoolMemoryEstimate NodePool::memory_estimate() const
{
  const auto text_bytes = [](const Category<std::string_view> & category) {
    const std::lock_guard<std::mutex> lock(category.mutex);
    size_t bytes = category.entries.size() * k_entry_bytes;
    for (const auto & [key, node] : category.entries) {
      bytes += key.size();
    }
    return bytes;
  };

  PoolMemoryEstimate m;
  m.int_pool_bytes = size_of(ints_) * k_entry_bytes;
  m.bool_pool_bytes = size_of(bools_) * k_entry_bytes;
  m.text_pool_bytes = text_bytes(texts_);
  m.identifier_pool_bytes = text_bytes(identifiers_);
  m.total_bytes = m.int_pool_bytes + m.bool_pool_bytes + m.text_pool_bytes + m.identifier_pool_bytes;
  return m;
}

template <typename Key>
void NodePool::reset(Category<Key> & category)
{
  const std::lock_guard<std::mutex> lock(category.mutex);
  // Text keys view the arena, so the map goes first
  category.entries.clear();
  category.arena = std::make_unique<AstContext>();
}

void NodePool::clear()
{
  reset(ints_);
  reset(bools_);
  reset(texts_);
  reset(identifiers_);
  hits_.store(0, std::memory_order_relaxed);
  misses_.store(0, std::memory_order_relaxed);
}

size_t NodePool::arena_bytes() const
{
  const auto bytes = [](const auto & category) {
    const std::lock_guard<std::mutex> lock(category.mutex);
    return category.arena->bytes_allocated();
  };
  return bytes(ints_) + bytes(bools_) + bytes(texts_) + bytes(identifiers_);
}

}  // namespace hecate
