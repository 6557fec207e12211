// hecate/ast/ast_context.hpp - Node arena and string pool
//
// AstContext owns every node of a tree and every string those nodes view.
// Backed by std::pmr::monotonic_buffer_resource: nothing is freed until the
// context itself is destroyed.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <initializer_list>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace hecate
{

class Node;

// ============================================================================
// AstContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Arena that owns nodes and interned strings.
 *
 * Nodes created through a context are valid as long as the context is
 * alive. Nodes are never destroyed individually, so every node type must be
 * trivially destructible: text is stored as std::string_view into the
 * context, sequences as gsl::span into arena arrays.
 *
 * A context is not thread-safe. Each thread building a tree uses its own.
 *
 * Example:
 * @code
 *   AstContext ctx;
 *   auto * f = ctx.create<FloatLit>(1.5, span);
 *   std::string_view name = ctx.intern("main");
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~AstContext() = default;

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Construct a node of type T in the arena.
   *
   * @return Non-owning pointer, valid until the context is destroyed
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<Node, T>, "T must derive from Node");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Node types must be trivially destructible to live in the arena. "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a view that lives as long as the context.
   * Interning the same text twice returns views of the same storage.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = string_pool_.find(s);
    if (it != string_pool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored(ptr, s.size());
    string_pool_.insert(stored);
    return stored;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return string_pool_.find(s) != string_pool_.end();
  }

  [[nodiscard]] size_t string_count() const noexcept { return string_pool_.size(); }

  /// Bytes handed out for nodes, strings and arrays (string-pool bookkeeping excluded)
  [[nodiscard]] size_t bytes_allocated() const noexcept { return bytes_allocated_; }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /**
   * Allocate a value-initialized array (nullptr for pointers, 0 for numbers).
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    static_assert(std::is_trivially_destructible_v<T>);
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy a vector into an arena array
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

  /// Copy an initializer list into an arena array
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(std::initializer_list<T> items)
  {
    auto span = allocate_array<T>(items.size());
    std::copy(items.begin(), items.end(), span.begin());
    return span;
  }

private:
  void * allocate(size_t bytes, size_t alignment)
  {
    bytes_allocated_ += bytes;
    return arena_.allocate(bytes, alignment);
  }

  std::pmr::monotonic_buffer_resource arena_;

  /// Interned strings; keys view arena memory
  std::pmr::unordered_set<std::string_view> string_pool_;

  size_t bytes_allocated_ = 0;
};

}  // namespace hecate
