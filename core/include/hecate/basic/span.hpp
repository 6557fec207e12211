// hecate/basic/span.hpp - Source span attached to every AST node
//
// A Span is produced by the source-map component (outside this library) and
// consumed here as an opaque, immutable value.
//
#pragma once

#include <algorithm>
#include <cstdint>

namespace hecate
{

// ============================================================================
// SourceId - Identifies the source a span belongs to
// ============================================================================

/**
 * Compact identifier of a source file or buffer.
 *
 * The numbering is owned by the source-map component; this library only
 * compares ids for equality.
 */
class SourceId
{
public:
  /// Invalid/unknown source sentinel
  static constexpr uint32_t k_invalid = UINT32_MAX;

  constexpr SourceId() noexcept = default;
  constexpr explicit SourceId(uint32_t value) noexcept : value_(value) {}

  [[nodiscard]] constexpr uint32_t value() const noexcept { return value_; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ != k_invalid; }

  [[nodiscard]] constexpr bool operator==(SourceId other) const noexcept
  {
    return value_ == other.value_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceId other) const noexcept
  {
    return value_ != other.value_;
  }

private:
  uint32_t value_ = k_invalid;
};

// ============================================================================
// Span - Byte range within one source
// ============================================================================

/**
 * Half-open byte range [start_byte, end_byte) within a single source.
 *
 * Spans are compared by value. A default-constructed span has an invalid
 * source id and zero offsets; it is what builder-made nodes carry.
 */
class Span
{
public:
  constexpr Span() noexcept = default;

  constexpr Span(SourceId source, uint32_t start, uint32_t end) noexcept
  : source_id_(source), start_byte_(start), end_byte_(end)
  {
  }

  /// Convenience for tests and generated code: numeric source id
  constexpr Span(uint32_t source, uint32_t start, uint32_t end) noexcept
  : source_id_(source), start_byte_(start), end_byte_(end)
  {
  }

  [[nodiscard]] constexpr SourceId source_id() const noexcept { return source_id_; }
  [[nodiscard]] constexpr uint32_t start_byte() const noexcept { return start_byte_; }
  [[nodiscard]] constexpr uint32_t end_byte() const noexcept { return end_byte_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return source_id_.is_valid() && start_byte_ <= end_byte_;
  }

  /// Size in bytes (0 for inverted ranges)
  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return end_byte_ >= start_byte_ ? end_byte_ - start_byte_ : 0;
  }

  /// Check if another span lies fully inside this one (same source only)
  [[nodiscard]] constexpr bool contains(Span other) const noexcept
  {
    return source_id_ == other.source_id_ && other.start_byte_ >= start_byte_ &&
           other.end_byte_ <= end_byte_;
  }

  [[nodiscard]] constexpr bool operator==(Span other) const noexcept
  {
    return source_id_ == other.source_id_ && start_byte_ == other.start_byte_ &&
           end_byte_ == other.end_byte_;
  }
  [[nodiscard]] constexpr bool operator!=(Span other) const noexcept { return !(*this == other); }

private:
  SourceId source_id_;
  uint32_t start_byte_ = 0;
  uint32_t end_byte_ = 0;
};

/**
 * Smallest span covering both inputs.
 *
 * The source of the first span wins; callers merge spans of one source.
 */
[[nodiscard]] constexpr Span merge(Span a, Span b) noexcept
{
  return Span(
    a.source_id(), std::min(a.start_byte(), b.start_byte()), std::max(a.end_byte(), b.end_byte()));
}

}  // namespace hecate
