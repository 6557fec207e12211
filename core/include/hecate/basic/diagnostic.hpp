// hecate/basic/diagnostic.hpp - Diagnostic types produced by validation
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hecate/basic/span.hpp"

namespace hecate
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 *
 * By convention only Error fails a build; the rest are advisory.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

[[nodiscard]] constexpr std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "";
}

enum class LabelStyle : uint8_t {
  Primary,    // the location the diagnostic is about
  Secondary,  // related locations
};

struct Label
{
  Span span;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g., "A0001"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;
  std::vector<std::string> notes;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] Span primary_span() const noexcept;
  [[nodiscard]] size_t secondary_label_count() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that commits its diagnostic to the owning bag when it goes
 * out of scope (RAII).
 *
 * @code
 *   bag.report_error(node.span(), "division by zero", "divisor is 0")
 *     .with_code("A0002")
 *     .with_help("guard the division");
 * @endcode
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(Span span, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(Span span, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

  DiagnosticBuilder & with_note(std::string note);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report(
    Severity severity, Span span, std::string message, std::string label_message = "");
  DiagnosticBuilder report_error(Span span, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    Span span, std::string message, std::string label_message = "");
  DiagnosticBuilder report_info(Span span, std::string message, std::string label_message = "");
  DiagnosticBuilder report_hint(Span span, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> by_severity(Severity severity) const;
  [[nodiscard]] std::vector<Diagnostic> errors() const { return by_severity(Severity::Error); }
  [[nodiscard]] std::vector<Diagnostic> warnings() const
  {
    return by_severity(Severity::Warning);
  }
  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) > 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) > 0; }

  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);
  void clear() noexcept { diagnostics_.clear(); }

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace hecate
