// hecate/basic/diagnostic_printer.hpp
//
// Prints diagnostics in a Rust-like layout. Source text is owned by the
// source-map component, so locations are rendered as byte spans.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "hecate/basic/diagnostic.hpp"

namespace hecate
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[A0001]: circular reference detected in AST
 *     --> source#0:2..3
 *      |
 *      | ^ [2..3] cycle starts and ends here
 *      | - [4..5] part of cycle (step 2)
 *      |
 *      = help: AST nodes should form a tree structure without cycles
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  /// Print all diagnostics, ordered by primary span start (stable)
  void print_all(const DiagnosticBag & diags);

  /// One line: "2 errors, 1 warning" or "no diagnostics"
  void print_summary(const DiagnosticBag & diags);

  /// Render a span as "source#<id>:<start>..<end>"
  [[nodiscard]] static std::string format_span(Span span);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace hecate
