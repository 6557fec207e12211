// hecate/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "hecate/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace hecate
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

std::string DiagnosticPrinter::format_span(Span span)
{
  if (!span.source_id().is_valid()) {
    return fmt::format("<unknown>:{}..{}", span.start_byte(), span.end_byte());
  }
  return fmt::format(
    "source#{}:{}..{}", span.source_id().value(), span.start_byte(), span.end_byte());
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  print_severity_header(diag);

  fmt::print(os_, "{} {}\n", gutter_arrow(), format_span(diag.primary_span()));
  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label(label);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }
  for (const auto & note : diag.notes) {
    print_note(note);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_span().start_byte() < b.primary_span().start_byte();
    });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  if (diags.empty()) {
    fmt::print(os_, "no diagnostics\n");
    return;
  }

  std::vector<std::string> parts;
  for (const Severity s : {Severity::Error, Severity::Warning, Severity::Info, Severity::Hint}) {
    const size_t n = diags.count(s);
    if (n == 0) continue;
    const std::string_view name = to_string(s);
    // "info" has no plural in this output
    if (n == 1 || s == Severity::Info) {
      parts.push_back(fmt::format("{} {}", n, name));
    } else {
      parts.push_back(fmt::format("{} {}s", n, name));
    }
  }

  std::string line;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) line += ", ";
    line += parts[i];
  }
  fmt::print(os_, "{}\n", line);
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view severity_str = to_string(diag.severity);

  if (!use_color_) {
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", severity_str, diag.message);
    }
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
    case Severity::Hint:
      os_ << rang::fg::green;
      break;
  }
  os_ << severity_str;
  if (!diag.code.empty()) {
    os_ << "[" << diag.code << "]";
  }
  os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label(const Label & label)
{
  const char marker = (label.style == LabelStyle::Primary) ? '^' : '-';
  const std::string body =
    fmt::format("{} [{}..{}]", marker, label.span.start_byte(), label.span.end_byte());

  fmt::print(os_, "{} ", gutter_pipe());
  if (use_color_) {
    if (label.style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
    fmt::print(os_, "{}", body);
    if (!label.message.empty()) {
      fmt::print(os_, " {}", label.message);
    }
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", body);
    if (!label.message.empty()) {
      fmt::print(os_, " {}", label.message);
    }
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace hecate
