// hecate/basic/diagnostic.cpp - Diagnostic implementation
#include "hecate/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace hecate
{

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

Span Diagnostic::primary_span() const noexcept
{
  const Label * l = primary_label();
  return l == nullptr ? Span{} : l->span;
}

size_t Diagnostic::secondary_label_count() const noexcept
{
  return static_cast<size_t>(std::count_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Secondary;
  }));
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(Span span, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{span, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(Span span, std::string msg)
{
  return with_label(span, std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, Span span, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{span, std::move(label_message), LabelStyle::Primary});
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(
  Span span, std::string message, std::string label_message)
{
  return report(Severity::Error, span, std::move(message), std::move(label_message));
}

DiagnosticBuilder DiagnosticBag::report_warning(
  Span span, std::string message, std::string label_message)
{
  return report(Severity::Warning, span, std::move(message), std::move(label_message));
}

DiagnosticBuilder DiagnosticBag::report_info(
  Span span, std::string message, std::string label_message)
{
  return report(Severity::Info, span, std::move(message), std::move(label_message));
}

DiagnosticBuilder DiagnosticBag::report_hint(
  Span span, std::string message, std::string label_message)
{
  return report(Severity::Hint, span, std::move(message), std::move(label_message));
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::by_severity(Severity severity) const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [severity](const Diagnostic & d) { return d.severity == severity; });
  return result;
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(
    std::count_if(diagnostics_.begin(), diagnostics_.end(), [severity](const Diagnostic & d) {
      return d.severity == severity;
    }));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  diagnostics_.insert(diagnostics_.end(), other.diagnostics_.begin(), other.diagnostics_.end());
}

}  // namespace hecate
