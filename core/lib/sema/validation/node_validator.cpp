// hecate/sema/validation/node_validator.cpp - Per-node validation hooks
#include "hecate/sema/validation/node_validator.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "hecate/ast/traversal.hpp"

namespace hecate
{

void NodeValidator::visit(const Node & root)
{
  traversal::preorder(root, [this](const Node & node) { run_hook(node); });
}

void NodeValidator::run_hook(const Node & node) { run_validation_hook(node, custom_); }

std::vector<Diagnostic> NodeValidator::collected() const
{
  return std::vector<Diagnostic>(custom_.begin(), custom_.end());
}

bool NodeValidator::valid() const { return error_count() == 0; }

std::vector<Diagnostic> NodeValidator::by_severity(Severity severity) const
{
  std::vector<Diagnostic> out = collected();
  out.erase(
    std::remove_if(
      out.begin(), out.end(), [severity](const Diagnostic & d) { return d.severity != severity; }),
    out.end());
  return out;
}

size_t NodeValidator::error_count() const { return by_severity(Severity::Error).size(); }

size_t NodeValidator::warning_count() const { return by_severity(Severity::Warning).size(); }

size_t NodeValidator::hint_count() const { return by_severity(Severity::Hint).size(); }

size_t NodeValidator::info_count() const { return by_severity(Severity::Info).size(); }

std::string NodeValidator::summary() const
{
  if (valid()) {
    return "Validation passed: no errors found";
  }
  return fmt::format(
    "Validation failed: {} errors, {} warnings, {} hints, {} info", error_count(), warning_count(),
    hint_count(), info_count());
}

void NodeValidator::clear() { custom_.clear(); }

}  // namespace hecate
