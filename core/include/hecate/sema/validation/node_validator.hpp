// hecate/sema/validation/node_validator.hpp - Per-node validation hooks
//
// Walks a tree and runs Validatable::validate on every node that opts in.
// Findings are collected, never thrown.
//
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "hecate/ast/node.hpp"
#include "hecate/basic/diagnostic.hpp"

namespace hecate
{

class NodeValidator
{
public:
  NodeValidator() = default;
  virtual ~NodeValidator() = default;

  NodeValidator(const NodeValidator &) = delete;
  NodeValidator & operator=(const NodeValidator &) = delete;

  /**
   * Run hooks on `root` and every descendant (preorder).
   * Diagnostics accumulate across calls until clear().
   * Does not detect cycles; use StructuralValidator for untrusted input.
   */
  virtual void visit(const Node & root);

  [[nodiscard]] const DiagnosticBag & diagnostics() const noexcept { return custom_; }

  /// No Error-severity diagnostics so far
  [[nodiscard]] virtual bool valid() const;

  [[nodiscard]] std::vector<Diagnostic> by_severity(Severity severity) const;

  [[nodiscard]] size_t error_count() const;
  [[nodiscard]] size_t warning_count() const;
  [[nodiscard]] size_t hint_count() const;
  [[nodiscard]] size_t info_count() const;

  /**
   * "Validation passed: no errors found", or
   * "Validation failed: 2 errors, 1 warnings, 0 hints, 0 info"
   */
  [[nodiscard]] std::string summary() const;

  virtual void clear();

protected:
  /// Run the node's own hook into the custom bag
  void run_hook(const Node & node);

  /// Every diagnostic this validator considers (custom + any subclass findings)
  [[nodiscard]] virtual std::vector<Diagnostic> collected() const;

  DiagnosticBag custom_;
};

}  // namespace hecate
