// hecate/sema/validation/structural_validator.hpp - Cycle detection
//
// Traversal, equality and cloning assume a tree. This validator is the one
// walk that tolerates a corrupted graph: it runs the per-node hooks like
// NodeValidator and reports every back edge it meets as a cycle instead of
// following it.
//
#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "hecate/ast/node.hpp"
#include "hecate/basic/diagnostic.hpp"
#include "hecate/sema/validation/node_validator.hpp"

namespace hecate
{

/// Diagnostic code of a detected cycle
inline constexpr const char * k_cycle_diagnostic_code = "E0100";

class StructuralValidator : public NodeValidator
{
public:
  enum class VisitState : uint8_t {
    Unvisited,
    InProgress,
    Done,
  };

  /**
   * Walk from `root`, running hooks and detecting cycles.
   *
   * Resets the previous run. A node is InProgress while its children are
   * walked and Done afterwards; meeting an InProgress child records a cycle
   * and does not descend into it. Done children (shared leaves) are walked
   * again.
   *
   * @return true if no error was found
   */
  bool validate_structure(const Node & root);

  /// Same as validate_structure(), so a cyclic graph is safe through a base reference
  void visit(const Node & root) override;

  [[nodiscard]] const DiagnosticBag & custom_errors() const noexcept { return custom_; }
  [[nodiscard]] const DiagnosticBag & structural_errors() const noexcept { return structural_; }

  /// Hook diagnostics followed by cycle diagnostics
  [[nodiscard]] std::vector<Diagnostic> all_errors() const;

  /**
   * Each detected cycle as a path starting and ending at the repeated node.
   *
   * The path follows, from the repeated node, the first child that is still
   * InProgress. A node on the chain with several InProgress children only
   * contributes one of them, so overlapping cycles can be under-reported.
   */
  [[nodiscard]] const std::vector<NodeList> & cycles() const noexcept { return cycles_; }

  /// State of `node` after the last run (Unvisited if never reached)
  [[nodiscard]] VisitState state_of(const Node & node) const;

  [[nodiscard]] bool valid() const override;
  void clear() override;

protected:
  [[nodiscard]] std::vector<Diagnostic> collected() const override { return all_errors(); }

private:
  void walk(const Node & node);
  void report_cycle(const Node & repeated);
  [[nodiscard]] NodeList reconstruct_cycle(const Node & start) const;

  std::unordered_map<const Node *, VisitState> state_;
  std::vector<NodeList> cycles_;
  DiagnosticBag structural_;
};

}  // namespace hecate
