// hecate/sema/validation/structural_validator.cpp - Cycle detection
#include "hecate/sema/validation/structural_validator.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace hecate
{

bool StructuralValidator::validate_structure(const Node & root)
{
  clear();
  walk(root);
  return valid();
}

void StructuralValidator::visit(const Node & root) { validate_structure(root); }

void StructuralValidator::walk(const Node & node)
{
  state_[&node] = VisitState::InProgress;
  run_hook(node);

  for (const Node * child : node.children()) {
    if (state_of(*child) == VisitState::InProgress) {
      report_cycle(*child);
      continue;
    }
    walk(*child);
  }

  state_[&node] = VisitState::Done;
}

StructuralValidator::VisitState StructuralValidator::state_of(const Node & node) const
{
  const auto it = state_.find(&node);
  return it == state_.end() ? VisitState::Unvisited : it->second;
}

NodeList StructuralValidator::reconstruct_cycle(const Node & start) const
{
  NodeList path{&start};
  const Node * current = &start;

  while (true) {
    const Node * next = nullptr;
    for (const Node * child : current->children()) {
      if (state_of(*child) == VisitState::InProgress) {
        next = child;
        break;
      }
    }
    if (next == nullptr) {
      break;
    }
    path.push_back(next);
    if (next == &start) {
      break;
    }
    // A loop that does not pass through start; stop at the repeat
    if (std::find(path.begin(), path.end() - 1, next) != path.end() - 1) {
      break;
    }
    current = next;
  }
  return path;
}

void StructuralValidator::report_cycle(const Node & repeated)
{
  NodeList path = reconstruct_cycle(repeated);

  DiagnosticBuilder builder = structural_.report_error(
    repeated.span(), "circular reference detected in AST", "cycle starts and ends here");
  builder.with_code(k_cycle_diagnostic_code)
    .with_help("AST nodes should form a tree structure without cycles");

  // Step 1 is the repeated node itself; the closing repeat is not labelled
  for (size_t i = 1; i < path.size(); ++i) {
    if (path[i] == &repeated) {
      continue;
    }
    builder.with_secondary_label(path[i]->span(), fmt::format("part of cycle (step {})", i + 1));
  }

  cycles_.push_back(std::move(path));
}

std::vector<Diagnostic> StructuralValidator::all_errors() const
{
  std::vector<Diagnostic> out(custom_.begin(), custom_.end());
  out.insert(out.end(), structural_.begin(), structural_.end());
  return out;
}

bool StructuralValidator::valid() const
{
  return !custom_.has_errors() && !structural_.has_errors();
}

void StructuralValidator::clear()
{
  NodeValidator::clear();
  state_.clear();
  cycles_.clear();
  structural_.clear();
}

}  // namespace hecate
