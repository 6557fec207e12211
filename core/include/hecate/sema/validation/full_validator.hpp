// hecate/sema/validation/full_validator.hpp - One-call validation facade
#pragma once

#include <map>
#include <vector>

#include "hecate/ast/node.hpp"
#include "hecate/basic/diagnostic.hpp"
#include "hecate/sema/validation/structural_validator.hpp"

namespace hecate
{

/**
 * Runs hooks and cycle detection together and hands back one list.
 *
 * @code
 *   FullValidator v;
 *   auto diags = v.validate(*module);
 *   if (!v.valid()) printer.print_all(...);
 * @endcode
 */
class FullValidator
{
public:
  /// Hook and cycle diagnostics of `root` (previous results are discarded)
  std::vector<Diagnostic> validate(const Node & root);

  [[nodiscard]] bool valid() const { return structural_.valid(); }

  [[nodiscard]] std::map<Severity, std::vector<Diagnostic>> errors_by_severity() const;

  [[nodiscard]] const StructuralValidator & structural() const noexcept { return structural_; }

  void clear() { structural_.clear(); }

private:
  StructuralValidator structural_;
};

}  // namespace hecate
