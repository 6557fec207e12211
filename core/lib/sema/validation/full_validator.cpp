// hecate/sema/validation/full_validator.cpp
#include "hecate/sema/validation/full_validator.hpp"

namespace hecate
{

std::vector<Diagnostic> FullValidator::validate(const Node & root)
{
  structural_.validate_structure(root);
  return structural_.all_errors();
}

std::map<Severity, std::vector<Diagnostic>> FullValidator::errors_by_severity() const
{
  std::map<Severity, std::vector<Diagnostic>> grouped;
  for (const Diagnostic & d : structural_.all_errors()) {
    grouped[d.severity].push_back(d);
  }
  return grouped;
}

}  // namespace hecate
