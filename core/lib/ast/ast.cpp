// hecate/ast/ast.cpp - Concrete node hooks and display fields
#include "hecate/ast/ast.hpp"

#include <fmt/format.h>

#include <string>
#include <type_traits>
#include <unordered_set>

#include "hecate/basic/diagnostic.hpp"

namespace hecate
{

// Every kind uses the representation ast_nodes.def declares for it
#define AST_NODE(Class, Kind, Snake, Repr)                                            \
  static_assert(Class::k_kind == NodeKind::Kind, #Class " has the wrong NodeKind");    \
  static_assert(                                                                      \
    Class::k_representation == Representation::Repr,                                  \
    #Class " must use the " #Repr " representation");                                 \
  static_assert(std::is_trivially_destructible_v<Class>, #Class " must be arena-safe");
#include "hecate/ast/ast_nodes.def"

// ============================================================================
// Display fields
// ============================================================================

DisplayField IntLit::display_field() const { return {"value", std::to_string(value)}; }

DisplayField BoolLit::display_field() const { return {"value", value ? "true" : "false"}; }

DisplayField StringLit::display_field() const { return {"value", std::string(value)}; }

DisplayField Identifier::display_field() const { return {"name", std::string(name)}; }

DisplayField FloatLit::display_field() const { return {"value", fmt::format("{}", value)}; }

DisplayField CharLit::display_field() const { return {"value", value().to_utf8()}; }

DisplayField UnaryExpr::display_field() const { return {"operator", std::string(to_string(op))}; }

DisplayField LetStmt::display_field() const { return {"name", std::string(name)}; }

DisplayField FuncDecl::display_field() const { return {"name", std::string(name)}; }

DisplayField Module::display_field() const { return {"name", std::string(name)}; }

// ============================================================================
// CharLitValue
// ============================================================================

std::string CharLitValue::to_utf8() const
{
  uint32_t cp = codepoint_;
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    cp = 0xFFFD;
  }

  std::string out;
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  return out;
}

// ============================================================================
// Validation hooks
// ============================================================================

namespace
{

bool is_literal_zero(const Expr * e)
{
  if (const auto * i = dyn_cast<IntLit>(e)) {
    return i->value == 0;
  }
  if (const auto * f = dyn_cast<FloatLit>(e)) {
    return f->value == 0.0;
  }
  return false;
}

}  // namespace

void Div::validate(DiagnosticBag & diags) const
{
  if (is_literal_zero(rhs)) {
    diags.report_warning(rhs->span(), "division by literal zero", "divisor is zero")
      .with_code("W0200")
      .with_secondary_label(span(), "in this division");
  }
}

void LetStmt::validate(DiagnosticBag & diags) const
{
  if (name.empty()) {
    diags.report_error(span(), "let binding has an empty name").with_code("E0201");
  }
  if (value == nullptr) {
    diags
      .report_hint(span(), fmt::format("'{}' is declared without an initializer", name))
      .with_code("H0202")
      .with_help("add '= <expr>' to initialize it");
  }
}

void FuncDecl::validate(DiagnosticBag & diags) const
{
  std::unordered_set<std::string_view> seen;
  for (const std::string_view param : params) {
    if (!seen.insert(param).second) {
      diags
        .report_error(
          span(), fmt::format("duplicate parameter '{}' in function '{}'", param, name))
        .with_code("E0203")
        .with_help("parameter names must be unique");
    }
  }
}

}  // namespace hecate
