// hecate/ast/ast_fwd.hpp - Forward declarations of all node classes
#pragma once

namespace hecate
{

class AstContext;
class Node;
class Expr;
class Stmt;
class Decl;

#define AST_NODE(Class, Kind, Snake, Repr) class Class;
#include "hecate/ast/ast_nodes.def"

}  // namespace hecate
