// hecate/ast/node_visitor.hpp - Dispatch target of Node::accept
//
// One overloaded dispatch() per concrete kind, generated from ast_nodes.def.
// Result-typed visitors (Visitor<T>) and Transformer build on this in
// hecate/ast/visitor.hpp.
//
#pragma once

#include "hecate/ast/ast_fwd.hpp"

namespace hecate
{

class NodeVisitor
{
public:
#define AST_NODE(Class, Kind, Snake, Repr) virtual void dispatch(const Class * node) = 0;
#include "hecate/ast/ast_nodes.def"

protected:
  NodeVisitor() = default;
  ~NodeVisitor() = default;
  NodeVisitor(const NodeVisitor &) = default;
  NodeVisitor & operator=(const NodeVisitor &) = default;
  NodeVisitor(NodeVisitor &&) = default;
  NodeVisitor & operator=(NodeVisitor &&) = default;
};

}  // namespace hecate
