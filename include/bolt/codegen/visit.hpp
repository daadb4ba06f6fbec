// Field-driven rewrite algorithms shared by every transpiler rule.
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "bolt/ast.hpp"
#include "bolt/dispatch.hpp"
#include "bolt/codegen/accumulator.hpp"
#include "bolt/codegen/collect.hpp"

namespace bolt::codegen {

// Host-language expression pieces produced by one rule.
using Fragments = std::vector<std::string>;

// nullopt: the subtree is unchanged and the original object must be reused.
using CompileResult = std::optional<Fragments>;

using CodegenVisitor = Visitor<CompileResult, Accumulator&>;

// Compile one child. Unchanged gives nullopt, or the child's reference when
// required. A missing required child, or a result that is not exactly one
// fragment, is an arity violation.
std::optional<std::string> visit_single(CodegenVisitor& v, const node_ptr& n, Accumulator& acc, bool required = false);

// Compile a child sequence with the splicing algorithm. nullopt when no child
// changed; otherwise the collector's flushed expression.
std::optional<std::string> visit_multiple(CodegenVisitor& v, const std::vector<node_ptr>& children, Accumulator& acc,
                                          CollectorKind kind = CollectorKind::Generic);

// Compile every node-valued field of n. nullopt when none changed; otherwise a
// replace() call overriding the changed fields.
std::optional<std::string> visit_generic(CodegenVisitor& v, const node_ptr& n, Accumulator& acc,
                                         CollectorKind kind = CollectorKind::Generic);

// Emit the commands of a body node (its `commands` field) into the ambient
// runtime buffer.
void visit_body(CodegenVisitor& v, const node_ptr& body, Accumulator& acc, CollectorKind kind = CollectorKind::Command);

} // namespace bolt::codegen
