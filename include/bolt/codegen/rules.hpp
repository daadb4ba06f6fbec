#pragma once
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "bolt/codegen/visit.hpp"

namespace bolt::codegen {

// State shared by the transpiler rules of one Codegen instance.
struct RuleContext {
    std::unordered_set<std::string> argumentParsers; // parsers with a convert:<parser> helper
};

// Standard brigadier/minecraft parsers known to the runtime.
void register_default_argument_parsers(RuleContext& ctx);

// Grouped registration functions. Each installs a related set of rules.
void register_structure_rules(CodegenVisitor&, const std::shared_ptr<RuleContext>&);
void register_statement_rules(CodegenVisitor&, const std::shared_ptr<RuleContext>&);
void register_import_rules(CodegenVisitor&, const std::shared_ptr<RuleContext>&);
void register_expression_rules(CodegenVisitor&, const std::shared_ptr<RuleContext>&);

// Commands handled by a statement rule are matched on this field.
inline Constraint identifier_is(std::string id){ return Constraint{"identifier", leaf_value{std::move(id)}}; }

// i-th element of a command's `arguments`, null when out of range.
inline node_ptr argument(const node_ptr& command, size_t i){
    auto& args = children_of(*command, "arguments");
    return i < args.size() ? args[i] : nullptr;
}

// Expression fragment carrying n's line marker. The parentheses keep the
// marker's line breaks inside a bracketed continuation.
inline std::string wrap(Accumulator& acc, const node_ptr& n, const std::string& code){
    return "(" + acc.lineno(n) + code + ")";
}

// Emit n's line marker as its own statement (no-op for unknown lines).
inline void mark_statement(Accumulator& acc, const node_ptr& n){
    auto marker = acc.lineno(n);
    if(!marker.empty()) acc.statement(marker);
}

} // namespace bolt::codegen
