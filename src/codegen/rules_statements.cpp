#include "bolt/codegen/rules.hpp"
#include "bolt/diagnostics.hpp"

namespace bolt::codegen {

namespace {

using Handler = CodegenVisitor::Handler;

// `keyword` or `keyword operand` when the command carries an operand.
Handler control_statement(std::string keyword){
    return [keyword](CodegenVisitor& self, const node_ptr& n, Accumulator& acc) -> CompileResult {
        std::string code = keyword;
        if(auto operand = argument(n, 0)) code += " " + *visit_single(self, operand, acc, true);
        mark_statement(acc, n);
        acc.statement(code);
        return Fragments{};
    };
}

// `keyword <condition>:` followed by the body in a nested block.
Handler conditional_block(std::string keyword){
    return [keyword](CodegenVisitor& self, const node_ptr& n, Accumulator& acc) -> CompileResult {
        auto condition = visit_single(self, argument(n, 0), acc, true);
        mark_statement(acc, n);
        acc.statement(keyword + " " + *condition + ":");
        auto scope = acc.block();
        visit_body(self, argument(n, 1), acc);
        return Fragments{};
    };
}

CompileResult compile_expression_statement(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    if(auto value = visit_single(self, argument(n, 0), acc)){
        mark_statement(acc, n);
        acc.statement(*value);
    }
    return Fragments{};
}

CompileResult compile_function(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    auto signature = argument(n, 0);
    if(!signature || signature->kind != NodeKind::FunctionSignature)
        throw make_error(ErrorKind::ArityViolation, n.get(), "function definition without a signature");

    auto& arguments = children_of(*signature, "arguments");
    std::vector<std::string> parameters;
    for(auto& arg : arguments){
        auto name = leaf_string(*arg, "name");
        parameters.push_back(child(*arg, "default") ? name + "=" + acc.missing() : name);
    }

    mark_statement(acc, n);
    acc.statement("def " + leaf_string(*signature, "name") + "(" + join(parameters) + "):");
    auto scope = acc.block();

    for(auto& arg : arguments){
        auto fallback = child(*arg, "default");
        if(!fallback) continue;
        auto name = leaf_string(*arg, "name");
        acc.statement("if " + name + " is " + acc.missing() + ":");
        auto inner = acc.block();
        acc.statement(name + " = " + *visit_single(self, fallback, acc, true));
    }

    visit_body(self, argument(n, 1), acc);
    return Fragments{};
}

CompileResult compile_else(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    mark_statement(acc, n);
    acc.statement("else:");
    auto scope = acc.block();
    visit_body(self, argument(n, 0), acc);
    return Fragments{};
}

CompileResult compile_for(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    auto target = visit_single(self, argument(n, 0), acc, true);
    auto iterable = visit_single(self, argument(n, 1), acc, true);
    mark_statement(acc, n);
    acc.statement("for " + *target + " in " + *iterable + ":");
    auto scope = acc.block();
    visit_body(self, argument(n, 2), acc);
    return Fragments{};
}

} // namespace

void register_statement_rules(CodegenVisitor& v, const std::shared_ptr<RuleContext>&){
    v.add_rule(NodeKind::Command, {identifier_is("statement")}, compile_expression_statement, "statement");
    v.add_rule(NodeKind::Command, {identifier_is("def:function:body")}, compile_function, "function");

    v.add_rule(NodeKind::Command, {identifier_is("return")}, control_statement("return"), "return");
    v.add_rule(NodeKind::Command, {identifier_is("return:value")}, control_statement("return"), "return");
    v.add_rule(NodeKind::Command, {identifier_is("yield")}, control_statement("yield"), "yield");
    v.add_rule(NodeKind::Command, {identifier_is("yield:value")}, control_statement("yield"), "yield");
    v.add_rule(NodeKind::Command, {identifier_is("yield:from:value")}, control_statement("yield from"), "yield-from");

    v.add_rule(NodeKind::Command, {identifier_is("if:condition:body")}, conditional_block("if"), "if");
    v.add_rule(NodeKind::Command, {identifier_is("elif:condition:body")}, conditional_block("elif"), "elif");
    v.add_rule(NodeKind::Command, {identifier_is("while:condition:body")}, conditional_block("while"), "while");
    v.add_rule(NodeKind::Command, {identifier_is("else:body")}, compile_else, "else");
    v.add_rule(NodeKind::Command, {identifier_is("for:target:in:iterable:body")}, compile_for, "for");

    for(const char* keyword : {"break", "continue", "pass"})
        v.add_rule(NodeKind::Command, {identifier_is(keyword)}, control_statement(keyword), keyword);
}

} // namespace bolt::codegen
