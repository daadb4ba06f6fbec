#include "bolt/codegen/rules.hpp"
#include "bolt/codegen/pyrepr.hpp"
#include "bolt/diagnostics.hpp"
#include <algorithm>

namespace bolt::codegen {

namespace {

// Operator tokens use '_' between keywords ("not_in", "is_not").
std::string operator_text(const node& n){
    auto op = leaf_string(n, "operator");
    std::replace(op.begin(), op.end(), '_', ' ');
    return op;
}

std::string required(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    return *visit_single(self, n, acc, true);
}

std::vector<std::string> required_each(CodegenVisitor& self, const std::vector<node_ptr>& xs, Accumulator& acc){
    std::vector<std::string> out;
    out.reserve(xs.size());
    for(auto& x : xs) out.push_back(required(self, x, acc));
    return out;
}

CompileResult compile_interpolation(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    auto value = required(self, child(*n, "value"), acc);
    auto result = acc.helper(Helper::Interpolate, {value, acc.make_ref(n)}, leaf_string(*n, "converter"));
    return Fragments{wrap(acc, n, result)};
}

CompileResult compile_binary(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    auto left = required(self, child(*n, "left"), acc);
    auto right = required(self, child(*n, "right"), acc);
    return Fragments{wrap(acc, n, left + " " + operator_text(*n) + " " + right)};
}

CompileResult compile_unary(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    auto value = required(self, child(*n, "value"), acc);
    return Fragments{wrap(acc, n, operator_text(*n) + " " + value)};
}

CompileResult compile_value(CodegenVisitor&, const node_ptr& n, Accumulator&){
    auto* v = leaf(*n, "value");
    return Fragments{v ? py_repr(*v) : std::string("None")};
}

CompileResult compile_identifier(CodegenVisitor&, const node_ptr& n, Accumulator& acc){
    return Fragments{wrap(acc, n, leaf_string(*n, "value"))};
}

CompileResult compile_target_identifier(CodegenVisitor&, const node_ptr& n, Accumulator&){
    return Fragments{leaf_string(*n, "value")};
}

CompileResult compile_format_string(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    auto values = required_each(self, children_of(*n, "values"), acc);
    return Fragments{wrap(acc, n, py_str(leaf_string(*n, "fmt")) + ".format(" + join(values) + ")")};
}

CompileResult compile_tuple(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    std::string items;
    for(auto& item : required_each(self, children_of(*n, "items"), acc)) items += item + ",";
    return Fragments{wrap(acc, n, "(" + items + ")")};
}

CompileResult compile_list(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    auto items = required_each(self, children_of(*n, "items"), acc);
    return Fragments{wrap(acc, n, "[" + join(items) + "]")};
}

CompileResult compile_dict(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    std::vector<std::string> items;
    for(auto& item : children_of(*n, "items")){
        auto key = required(self, child(*item, "key"), acc);
        auto value = required(self, child(*item, "value"), acc);
        items.push_back(key + ": " + value);
    }
    return Fragments{wrap(acc, n, "{" + join(items) + "}")};
}

CompileResult compile_attribute(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    auto value = required(self, child(*n, "value"), acc);
    auto result = acc.helper(Helper::GetAttribute, {value, py_str(leaf_string(*n, "name"))});
    return Fragments{wrap(acc, n, result)};
}

// Lookup and call compile the base before the arguments, in source order.
CompileResult compile_lookup(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    auto value = required(self, child(*n, "value"), acc);
    auto arguments = required_each(self, children_of(*n, "arguments"), acc);
    return Fragments{wrap(acc, n, value + "[" + join(arguments) + "]")};
}

CompileResult compile_call(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    auto value = required(self, child(*n, "value"), acc);
    auto arguments = required_each(self, children_of(*n, "arguments"), acc);
    return Fragments{wrap(acc, n, value + "(" + join(arguments) + ")")};
}

CompileResult compile_assignment(CodegenVisitor& self, const node_ptr& n, Accumulator& acc){
    auto target = required(self, child(*n, "target"), acc);
    auto value = required(self, child(*n, "value"), acc);
    return Fragments{target + " " + leaf_string(*n, "operator") + " " + value};
}

} // namespace

void register_expression_rules(CodegenVisitor& v, const std::shared_ptr<RuleContext>& ctx){
    v.add_rule(NodeKind::Interpolation, compile_interpolation, "interpolation");

    // The parser set is read at compile time so parsers registered after
    // construction are honoured.
    v.add_rule(NodeKind::ArgumentInterpolation, [ctx](CodegenVisitor& self, const node_ptr& n, Accumulator& acc) -> CompileResult {
        auto parser = leaf_string(*n, "parser");
        if(!ctx->argumentParsers.count(parser))
            throw make_error(ErrorKind::UnknownArgumentType, n.get(), "no conversion registered for argument type '" + parser + "'",
                             "register the parser with Codegen::register_argument_parser");
        auto value = required(self, child(*n, "value"), acc);
        auto ref = acc.make_ref(n);
        auto converted = acc.helper(Helper::Convert, {value, ref}, parser);
        return Fragments{wrap(acc, n, acc.helper(Helper::SetLocation, {converted, ref}))};
    }, "argument-interpolation");

    v.add_rule(NodeKind::ExpressionBinary, compile_binary, "binary");
    v.add_rule(NodeKind::ExpressionUnary, compile_unary, "unary");
    v.add_rule(NodeKind::Value, compile_value, "value");
    v.add_rule(NodeKind::Identifier, compile_identifier, "identifier");
    v.add_rule(NodeKind::AssignmentTargetIdentifier, compile_target_identifier, "target-identifier");
    v.add_rule(NodeKind::FormatString, compile_format_string, "format-string");
    v.add_rule(NodeKind::Tuple, compile_tuple, "tuple");
    v.add_rule(NodeKind::List, compile_list, "list");
    v.add_rule(NodeKind::Dict, compile_dict, "dict");
    v.add_rule(NodeKind::Attribute, compile_attribute, "attribute");
    v.add_rule(NodeKind::Lookup, compile_lookup, "lookup");
    v.add_rule(NodeKind::Call, compile_call, "call");
    v.add_rule(NodeKind::Assignment, compile_assignment, "assignment");
}

} // namespace bolt::codegen
