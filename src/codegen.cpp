#include "bolt/codegen.hpp"
#include "bolt/diagnostics.hpp"
#include <cstdio>

namespace bolt {

using namespace codegen;

Codegen::Codegen(CodegenOptions options)
    : options_(std::move(options)), context_(std::make_shared<RuleContext>()), visitor_(Fallback::None) {
    register_default_argument_parsers(*context_);
    register_structure_rules(visitor_, context_);
    register_statement_rules(visitor_, context_);
    register_import_rules(visitor_, context_);
    register_expression_rules(visitor_, context_);
    visitor_.set_trace(options_.traceDispatch);
}

Codegen& Codegen::extend(const CodegenVisitor& rules){
    visitor_.extend(rules);
    return *this;
}

Codegen& Codegen::register_argument_parser(std::string parser){
    context_->argumentParsers.insert(std::move(parser));
    return *this;
}

CodegenResult Codegen::operator()(const node_ptr& root){
    Accumulator acc(options_);
    CompileResult result;
    try {
        result = visitor_.invoke(root, acc);
    } catch(const missing_rule_error& e){
        throw codegen_error(ErrorKind::MissingRule, std::string(error_code(ErrorKind::MissingRule)) + ": " + e.what(),
                            "register a rule or a fallback for this kind");
    }

    CodegenResult out;
    if(!result){
        if(options_.traceCodegen) std::fprintf(stderr, "[dbg][codegen] tree is static, %zu refs\n", acc.refs().size());
        out.refs = acc.release_refs();
        return out;
    }
    if(result->size() != 1)
        throw make_error(ErrorKind::ArityViolation, root.get(),
                         "root compiled to " + std::to_string(result->size()) + " fragments, expected one");

    auto output = acc.make_variable();
    acc.statement(output + " = " + result->front());
    out.source = acc.get_source();
    out.output = output;
    out.refs = acc.release_refs();
    if(options_.traceCodegen)
        std::fprintf(stderr, "[dbg][codegen] bound %s, %zu refs\n", output.c_str(), out.refs.size());
    return out;
}

} // namespace bolt
