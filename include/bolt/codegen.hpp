// Top-level entry point: compiles a root node into host-language source.
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bolt/ast.hpp"
#include "bolt/options.hpp"
#include "bolt/codegen/rules.hpp"

namespace bolt {

struct CodegenResult {
    std::optional<std::string> source; // nullopt when the tree is fully static
    std::optional<std::string> output; // variable bound by the last statement
    std::vector<node_ptr> refs;        // contents of <prefix>_refs, in order
};

class Codegen {
public:
    explicit Codegen(CodegenOptions options = detectOptions());

    // Throws codegen_error. A missing dispatch rule is reported as E2002.
    CodegenResult operator()(const node_ptr& root);

    // Add user rules on top of the built-in ones.
    Codegen& extend(const codegen::CodegenVisitor& rules);
    Codegen& register_argument_parser(std::string parser);

    codegen::CodegenVisitor& visitor(){ return visitor_; }
    const CodegenOptions& options() const { return options_; }

private:
    CodegenOptions options_;
    std::shared_ptr<codegen::RuleContext> context_;
    codegen::CodegenVisitor visitor_;
};

} // namespace bolt
