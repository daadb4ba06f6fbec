#include "bolt/codegen/rules.hpp"
#include "bolt/codegen/pyrepr.hpp"
#include "bolt/diagnostics.hpp"

namespace bolt::codegen {

namespace {

struct Module {
    std::string ns;   // empty for native host modules
    std::string path;

    bool namespaced() const { return !ns.empty(); }
    std::string value() const { return namespaced() ? ns + ":" + path : path; }
    // Binding introduced by a plain namespaced import
    std::string stem() const {
        auto slash = path.rfind('/');
        return slash == std::string::npos ? path : path.substr(slash + 1);
    }
};

Module module_of(const node_ptr& command){
    auto location = argument(command, 0);
    if(!location || location->kind != NodeKind::ResourceLocation)
        throw make_error(ErrorKind::MalformedImport, command.get(), "import target is not a resource location");
    Module m{leaf_string(*location, "namespace"), leaf_string(*location, "path")};
    if(m.path.empty())
        throw make_error(ErrorKind::MalformedImport, location.get(), "import target has an empty path");
    return m;
}

std::string imported_name(const node_ptr& n){
    if(!n || n->kind != NodeKind::ImportedIdentifier) return {};
    return leaf_string(*n, "value");
}

// Names of a from-import. The subcommand chain nests one name per link:
// from:module:import:name:subcommand continues, from:module:import:name ends.
std::vector<std::string> imported_names(const node_ptr& command){
    std::vector<std::string> names;
    auto link = argument(command, 1);
    while(link){
        if(link->kind != NodeKind::Command)
            throw make_error(ErrorKind::MalformedImport, link.get(), "from-import expects a name subcommand",
                             "the chain after 'import' must consist of name commands");
        if(auto name = imported_name(argument(link, 0)); !name.empty()) names.push_back(std::move(name));
        if(leaf_string(*link, "identifier") != "from:module:import:name:subcommand") break;
        link = argument(link, 1);
    }
    if(names.empty())
        throw make_error(ErrorKind::MalformedImport, command.get(), "from-import without any name",
                         "name at least one identifier after 'import'");
    return names;
}

CompileResult compile_import(CodegenVisitor&, const node_ptr& n, Accumulator& acc){
    auto module = module_of(n);
    mark_statement(acc, n);
    if(module.namespaced())
        acc.statement(module.stem() + " = " + acc.helper(Helper::ImportModule, {py_str(module.value())}) + ".namespace");
    else
        acc.statement("import " + module.path);
    return Fragments{};
}

CompileResult compile_import_alias(CodegenVisitor&, const node_ptr& n, Accumulator& acc){
    auto module = module_of(n);
    auto alias = imported_name(argument(n, 1));
    if(alias.empty())
        throw make_error(ErrorKind::MalformedImport, n.get(), "import alias is missing");
    mark_statement(acc, n);
    if(module.namespaced())
        acc.statement(alias + " = " + acc.helper(Helper::ImportModule, {py_str(module.value())}) + ".namespace");
    else
        acc.statement("import " + module.path + " as " + alias);
    return Fragments{};
}

CompileResult compile_from_import(CodegenVisitor&, const node_ptr& n, Accumulator& acc){
    auto module = module_of(n);
    auto names = imported_names(n);
    mark_statement(acc, n);
    if(module.namespaced()){
        std::vector<std::string> args{py_str(module.value())};
        std::string targets;
        for(auto& name : names){
            args.push_back(py_str(name));
            targets += name + ", ";
        }
        targets.pop_back(); // "a, b, " -> "a, b,"
        acc.statement(targets + " = " + acc.helper(Helper::FromModuleImport, args));
    } else {
        acc.statement("from " + module.path + " import " + join(names));
    }
    return Fragments{};
}

} // namespace

void register_import_rules(CodegenVisitor& v, const std::shared_ptr<RuleContext>&){
    v.add_rule(NodeKind::Command, {identifier_is("import:module")}, compile_import, "import");
    v.add_rule(NodeKind::Command, {identifier_is("import:module:as:alias")}, compile_import_alias, "import-as");
    v.add_rule(NodeKind::Command, {identifier_is("from:module:import:subcommand")}, compile_from_import, "from-import");
}

} // namespace bolt::codegen
