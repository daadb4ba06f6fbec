#include <cassert>
#include <iostream>
#include <string>
#include "codegen_fixture.hpp"

using namespace bolt;

// Compile one command inside a root and return the generated source.
static std::string compile_command(const std::string& command){
    auto result = compile_tree("(root :commands [" + command + "])");
    assert(result.source);
    return *result.source;
}

static void test_native_imports(){
    assert(contains(compile_command("(command :identifier \"import:module\" :arguments [(resource-location :path \"math\")])"),
                    "\n    import math\n"));
    assert(contains(compile_command("(command :identifier \"import:module:as:alias\" :arguments ["
                                    "(resource-location :path \"os.path\") (imported-identifier :value \"p\")])"),
                    "\n    import os.path as p\n"));
    auto from = compile_command(
        "(command :identifier \"from:module:import:subcommand\" :arguments [(resource-location :path \"math\")"
        " (command :identifier \"from:module:import:name:subcommand\" :arguments [(imported-identifier :value \"sin\")"
        "  (command :identifier \"from:module:import:name\" :arguments [(imported-identifier :value \"cos\")])])])");
    assert(contains(from, "\n    from math import sin, cos\n"));
    assert(!contains(from, "_bolt_helper_from_module_import"));
}

static void test_namespaced_imports(){
    auto plain = compile_command("(command :identifier \"import:module\" :arguments [(resource-location :namespace \"demo\" :path \"utils/helpers\")])");
    assert(contains(plain, "_bolt_helper_import_module = _bolt_runtime.helpers['import_module']\n"));
    assert(contains(plain, "\n    helpers = _bolt_helper_import_module('demo:utils/helpers').namespace\n"));

    auto alias = compile_command("(command :identifier \"import:module:as:alias\" :arguments ["
                                 "(resource-location :namespace \"demo\" :path \"utils\") (imported-identifier :value \"u\")])");
    assert(contains(alias, "\n    u = _bolt_helper_import_module('demo:utils').namespace\n"));

    auto from = compile_command(
        "(command :identifier \"from:module:import:subcommand\" :arguments [(resource-location :namespace \"demo\" :path \"lib\")"
        " (command :identifier \"from:module:import:name:subcommand\" :arguments [(imported-identifier :value \"a\")"
        "  (command :identifier \"from:module:import:name\" :arguments [(imported-identifier :value \"b\")])])])");
    assert(contains(from, "_bolt_helper_from_module_import = _bolt_runtime.helpers['from_module_import']\n"));
    assert(contains(from, "\n    a, b, = _bolt_helper_from_module_import('demo:lib', 'a', 'b')\n"));

    auto single = compile_command(
        "(command :identifier \"from:module:import:subcommand\" :arguments [(resource-location :namespace \"demo\" :path \"lib\")"
        " (command :identifier \"from:module:import:name\" :arguments [(imported-identifier :value \"only\")])])");
    assert(contains(single, "\n    only, = _bolt_helper_from_module_import('demo:lib', 'only')\n"));
}

static void test_malformed_imports(){
    // Chain without any name
    assert(compile_error_code(
        "(root :commands [(command :identifier \"from:module:import:subcommand\" :arguments [(resource-location :namespace \"demo\" :path \"lib\")"
        " (command :identifier \"from:module:import:name\" :arguments [])])])") == "E2003");
    // Chain link that is not a command
    assert(compile_error_code(
        "(root :commands [(command :identifier \"from:module:import:subcommand\" :arguments [(resource-location :path \"lib\")"
        " (imported-identifier :value \"a\")])])") == "E2003");
    // Target that is not a resource location
    assert(compile_error_code(
        "(root :commands [(command :identifier \"import:module\" :arguments [(word :value \"lib\")])])") == "E2003");
    // Alias missing
    assert(compile_error_code(
        "(root :commands [(command :identifier \"import:module:as:alias\" :arguments [(resource-location :path \"lib\")])])") == "E2003");
}

void run_import_tests(){
    std::cout << "[codegen] native imports...\n"; test_native_imports();
    std::cout << "[codegen] namespaced imports...\n"; test_namespaced_imports();
    std::cout << "[codegen] malformed imports...\n"; test_malformed_imports();
    std::cout << "Import tests passed\n";
}
